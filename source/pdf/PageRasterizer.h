#pragma once

// ============================================================================
// PageRasterizer - Turns (page, dpi) into pixels
// ============================================================================
// The one slow operation in the selection subsystem. PageRasterCache calls
// rasterize() from worker threads, so implementations MUST be thread-safe.
// ============================================================================

#include <QImage>
#include <QString>

class PageRasterizer {
public:
    virtual ~PageRasterizer() = default;

    /**
     * @brief Rasterize one page.
     * @param pageIndex 0-based page index.
     * @param dpi Target resolution.
     * @param errorMessage If non-null, receives the failure cause.
     * @return Image owning its own pixels, or null QImage on failure.
     */
    virtual QImage rasterize(int pageIndex, qreal dpi, QString* errorMessage = nullptr) const = 0;
};
