#pragma once

// ============================================================================
// RasterBuffer - A rasterized page at a specific resolution
// ============================================================================
// The pixels live in a QImage that owns its memory (never wraps a buffer
// from the rendering library). Copies of a RasterBuffer share the pixels
// through Qt's implicit sharing, so handing one out is cheap and consumers
// only ever see a read-only view: any write would detach.
// ============================================================================

#include "Block.h"

#include <QImage>
#include <QtGlobal>

/**
 * @brief Immutable rasterized page (or composed export image).
 */
struct RasterBuffer {
    int pageIndex = -1;     ///< Source page, or first member's page for composites
    qreal dpi = 0;          ///< Resolution the pixels were produced at
    QImage image;           ///< Self-owned pixels

    bool isValid() const { return pageIndex >= 0 && dpi > 0 && !image.isNull(); }
    int width() const { return image.width(); }
    int height() const { return image.height(); }

    /**
     * @brief Check whether this buffer was rendered for the given key.
     *
     * qFuzzyCompare is unreliable around 0, so zero DPI only matches zero.
     */
    bool matches(int page, qreal targetDpi) const {
        if (pageIndex != page) return false;
        if (dpi == 0 || targetDpi == 0) return dpi == targetDpi;
        return qFuzzyCompare(dpi, targetDpi);
    }
};

/**
 * @brief Outcome of a cache lookup/rasterization.
 */
struct RasterResult {
    BlockError error = BlockError::None;
    QString errorMessage;
    RasterBuffer buffer;

    bool success() const { return error == BlockError::None && buffer.isValid(); }
};
