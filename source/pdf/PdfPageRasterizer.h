#pragma once

// ============================================================================
// PdfPageRasterizer - Thread-safe PageRasterizer backed by PdfProvider
// ============================================================================
// Neither a MuPDF context nor a Poppler document may be shared between
// threads, so every call opens a thread-local PdfProvider for the file,
// renders, and drops it again.
// ============================================================================

#include "PageRasterizer.h"

class PdfPageRasterizer : public PageRasterizer {
public:
    explicit PdfPageRasterizer(const QString& pdfPath);

    QImage rasterize(int pageIndex, qreal dpi, QString* errorMessage = nullptr) const override;

    QString pdfPath() const { return m_pdfPath; }

private:
    const QString m_pdfPath;
};
