#pragma once

// ============================================================================
// PdfProvider - Abstract interface for PDF document access
// ============================================================================
// BlockCrop only needs what the selection subsystem consumes from the
// document: page count, page bounds and page rasterization. The interface
// keeps backend types out of everything but the two providers.
//
// A provider instance is NOT thread-safe. Worker threads open their own
// provider for the same file (see PdfPageRasterizer).
// ============================================================================

#include <QString>
#include <QSizeF>
#include <QImage>
#include <memory>

/**
 * @brief Abstract interface for PDF document operations.
 *
 * Implemented by PopplerPdfProvider (desktop) and MuPdfProvider (Android,
 * musl, or builds with BLOCKCROP_USE_MUPDF).
 */
class PdfProvider {
public:
    virtual ~PdfProvider() = default;

    // ===== Document Info =====

    /**
     * @brief Check if the PDF was loaded successfully.
     * @return True if a valid PDF is loaded.
     */
    virtual bool isValid() const = 0;

    /**
     * @brief Check if the PDF is password-protected and locked.
     */
    virtual bool isLocked() const = 0;

    /**
     * @brief Get the total number of pages.
     * @return Page count, or 0 if invalid.
     */
    virtual int pageCount() const = 0;

    /**
     * @brief Get the PDF title from metadata.
     * @return Title string, or empty if not available.
     */
    virtual QString title() const = 0;

    virtual QString filePath() const = 0;

    // ===== Page Info =====

    /**
     * @brief Get the size of a page in points (1/72 inch).
     * @param pageIndex 0-based page index.
     * @return Page size in points, or empty QSizeF if invalid.
     */
    virtual QSizeF pageSize(int pageIndex) const = 0;

    // ===== Rendering =====

    /**
     * @brief Render a page to a QImage.
     * @param pageIndex 0-based page index.
     * @param dpi Resolution in dots per inch.
     * @param errorMessage If non-null, receives the failure cause.
     * @return Rendered image owning its pixels, or null QImage on error.
     */
    virtual QImage renderPageToImage(int pageIndex, qreal dpi,
                                     QString* errorMessage = nullptr) const = 0;

    // ===== Factory =====

    /**
     * @brief Create a PdfProvider for the given file.
     * @param pdfPath Path to the PDF file.
     * @return Provider instance, or nullptr on failure.
     */
    static std::unique_ptr<PdfProvider> create(const QString& pdfPath);

    /**
     * @brief Name of the backend this build renders with ("Poppler" or "MuPDF").
     */
    static QString backendName();
};
