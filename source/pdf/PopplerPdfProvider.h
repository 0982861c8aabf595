#pragma once

// ============================================================================
// PopplerPdfProvider - Poppler-Qt6 implementation of PdfProvider
// ============================================================================
// Desktop backend (Windows, macOS, Linux with glibc). Poppler already hands
// out QImages that own their pixels, so no copy is needed after rendering.
// ============================================================================

#include "PdfProvider.h"
#include <poppler/qt6/poppler-qt6.h>
#include <memory>

class PopplerPdfProvider : public PdfProvider {
public:
    /**
     * @brief Construct a provider for the given PDF file.
     * @param pdfPath Path to the PDF file.
     *
     * Check isValid() after construction to verify the PDF loaded successfully.
     */
    explicit PopplerPdfProvider(const QString& pdfPath);

    ~PopplerPdfProvider() override = default;

    // ===== Document Info =====
    bool isValid() const override;
    bool isLocked() const override;
    int pageCount() const override;
    QString title() const override;
    QString filePath() const override;

    // ===== Page Info =====
    QSizeF pageSize(int pageIndex) const override;

    // ===== Rendering =====
    QImage renderPageToImage(int pageIndex, qreal dpi,
                             QString* errorMessage = nullptr) const override;

private:
    /**
     * @brief Get a Poppler page object.
     * @return Page, or nullptr if the index is out of range.
     */
    std::unique_ptr<Poppler::Page> getPage(int pageIndex) const;

    std::unique_ptr<Poppler::Document> m_document;  ///< The loaded PDF document
    QString m_path;                                 ///< Path to the PDF file
};
