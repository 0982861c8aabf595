// ============================================================================
// MuPdfProvider - MuPDF implementation of PdfProvider
// ============================================================================

#include "MuPdfProvider.h"

#include <mupdf/fitz.h>

#include <QDebug>
#include <cstring>

// ============================================================================
// Construction / Destruction
// ============================================================================

MuPdfProvider::MuPdfProvider(const QString& pdfPath)
    : m_path(pdfPath)
{
    // Create MuPDF context
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "MuPdfProvider: Failed to create MuPDF context";
        return;
    }

    // Register document handlers (PDF, XPS, etc.)
    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfProvider: Failed to register document handlers";
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
        return;
    }

    // Open the document
    QByteArray pathUtf8 = pdfPath.toUtf8();
    fz_try(m_ctx) {
        m_doc = fz_open_document(m_ctx, pathUtf8.constData());
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfProvider: Failed to open" << pdfPath
                   << "-" << fz_caught_message(m_ctx);
        return;
    }

    // Cache page count
    fz_try(m_ctx) {
        m_pageCount = fz_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfProvider: Failed to get page count";
        m_pageCount = 0;
    }
}

MuPdfProvider::~MuPdfProvider()
{
    if (m_doc) {
        fz_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
    }
    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

// ============================================================================
// Document Info
// ============================================================================

bool MuPdfProvider::isValid() const
{
    return m_ctx != nullptr && m_doc != nullptr && m_pageCount > 0;
}

bool MuPdfProvider::isLocked() const
{
    if (!m_doc) return false;
    return fz_needs_password(m_ctx, m_doc) != 0;
}

int MuPdfProvider::pageCount() const
{
    return m_pageCount;
}

QString MuPdfProvider::title() const
{
    return getMetadata("info:Title");
}

QString MuPdfProvider::filePath() const
{
    return m_path;
}

QString MuPdfProvider::getMetadata(const char* key) const
{
    if (!isValid()) return QString();

    char buf[256] = {0};
    fz_try(m_ctx) {
        fz_lookup_metadata(m_ctx, m_doc, key, buf, sizeof(buf));
    }
    fz_catch(m_ctx) {
        return QString();
    }

    return QString::fromUtf8(buf);
}

// ============================================================================
// Page Info
// ============================================================================

QSizeF MuPdfProvider::pageSize(int pageIndex) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return QSizeF();
    }

    fz_rect bounds = fz_empty_rect;
    fz_try(m_ctx) {
        fz_page* page = fz_load_page(m_ctx, m_doc, pageIndex);
        bounds = fz_bound_page(m_ctx, page);
        fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        return QSizeF();
    }

    return QSizeF(bounds.x1 - bounds.x0, bounds.y1 - bounds.y0);
}

// ============================================================================
// Rendering
// ============================================================================

QImage MuPdfProvider::renderPageToImage(int pageIndex, qreal dpi, QString* errorMessage) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount || dpi <= 0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("page %1 not available (dpi %2)").arg(pageIndex).arg(dpi);
        }
        return QImage();
    }

    // Scale factor: PDF points are 72 dpi
    float scale = static_cast<float>(dpi / 72.0);

    fz_page* page = nullptr;
    fz_pixmap* pix = nullptr;
    fz_device* dev = nullptr;
    QImage result;

    fz_var(page);
    fz_var(pix);
    fz_var(dev);

    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);

        fz_matrix ctm = fz_scale(scale, scale);
        fz_rect bounds = fz_bound_page(m_ctx, page);
        fz_irect bbox = fz_round_rect(fz_transform_rect(bounds, ctm));

        // BGRA for Qt compatibility, white background
        pix = fz_new_pixmap_with_bbox(m_ctx, fz_device_bgr(m_ctx), bbox, nullptr, 1);
        fz_clear_pixmap_with_value(m_ctx, pix, 255);

        dev = fz_new_draw_device(m_ctx, ctm, pix);
        fz_run_page(m_ctx, page, dev, fz_identity, nullptr);
        fz_close_device(m_ctx, dev);

        int width = fz_pixmap_width(m_ctx, pix);
        int height = fz_pixmap_height(m_ctx, pix);
        int stride = fz_pixmap_stride(m_ctx, pix);
        unsigned char* samples = fz_pixmap_samples(m_ctx, pix);

        // Deep copy: the MuPDF pixmap is dropped below
        result = QImage(width, height, QImage::Format_ARGB32);
        if (!result.isNull()) {
            for (int y = 0; y < height; ++y) {
                memcpy(result.scanLine(y), samples + y * stride, width * 4);
            }
        }
    }
    fz_always(m_ctx) {
        if (dev) fz_drop_device(m_ctx, dev);
        if (pix) fz_drop_pixmap(m_ctx, pix);
        if (page) fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        QString cause = QString::fromUtf8(fz_caught_message(m_ctx));
        qWarning() << "MuPdfProvider: Render failed for page" << pageIndex << "-" << cause;
        if (errorMessage) {
            *errorMessage = cause;
        }
        return QImage();
    }

    if (result.isNull() && errorMessage) {
        *errorMessage = QStringLiteral("out of memory allocating page image");
    }
    return result;
}
