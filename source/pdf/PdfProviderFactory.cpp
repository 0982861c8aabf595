// ============================================================================
// PdfProviderFactory - Platform-specific PDF provider creation
// ============================================================================
// Backend selection:
//   - Android: MuPDF (smaller, bundled dependencies)
//   - Alpine Linux (musl): MuPDF (avoids symbol collision with Poppler/OpenJPEG)
//   - Desktop (glibc): Poppler, unless configured with
//     -DBLOCKCROP_USE_MUPDF=ON
// ============================================================================

#include "PdfProvider.h"

#include <QDebug>
#include <memory>

// ============================================================================
// Backend
// ============================================================================
// Only one backend is compiled and linked. On musl, MuPDF and Poppler both
// load OpenJPEG; MuPDF's custom allocators then get called by Poppler's copy
// and crash. CMakeLists.txt sets BLOCKCROP_USE_MUPDF for Android and musl.
// ============================================================================

#ifdef BLOCKCROP_USE_MUPDF
#include "MuPdfProvider.h"
using PdfProviderImpl = MuPdfProvider;
#else
#include "PopplerPdfProvider.h"
using PdfProviderImpl = PopplerPdfProvider;
#endif

// ============================================================================
// Factory Methods
// ============================================================================

std::unique_ptr<PdfProvider> PdfProvider::create(const QString& pdfPath)
{
    auto provider = std::make_unique<PdfProviderImpl>(pdfPath);
    if (provider->isLocked()) {
        qWarning() << "PdfProvider: Password-protected PDFs are not supported:" << pdfPath;
        return nullptr;
    }
    if (!provider->isValid()) {
        return nullptr;
    }
    return provider;
}

QString PdfProvider::backendName()
{
#ifdef BLOCKCROP_USE_MUPDF
    return QStringLiteral("MuPDF");
#else
    return QStringLiteral("Poppler");
#endif
}
