#include "PdfPageRasterizer.h"
#include "PdfProvider.h"

#include <QElapsedTimer>
#include <QDebug>

PdfPageRasterizer::PdfPageRasterizer(const QString& pdfPath)
    : m_pdfPath(pdfPath)
{
}

QImage PdfPageRasterizer::rasterize(int pageIndex, qreal dpi, QString* errorMessage) const
{
    QElapsedTimer timer;
    timer.start();

    // Thread-local provider (each call loads its own copy)
    std::unique_ptr<PdfProvider> provider = PdfProvider::create(m_pdfPath);
    if (!provider) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("cannot open %1").arg(m_pdfPath);
        }
        return QImage();
    }

    QImage image = provider->renderPageToImage(pageIndex, dpi, errorMessage);
    if (!image.isNull()) {
        qDebug() << "PdfPageRasterizer: page" << pageIndex << "at" << dpi << "dpi in"
                 << timer.elapsed() << "ms";
    }
    return image;
}
