#pragma once

// ============================================================================
// TestPdf - Writes small PDFs for tests that need a real document
// ============================================================================
// Letter-sized pages (612 x 792 pt), white, with a black square covering
// (72, 72) - (216, 216) in points on every page.
// ============================================================================

#include <QMarginsF>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <QRectF>
#include <QString>

namespace TestPdf {

inline const QRectF& markRect()
{
    static const QRectF rect(72, 72, 144, 144);
    return rect;
}

inline bool write(const QString& path, int pageCount, const QString& title = QString())
{
    QPdfWriter writer(path);
    writer.setPageSize(QPageSize(QPageSize::Letter));
    writer.setPageMargins(QMarginsF(0, 0, 0, 0));
    writer.setResolution(72);   // one device pixel per point
    if (!title.isEmpty()) {
        writer.setTitle(title);
    }

    QPainter painter;
    if (!painter.begin(&writer)) {
        return false;
    }
    for (int i = 0; i < pageCount; ++i) {
        if (i > 0 && !writer.newPage()) {
            return false;
        }
        painter.fillRect(markRect(), Qt::black);
    }
    return painter.end();
}

} // namespace TestPdf
