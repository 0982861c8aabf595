#include "MergeLayout.h"

#include <QPainter>

VerticalStackLayout::VerticalStackLayout(int margin)
    : m_margin(qMax(0, margin))
{
}

QImage VerticalStackLayout::compose(const QVector<QImage>& segments) const
{
    if (segments.isEmpty()) {
        return QImage();
    }
    if (segments.size() == 1) {
        return segments.first();
    }

    int width = 0;
    int height = m_margin * (segments.size() - 1);
    for (const QImage& segment : segments) {
        width = qMax(width, segment.width());
        height += segment.height();
    }

    QImage canvas(width, height, QImage::Format_ARGB32);
    canvas.fill(Qt::white);

    QPainter painter(&canvas);
    int y = 0;
    for (const QImage& segment : segments) {
        painter.drawImage(0, y, segment);
        y += segment.height() + m_margin;
    }
    painter.end();

    return canvas;
}
