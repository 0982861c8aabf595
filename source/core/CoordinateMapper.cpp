#include "CoordinateMapper.h"

#include <QDebug>
#include <QtMath>

// PDF user space unit: 72 points per inch
static constexpr qreal POINTS_PER_INCH = 72.0;

CoordinateMapper::CoordinateMapper(const SessionConfig& config)
    : m_referenceDpi(config.referenceDpi)
    , m_minZoom(config.minZoom)
    , m_maxZoom(config.maxZoom)
    , m_minRenderDpi(config.minRenderDpi)
    , m_maxRenderDpi(config.maxRenderDpi)
{
    m_activeResolution = targetRenderDpi();
}

bool CoordinateMapper::setZoom(qreal zoom)
{
    if (!(zoom > 0)) {
        qWarning() << "CoordinateMapper: Rejecting non-positive zoom" << zoom;
        return false;
    }
    m_zoom = qBound(m_minZoom, zoom, m_maxZoom);
    return true;
}

void CoordinateMapper::setActiveResolution(qreal dpi)
{
    if (dpi > 0) {
        m_activeResolution = dpi;
    }
}

qreal CoordinateMapper::viewScale() const
{
    return m_zoom * m_referenceDpi / POINTS_PER_INCH;
}

qreal CoordinateMapper::targetRenderDpi() const
{
    qreal scaled = qRound(m_referenceDpi * m_zoom);
    return qBound(m_minRenderDpi, scaled, m_maxRenderDpi);
}

// ===== Document <-> View =====
//
// viewPt = (docPt - panOffset) * viewScale
// docPt  = viewPt / viewScale + panOffset

QPointF CoordinateMapper::toDocument(QPointF viewPt) const
{
    return viewPt / viewScale() + m_panOffset;
}

QPointF CoordinateMapper::toView(QPointF docPt) const
{
    return (docPt - m_panOffset) * viewScale();
}

QRectF CoordinateMapper::toDocument(const QRectF& viewRect) const
{
    return QRectF(toDocument(viewRect.topLeft()), toDocument(viewRect.bottomRight()));
}

QRectF CoordinateMapper::toView(const QRectF& docRect) const
{
    return QRectF(toView(docRect.topLeft()), toView(docRect.bottomRight()));
}

// ===== Document <-> Raster =====

QPointF CoordinateMapper::toRaster(QPointF docPt, qreal dpi)
{
    return docPt * (dpi / POINTS_PER_INCH);
}

QPointF CoordinateMapper::fromRaster(QPointF rasterPt, qreal dpi)
{
    return rasterPt * (POINTS_PER_INCH / dpi);
}

QRectF CoordinateMapper::toRaster(const QRectF& docRect, qreal dpi)
{
    qreal scale = dpi / POINTS_PER_INCH;
    return QRectF(docRect.x() * scale, docRect.y() * scale,
                  docRect.width() * scale, docRect.height() * scale);
}

QRectF CoordinateMapper::fromRaster(const QRectF& rasterRect, qreal dpi)
{
    qreal scale = POINTS_PER_INCH / dpi;
    return QRectF(rasterRect.x() * scale, rasterRect.y() * scale,
                  rasterRect.width() * scale, rasterRect.height() * scale);
}
