#pragma once

// ============================================================================
// CoordinateMapper - Conversions between document, raster and view space
// ============================================================================
// Three frames:
// - Document space: PDF points (1/72 inch), page-relative, y down.
// - Raster space:   pixels of a page rasterized at some DPI.
// - View space:     widget pixels under the current zoom and pan.
//
// All conversions are pure affine transforms of the current zoom, pan and
// the DPI passed in. Nothing here clamps: a view point off the page maps to
// an off-page (possibly negative) document point.
// ============================================================================

#include "SessionConfig.h"

#include <QPointF>
#include <QRectF>

class CoordinateMapper {
public:
    explicit CoordinateMapper(const SessionConfig& config = SessionConfig());

    // ===== Transform State =====

    qreal zoom() const { return m_zoom; }

    /**
     * @brief Set the zoom level.
     * @param zoom New zoom, clamped to the configured range.
     * @return False (and state unchanged) if zoom is not positive.
     */
    bool setZoom(qreal zoom);

    /// Top-left corner of the viewport, in document coordinates.
    QPointF panOffset() const { return m_panOffset; }
    void setPanOffset(QPointF offset) { m_panOffset = offset; }

    /// Resolution of the raster currently used for display.
    qreal activeResolution() const { return m_activeResolution; }
    void setActiveResolution(qreal dpi);

    qreal referenceDpi() const { return m_referenceDpi; }

    /**
     * @brief View pixels per document point at the current zoom.
     */
    qreal viewScale() const;

    /**
     * @brief DPI the view should rasterize at for the current zoom.
     *
     * referenceDpi * zoom, rounded and clamped to the configured range.
     */
    qreal targetRenderDpi() const;

    // ===== Document <-> View =====

    QPointF toDocument(QPointF viewPt) const;
    QPointF toView(QPointF docPt) const;
    QRectF toDocument(const QRectF& viewRect) const;
    QRectF toView(const QRectF& docRect) const;

    // ===== Document <-> Raster =====

    static QPointF toRaster(QPointF docPt, qreal dpi);
    static QPointF fromRaster(QPointF rasterPt, qreal dpi);
    static QRectF toRaster(const QRectF& docRect, qreal dpi);
    static QRectF fromRaster(const QRectF& rasterRect, qreal dpi);

private:
    qreal m_zoom = 1.0;
    QPointF m_panOffset;
    qreal m_activeResolution = 0;

    qreal m_referenceDpi;
    qreal m_minZoom;
    qreal m_maxZoom;
    qreal m_minRenderDpi;
    qreal m_maxRenderDpi;
};
