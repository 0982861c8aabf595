#pragma once

// ============================================================================
// BlockViewport - Displays one page with its block overlays
// ============================================================================
// Thin view over a SelectionSession:
// - paints the current page raster scaled into view space
// - draws blocks (enabled / grouped / disabled) and the rubber band
// - forwards mouse input to the SelectionController
//
// Input:
//   Left drag        create block      Left click   toggle block
//   Right click      delete block      Right drag   pan
//   Wheel            scroll            Ctrl+Wheel   zoom
//   Escape           cancel drag
// ============================================================================

#include "../core/SelectionController.h"

#include <QPointer>
#include <QWidget>

class SelectionSession;

class BlockViewport : public QWidget {
    Q_OBJECT

public:
    explicit BlockViewport(QWidget* parent = nullptr);

    /**
     * @brief Display a session (nullptr shows an empty view).
     *
     * The viewport does not own the session.
     */
    void setSession(SelectionSession* session);
    SelectionSession* session() const { return m_session; }

    QSize sizeHint() const override;

signals:
    /**
     * @brief Zoom was changed from the viewport (Ctrl+wheel).
     */
    void zoomChanged(qreal zoom);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;

private:
    PointerEvent mouseToPointerEvent(QMouseEvent* event, PointerEvent::Type type) const;
    bool isSelecting() const;

    void drawBlocks(QPainter& painter);
    void drawPreview(QPainter& painter);
    void drawPlaceholder(QPainter& painter, const QString& text);

    QPointer<SelectionSession> m_session;
    QRectF m_previewRect;

    // Right-drag panning
    bool m_rightDragging = false;
    QPointF m_lastPanPos;
};
