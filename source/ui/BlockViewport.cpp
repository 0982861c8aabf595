#include "BlockViewport.h"
#include "../core/SelectionSession.h"
#include "../core/BlockStore.h"

#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QWheelEvent>
#include <QtMath>

namespace {
const QColor kBackground(64, 64, 64);
const QColor kEnabledColor(0, 170, 0);
const QColor kGroupedColor(128, 0, 160);
const QColor kDisabledColor(140, 140, 140);
const QColor kPreviewColor(220, 0, 0);
}

BlockViewport::BlockViewport(QWidget* parent)
    : QWidget(parent)
{
    setFocusPolicy(Qt::StrongFocus);
    setMouseTracking(false);
    setAttribute(Qt::WA_OpaquePaintEvent);
}

QSize BlockViewport::sizeHint() const
{
    return QSize(900, 1100);
}

void BlockViewport::setSession(SelectionSession* session)
{
    if (m_session == session) {
        return;
    }

    if (m_session) {
        disconnect(m_session, nullptr, this, nullptr);
        disconnect(&m_session->store(), nullptr, this, nullptr);
        disconnect(&m_session->controller(), nullptr, this, nullptr);
    }

    m_session = session;
    m_previewRect = QRectF();
    m_rightDragging = false;

    if (m_session) {
        auto repaint = [this]() { update(); };
        connect(m_session, &SelectionSession::currentRasterChanged, this, repaint);
        connect(m_session, &SelectionSession::currentRasterFailed, this, repaint);
        connect(m_session, &SelectionSession::currentPageChanged, this, repaint);
        connect(m_session, &SelectionSession::viewChanged, this, repaint);

        BlockStore* store = &m_session->store();
        connect(store, &BlockStore::blockCreated, this, repaint);
        connect(store, &BlockStore::blockToggled, this, repaint);
        connect(store, &BlockStore::blockRemoved, this, repaint);
        connect(store, &BlockStore::groupCreated, this, repaint);
        connect(store, &BlockStore::groupRemoved, this, repaint);
        connect(store, &BlockStore::blocksReset, this, repaint);

        SelectionController* controller = &m_session->controller();
        connect(controller, &SelectionController::previewChanged, this, [this](const QRectF& rect) {
            m_previewRect = rect;
            update();
        });
        connect(controller, &SelectionController::previewCleared, this, [this]() {
            m_previewRect = QRectF();
            update();
        });

        m_session->requestCurrentRaster();
    }

    update();
}

// ============================================================================
// Painting
// ============================================================================

void BlockViewport::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.fillRect(rect(), kBackground);

    if (!m_session) {
        drawPlaceholder(painter, tr("Open a PDF to start selecting blocks"));
        return;
    }

    const CoordinateMapper& mapper = m_session->mapper();
    const QSizeF pageSize = m_session->pageSize(m_session->currentPage());
    const QRectF pageViewRect = mapper.toView(QRectF(QPointF(0, 0), pageSize));

    RasterBuffer raster = m_session->currentRaster();
    if (raster.isValid()) {
        painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
        painter.drawImage(pageViewRect, raster.image);
    } else {
        painter.fillRect(pageViewRect, Qt::white);
        if (!m_session->currentRasterError().isEmpty()) {
            drawPlaceholder(painter, tr("No raster available for this page"));
        }
    }

    painter.setRenderHint(QPainter::Antialiasing, true);
    drawBlocks(painter);
    drawPreview(painter);
}

void BlockViewport::drawBlocks(QPainter& painter)
{
    const CoordinateMapper& mapper = m_session->mapper();
    const QVector<Block> blocks = m_session->store().list(m_session->currentPage());

    // Creation order: later blocks on top
    for (const Block& block : blocks) {
        QRectF viewRect = mapper.toView(block.rect);

        QColor color = kEnabledColor;
        Qt::PenStyle style = Qt::DashLine;
        if (!block.enabled) {
            color = kDisabledColor;
            style = Qt::DotLine;
        } else if (block.isGrouped()) {
            color = kGroupedColor;
            style = Qt::SolidLine;
        }

        QColor fill = color;
        fill.setAlpha(block.enabled ? 30 : 60);
        painter.fillRect(viewRect, fill);

        QPen pen(color, 2, style);
        painter.setPen(pen);
        painter.setBrush(Qt::NoBrush);
        painter.drawRect(viewRect);

        QString label = block.isGrouped()
            ? QStringLiteral("%1 [G%2]").arg(block.id).arg(block.groupId)
            : QString::number(block.id);
        painter.drawText(viewRect.topLeft() + QPointF(4, 14), label);
    }
}

void BlockViewport::drawPreview(QPainter& painter)
{
    if (m_previewRect.isNull()) {
        return;
    }
    QPen pen(kPreviewColor, 1, Qt::DashLine);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(m_previewRect);
}

void BlockViewport::drawPlaceholder(QPainter& painter, const QString& text)
{
    painter.setPen(QColor(180, 180, 180));
    QFont font = painter.font();
    font.setPointSize(14);
    painter.setFont(font);
    painter.drawText(rect(), Qt::AlignCenter, text);
}

// ============================================================================
// Input
// ============================================================================

bool BlockViewport::isSelecting() const
{
    return m_session && m_session->controller().state() == SelectionController::State::Dragging;
}

PointerEvent BlockViewport::mouseToPointerEvent(QMouseEvent* event, PointerEvent::Type type) const
{
    PointerEvent pe;
    pe.type = type;
    pe.viewportPos = event->position();
    pe.button = event->button();
    return pe;
}

void BlockViewport::mousePressEvent(QMouseEvent* event)
{
    if (!m_session) {
        event->ignore();
        return;
    }

    // No panning while a block is being dragged out.
    if (event->button() == Qt::RightButton && !isSelecting()) {
        m_rightDragging = true;
        m_lastPanPos = event->position();
    }

    m_session->controller().handlePointerEvent(mouseToPointerEvent(event, PointerEvent::Press));
    event->accept();
}

void BlockViewport::mouseMoveEvent(QMouseEvent* event)
{
    if (!m_session) {
        event->ignore();
        return;
    }

    if (m_rightDragging && !isSelecting()) {
        QPointF deltaView = event->position() - m_lastPanPos;
        m_lastPanPos = event->position();
        const qreal scale = m_session->mapper().viewScale();
        m_session->setPanOffset(m_session->mapper().panOffset() - deltaView / scale);
        event->accept();
        return;
    }

    m_session->controller().handlePointerEvent(mouseToPointerEvent(event, PointerEvent::Move));
    event->accept();
}

void BlockViewport::mouseReleaseEvent(QMouseEvent* event)
{
    if (!m_session) {
        event->ignore();
        return;
    }

    if (event->button() == Qt::RightButton) {
        m_rightDragging = false;
    }

    m_session->controller().handlePointerEvent(mouseToPointerEvent(event, PointerEvent::Release));
    event->accept();
}

void BlockViewport::wheelEvent(QWheelEvent* event)
{
    if (!m_session) {
        event->ignore();
        return;
    }

    QPoint pixelDelta = event->pixelDelta();
    QPoint angleDelta = event->angleDelta();

    if (event->modifiers() & Qt::ControlModifier) {
        qreal steps = 0;
        if (!angleDelta.isNull()) {
            // 120 units = one wheel step
            steps = angleDelta.y() / 120.0;
        } else if (!pixelDelta.isNull()) {
            steps = pixelDelta.y() / 50.0;
        }
        if (qFuzzyIsNull(steps)) {
            event->accept();
            return;
        }

        // Keep the document point under the cursor fixed
        CoordinateMapper& mapper = m_session->mapper();
        QPointF anchorDoc = mapper.toDocument(event->position());
        if (m_session->setZoom(mapper.zoom() * qPow(1.1, steps))) {
            QPointF pan = anchorDoc - event->position() / mapper.viewScale();
            m_session->setPanOffset(pan);
            emit zoomChanged(mapper.zoom());
        }
        event->accept();
        return;
    }

    QPointF scrollDelta;
    const qreal scale = m_session->mapper().viewScale();
    if (!pixelDelta.isNull()) {
        scrollDelta = QPointF(-pixelDelta.x(), -pixelDelta.y()) / scale;
    } else if (!angleDelta.isNull()) {
        // ~40 view pixels per step
        scrollDelta = QPointF(-angleDelta.x(), -angleDelta.y()) / 120.0 * 40.0 / scale;
    }

    if (event->modifiers() & Qt::ShiftModifier) {
        scrollDelta = QPointF(scrollDelta.y(), scrollDelta.x());
    }

    if (!scrollDelta.isNull()) {
        m_session->setPanOffset(m_session->mapper().panOffset() + scrollDelta);
    }
    event->accept();
}

void BlockViewport::keyPressEvent(QKeyEvent* event)
{
    if (m_session && event->key() == Qt::Key_Escape) {
        m_session->controller().cancel();
        event->accept();
        return;
    }
    QWidget::keyPressEvent(event);
}
