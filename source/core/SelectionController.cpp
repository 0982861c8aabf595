#include "SelectionController.h"
#include "BlockStore.h"
#include "CoordinateMapper.h"
#include "SessionConfig.h"

#include <QDebug>
#include <QtMath>

SelectionController::SelectionController(BlockStore& store, const CoordinateMapper& mapper,
                                         const SessionConfig& config, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_mapper(mapper)
    , m_dragThreshold(config.dragThreshold)
    , m_deleteTolerance(config.deleteTolerance)
{
}

void SelectionController::setCurrentPage(int pageIndex)
{
    if (pageIndex == m_currentPage) {
        return;
    }
    cancel();
    m_currentPage = pageIndex;
}

void SelectionController::handlePointerEvent(const PointerEvent& pe)
{
    switch (pe.type) {
        case PointerEvent::Press:
            handlePointerPress(pe);
            break;
        case PointerEvent::Move:
            handlePointerMove(pe);
            break;
        case PointerEvent::Release:
            handlePointerRelease(pe);
            break;
    }
}

void SelectionController::cancel()
{
    m_secondaryPressed = false;
    m_secondaryBlockId = -1;

    if (m_state == State::Dragging) {
        clearPreview();
        setState(State::Idle);
    }
}

// ============================================================================
// Pointer handling
// ============================================================================

void SelectionController::handlePointerPress(const PointerEvent& pe)
{
    if (m_state != State::Idle) {
        return;
    }

    if (pe.button == Qt::LeftButton) {
        m_secondaryPressed = false;
        m_dragOrigin = pe.viewportPos;
        m_previewRect = QRectF();
        setState(State::Dragging);
    } else if (pe.button == Qt::RightButton) {
        m_secondaryPressed = true;
        m_secondaryOrigin = pe.viewportPos;
        m_secondaryBlockId = blockIdAt(pe.viewportPos);
    }
}

void SelectionController::handlePointerMove(const PointerEvent& pe)
{
    if (m_state != State::Dragging) {
        return;
    }

    m_previewRect = QRectF(m_dragOrigin, pe.viewportPos).normalized();
    emit previewChanged(m_previewRect);
}

void SelectionController::handlePointerRelease(const PointerEvent& pe)
{
    if (pe.button == Qt::LeftButton && m_state == State::Dragging) {
        finishDrag(pe.viewportPos);
    } else if (pe.button == Qt::RightButton && m_secondaryPressed) {
        finishSecondary(pe.viewportPos);
    }
}

void SelectionController::finishDrag(QPointF releasePos)
{
    clearPreview();
    setState(State::Idle);

    const qreal dx = qAbs(releasePos.x() - m_dragOrigin.x());
    const qreal dy = qAbs(releasePos.y() - m_dragOrigin.y());

    if (dx < m_dragThreshold && dy < m_dragThreshold) {
        clickAt(releasePos);
        return;
    }
    if (dx < m_dragThreshold || dy < m_dragThreshold) {
        // Sliver: too thin to be a region, too long to be a click
        return;
    }

    QRectF docRect = m_mapper.toDocument(QRectF(m_dragOrigin, releasePos).normalized());
    BlockResult result = m_store.create(m_currentPage, docRect);
    if (!result.success()) {
        qDebug() << "SelectionController: Drag rejected:" << result.errorMessage;
        emit noticeRaised(result.errorMessage);
    }
}

void SelectionController::clickAt(QPointF viewPos)
{
    int blockId = blockIdAt(viewPos);
    if (blockId < 0) {
        return;
    }

    BlockResult result = m_store.toggle(blockId);
    if (!result.success()) {
        emit noticeRaised(result.errorMessage);
    }
}

void SelectionController::finishSecondary(QPointF releasePos)
{
    const int pressedId = m_secondaryBlockId;
    m_secondaryPressed = false;
    m_secondaryBlockId = -1;

    if (pressedId < 0) {
        return;
    }

    // Moving further than the tolerance is a pan, not a delete.
    QPointF delta = releasePos - m_secondaryOrigin;
    if (qAbs(delta.x()) > m_deleteTolerance || qAbs(delta.y()) > m_deleteTolerance) {
        return;
    }
    if (blockIdAt(releasePos) != pressedId) {
        return;
    }

    BlockResult result = m_store.remove(pressedId);
    if (!result.success()) {
        emit noticeRaised(result.errorMessage);
    }
}

// ============================================================================
// Helpers
// ============================================================================

int SelectionController::blockIdAt(QPointF viewPos) const
{
    Block hit = m_store.blockAt(m_currentPage, m_mapper.toDocument(viewPos));
    return hit.isValid() ? hit.id : -1;
}

void SelectionController::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged(state);
}

void SelectionController::clearPreview()
{
    m_previewRect = QRectF();
    emit previewCleared();
}
