#pragma once

// ============================================================================
// SelectionController - Rubber-band selection state machine
// ============================================================================
// Consumes pointer events in view space and turns them into BlockStore
// commands:
//
//   Idle --primary press--> Dragging --primary release--> Idle
//                               |  (create block, or toggle on click)
//                               +--cancel()--> Idle
//
//   Idle --secondary press/release on the same block--> remove block
//
// The controller never touches widgets. It reads the current zoom/pan from
// the CoordinateMapper it is given and reports overlay changes via signals.
// Must be used from the owner thread only.
// ============================================================================

#include <QObject>
#include <QPointF>
#include <QRectF>
#include <Qt>

class BlockStore;
class CoordinateMapper;
struct SessionConfig;

/**
 * @brief Pointer input in view coordinates, independent of the event source.
 */
struct PointerEvent {
    enum Type { Press, Move, Release };

    Type type = Move;
    QPointF viewportPos;                        ///< Widget coordinates
    Qt::MouseButton button = Qt::LeftButton;    ///< Button that changed (Press/Release)
};

class SelectionController : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        Dragging
    };
    Q_ENUM(State)

    SelectionController(BlockStore& store, const CoordinateMapper& mapper,
                        const SessionConfig& config, QObject* parent = nullptr);

    State state() const { return m_state; }

    int currentPage() const { return m_currentPage; }

    /**
     * @brief Page that new blocks go to and clicks are hit-tested against.
     *
     * Switching pages cancels a drag in progress.
     */
    void setCurrentPage(int pageIndex);

    /**
     * @brief Live rubber band in view space (empty when not dragging).
     */
    QRectF previewRect() const { return m_previewRect; }

    void handlePointerEvent(const PointerEvent& pe);

    /**
     * @brief Abandon any pending gesture (Escape). Store is untouched.
     */
    void cancel();

signals:
    void previewChanged(const QRectF& viewRect);
    void previewCleared();
    void stateChanged(SelectionController::State state);

    /**
     * @brief A gesture failed in a recoverable way (user-visible notice).
     */
    void noticeRaised(const QString& message);

private:
    void handlePointerPress(const PointerEvent& pe);
    void handlePointerMove(const PointerEvent& pe);
    void handlePointerRelease(const PointerEvent& pe);

    void finishDrag(QPointF releasePos);
    void clickAt(QPointF viewPos);
    void finishSecondary(QPointF releasePos);

    int blockIdAt(QPointF viewPos) const;
    void setState(State state);
    void clearPreview();

    BlockStore& m_store;
    const CoordinateMapper& m_mapper;
    const qreal m_dragThreshold;
    const qreal m_deleteTolerance;

    State m_state = State::Idle;
    int m_currentPage = 0;
    QPointF m_dragOrigin;
    QRectF m_previewRect;

    // Secondary-button delete gesture
    bool m_secondaryPressed = false;
    QPointF m_secondaryOrigin;
    int m_secondaryBlockId = -1;
};
