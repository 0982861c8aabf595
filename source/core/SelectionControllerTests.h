#ifndef SELECTIONCONTROLLERTESTS_H
#define SELECTIONCONTROLLERTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include "BlockStore.h"
#include "CoordinateMapper.h"
#include "SelectionController.h"
#include "SessionConfig.h"

/**
 * Unit tests for SelectionController.
 * Run with: blockcrop --test-selection
 *
 * The reference DPI is 72 so one view pixel is one point at zoom 1.
 */
class SelectionControllerTests : public QObject {
    Q_OBJECT

private:
    struct Fixture {
        SessionConfig config;
        BlockStore store;
        CoordinateMapper mapper;
        SelectionController controller;

        Fixture()
            : config(unitScaleConfig())
            , mapper(config)
            , controller(store, mapper, config)
        {
            store.setPageBounds(QVector<QSizeF>(2, QSizeF(612, 792)));
        }

        static SessionConfig unitScaleConfig() {
            SessionConfig config;
            config.referenceDpi = 72;
            return config;
        }

        void press(QPointF pos, Qt::MouseButton button = Qt::LeftButton) {
            controller.handlePointerEvent({PointerEvent::Press, pos, button});
        }
        void move(QPointF pos) {
            controller.handlePointerEvent({PointerEvent::Move, pos, Qt::NoButton});
        }
        void release(QPointF pos, Qt::MouseButton button = Qt::LeftButton) {
            controller.handlePointerEvent({PointerEvent::Release, pos, button});
        }
        void drag(QPointF from, QPointF to, Qt::MouseButton button = Qt::LeftButton) {
            press(from, button);
            move(to);
            release(to, button);
        }
    };

private slots:
    void testDragCreatesBlock() {
        Fixture f;
        QSignalSpy preview(&f.controller, &SelectionController::previewChanged);
        QSignalSpy cleared(&f.controller, &SelectionController::previewCleared);
        QSignalSpy states(&f.controller, &SelectionController::stateChanged);

        f.press(QPointF(10, 10));
        QCOMPARE(f.controller.state(), SelectionController::State::Dragging);
        f.move(QPointF(100, 50));
        QCOMPARE(f.controller.previewRect(), QRectF(10, 10, 90, 40));
        f.release(QPointF(100, 50));

        QCOMPARE(f.controller.state(), SelectionController::State::Idle);
        QCOMPARE(f.store.count(), 1);
        Block block = f.store.list().first();
        QCOMPARE(block.pageIndex, 0);
        QCOMPARE(block.rect, QRectF(10, 10, 90, 40));
        QVERIFY(block.enabled);

        QCOMPARE(preview.count(), 1);
        QCOMPARE(cleared.count(), 1);
        QCOMPARE(states.count(), 2);
        QVERIFY(f.controller.previewRect().isNull());
    }

    void testReverseDragNormalizes() {
        Fixture f;
        f.drag(QPointF(100, 50), QPointF(10, 10));

        QCOMPARE(f.store.count(), 1);
        QCOMPARE(f.store.list().first().rect, QRectF(10, 10, 90, 40));
    }

    void testDragHonoursZoomAndPan() {
        Fixture f;
        f.mapper.setZoom(2.0);
        f.mapper.setPanOffset(QPointF(100, 0));

        f.drag(QPointF(20, 20), QPointF(200, 100));

        QCOMPARE(f.store.count(), 1);
        QCOMPARE(f.store.list().first().rect, QRectF(110, 10, 90, 40));
    }

    void testZeroDragCreatesNothing() {
        Fixture f;
        f.press(QPointF(10, 10));
        f.release(QPointF(10, 10));

        QVERIFY(f.store.isEmpty());
        QCOMPARE(f.controller.state(), SelectionController::State::Idle);
    }

    void testSliverIsDiscarded() {
        Fixture f;
        QSignalSpy notices(&f.controller, &SelectionController::noticeRaised);

        f.drag(QPointF(10, 10), QPointF(200, 12));

        QVERIFY(f.store.isEmpty());
        QCOMPARE(notices.count(), 0);
    }

    void testClickTogglesBlock() {
        Fixture f;
        int id = f.store.create(0, QRectF(10, 10, 90, 40)).block.id;

        f.press(QPointF(50, 30));
        f.release(QPointF(51, 31));
        QVERIFY(!f.store.block(id).enabled);

        f.press(QPointF(50, 30));
        f.release(QPointF(50, 30));
        QVERIFY(f.store.block(id).enabled);
        QCOMPARE(f.store.count(), 1);
    }

    void testClickTogglesTopmost() {
        Fixture f;
        int below = f.store.create(0, QRectF(0, 0, 200, 200)).block.id;
        int above = f.store.create(0, QRectF(40, 20, 30, 30)).block.id;

        f.press(QPointF(50, 30));
        f.release(QPointF(50, 30));

        QVERIFY(f.store.block(below).enabled);
        QVERIFY(!f.store.block(above).enabled);
    }

    void testSecondaryClickDeletes() {
        Fixture f;
        int id = f.store.create(0, QRectF(10, 10, 90, 40)).block.id;

        f.press(QPointF(50, 30), Qt::RightButton);
        QCOMPARE(f.controller.state(), SelectionController::State::Idle);
        f.release(QPointF(54, 33), Qt::RightButton);

        QVERIFY(!f.store.contains(id));
    }

    void testSecondaryDragDoesNotDelete() {
        Fixture f;
        int id = f.store.create(0, QRectF(10, 10, 90, 40)).block.id;

        f.press(QPointF(50, 30), Qt::RightButton);
        f.release(QPointF(80, 30), Qt::RightButton);
        QVERIFY(f.store.contains(id));

        // Release on empty page area
        f.press(QPointF(98, 30), Qt::RightButton);
        f.release(QPointF(103, 30), Qt::RightButton);
        QVERIFY(f.store.contains(id));
    }

    void testCancelAbortsDrag() {
        Fixture f;
        QSignalSpy cleared(&f.controller, &SelectionController::previewCleared);

        f.press(QPointF(10, 10));
        f.move(QPointF(100, 50));
        f.controller.cancel();

        QCOMPARE(f.controller.state(), SelectionController::State::Idle);
        QCOMPARE(cleared.count(), 1);

        f.release(QPointF(100, 50));
        QVERIFY(f.store.isEmpty());
    }

    void testOffPageDragRaisesNotice() {
        Fixture f;
        QSignalSpy notices(&f.controller, &SelectionController::noticeRaised);

        f.drag(QPointF(700, 10), QPointF(800, 100));

        QVERIFY(f.store.isEmpty());
        QCOMPARE(notices.count(), 1);
        QCOMPARE(f.controller.state(), SelectionController::State::Idle);
    }

    void testPageSwitch() {
        Fixture f;
        f.press(QPointF(10, 10));
        f.move(QPointF(100, 50));
        f.controller.setCurrentPage(1);
        QCOMPARE(f.controller.state(), SelectionController::State::Idle);

        f.drag(QPointF(10, 10), QPointF(100, 50));
        QCOMPARE(f.store.count(), 1);
        QCOMPARE(f.store.list().first().pageIndex, 1);
    }
};

#endif // SELECTIONCONTROLLERTESTS_H
