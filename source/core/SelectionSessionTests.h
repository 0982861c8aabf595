#ifndef SELECTIONSESSIONTESTS_H
#define SELECTIONSESSIONTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <memory>
#include "BlockStore.h"
#include "PageRasterCache.h"
#include "SelectionSession.h"
#include "SessionConfig.h"
#include "TestRasterizer.h"

/**
 * Unit tests for SelectionSession wiring: view state, rasters, dirty
 * tracking, async export and teardown.
 * Run with: blockcrop --test-session
 */
class SelectionSessionTests : public QObject {
    Q_OBJECT

private:
    static SessionConfig smallConfig() {
        SessionConfig config;
        config.referenceDpi = 72;
        return config;
    }

    static QVector<QSizeF> pages() {
        return QVector<QSizeF>(3, QSizeF(144, 144));
    }

private slots:
    void testPageNavigation() {
        auto rasterizer = std::make_shared<TestRasterizer>(pages());
        SelectionSession session(rasterizer, pages(), smallConfig());
        QSignalSpy changed(&session, &SelectionSession::currentPageChanged);

        QCOMPARE(session.pageCount(), 3);
        QCOMPARE(session.currentPage(), 0);
        session.setPanOffset(QPointF(20, 20));

        QVERIFY(session.setCurrentPage(2));
        QCOMPARE(session.currentPage(), 2);
        QCOMPARE(session.controller().currentPage(), 2);
        QCOMPARE(session.mapper().panOffset(), QPointF(0, 0));
        QCOMPARE(changed.count(), 1);

        QVERIFY(!session.setCurrentPage(3));
        QVERIFY(!session.setCurrentPage(-1));
        QCOMPARE(session.currentPage(), 2);
        QCOMPARE(changed.count(), 1);
    }

    void testRasterFollowsZoom() {
        auto rasterizer = std::make_shared<TestRasterizer>(pages());
        SelectionSession session(rasterizer, pages(), smallConfig());
        QSignalSpy ready(&session, &SelectionSession::currentRasterChanged);

        QVERIFY(!session.requestCurrentRaster());
        QTRY_COMPARE(ready.count(), 1);
        QCOMPARE(session.currentRaster().dpi, 72.0);
        QCOMPARE(session.currentRaster().image.size(), QSize(144, 144));
        QCOMPARE(session.mapper().activeResolution(), 72.0);

        QVERIFY(session.setZoom(2.0));
        // The old resolution stays visible until the new one arrives
        QVERIFY(session.currentRaster().isValid());
        QTRY_COMPARE(ready.count(), 2);
        QCOMPARE(session.currentRaster().dpi, 144.0);
        QCOMPARE(session.mapper().activeResolution(), 144.0);
        QVERIFY(session.currentRasterError().isEmpty());
    }

    void testRasterFailureReported() {
        auto rasterizer = std::make_shared<TestRasterizer>(pages());
        rasterizer->setFailing(1);
        SelectionSession session(rasterizer, pages(), smallConfig());
        QSignalSpy failed(&session, &SelectionSession::currentRasterFailed);

        QVERIFY(session.setCurrentPage(1));
        QTRY_COMPARE(failed.count(), 1);
        QVERIFY(!session.currentRasterError().isEmpty());
        QVERIFY(!session.currentRaster().isValid());

        QVERIFY(session.setCurrentPage(0));
        QVERIFY(session.currentRasterError().isEmpty());
    }

    void testDirtyTracking() {
        auto rasterizer = std::make_shared<TestRasterizer>(pages());
        SelectionSession session(rasterizer, pages(), smallConfig());
        QSignalSpy dirty(&session, &SelectionSession::dirtyChanged);

        QVERIFY(!session.isDirty());
        int id = session.store().create(0, QRectF(10, 10, 50, 50)).block.id;
        QVERIFY(session.isDirty());
        session.store().toggle(id);
        QCOMPARE(dirty.count(), 1);

        // No document file to save to
        QString error;
        QVERIFY(session.blocksPath().isEmpty());
        QVERIFY(!session.saveBlocks(&error));
        QVERIFY(!error.isEmpty());
        QVERIFY(session.isDirty());
    }

    void testExportAllAsync() {
        auto rasterizer = std::make_shared<TestRasterizer>(pages());
        SelectionSession session(rasterizer, pages(), smallConfig());
        QSignalSpy finished(&session, &SelectionSession::exportFinished);

        int a = session.store().create(0, QRectF(0, 0, 72, 36)).block.id;
        int b = session.store().create(1, QRectF(0, 0, 36, 72)).block.id;

        rasterizer->closeGate();
        QVERIFY(session.exportAllAsync(true, 144));
        QVERIFY(session.isExporting());
        QVERIFY(!session.exportAllAsync());

        // Edits after the snapshot do not affect the running export
        session.store().toggle(b);
        rasterizer->openGate();

        QTRY_COMPARE(finished.count(), 1);
        QVERIFY(!session.isExporting());

        const auto results = finished.at(0).at(0).value<QVector<ExportResult>>();
        QCOMPARE(results.size(), 2);
        QCOMPARE(results[0].blockId, a);
        QCOMPARE(results[0].buffer.image.size(), QSize(144, 72));
        QCOMPARE(results[1].blockId, b);
        QVERIFY(results[1].success());
    }

    void testCloseIsIdempotent() {
        auto rasterizer = std::make_shared<TestRasterizer>(pages());
        SelectionSession session(rasterizer, pages(), smallConfig());
        session.store().create(0, QRectF(10, 10, 50, 50));
        QVERIFY(session.cache().ensure(0, 72).success());

        session.close();
        QVERIFY(session.isClosed());
        QVERIFY(session.store().isEmpty());
        QCOMPARE(session.cache().size(), 0);
        QVERIFY(!session.isDirty());

        QVERIFY(!session.setCurrentPage(1));
        QVERIFY(!session.exportAllAsync());
        QVERIFY(!session.requestCurrentRaster());

        session.close();
        QVERIFY(session.isClosed());
    }
};

#endif // SELECTIONSESSIONTESTS_H
