#ifndef PAGERASTERCACHETESTS_H
#define PAGERASTERCACHETESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QtConcurrent>
#include <memory>
#include "PageRasterCache.h"
#include "TestRasterizer.h"

/**
 * Unit tests for PageRasterCache.
 * Run with: blockcrop --test-cache
 */
class PageRasterCacheTests : public QObject {
    Q_OBJECT

private:
    // Ten one-inch pages: 100 dpi gives 100x100 pixels
    static std::shared_ptr<TestRasterizer> makeRasterizer() {
        return std::make_shared<TestRasterizer>(QVector<QSizeF>(10, QSizeF(72, 72)));
    }

private slots:
    void testEnsureRasterizes() {
        auto rasterizer = makeRasterizer();
        PageRasterCache cache(rasterizer);

        RasterResult result = cache.ensure(2, 100);
        QVERIFY(result.success());
        QCOMPARE(result.buffer.pageIndex, 2);
        QCOMPARE(result.buffer.dpi, 100.0);
        QCOMPARE(result.buffer.image.size(), QSize(100, 100));
        QCOMPARE(result.buffer.image.pixelColor(50, 50), TestRasterizer::pageColor(2));

        QVERIFY(cache.contains(2, 100));
        QCOMPARE(cache.cachedDpi(2), 100.0);
        QCOMPARE(cache.size(), 1);
    }

    void testHitDoesNotRasterize() {
        auto rasterizer = makeRasterizer();
        PageRasterCache cache(rasterizer);

        QVERIFY(cache.ensure(0, 100).success());
        QVERIFY(cache.ensure(0, 100).success());
        QVERIFY(cache.request(0, 100));
        QCOMPARE(rasterizer->startedCount(), 1);
    }

    void testInvalidArguments() {
        auto rasterizer = makeRasterizer();
        PageRasterCache cache(rasterizer);

        QCOMPARE(cache.ensure(-1, 100).error, BlockError::RasterizationError);
        QCOMPARE(cache.ensure(0, 0).error, BlockError::RasterizationError);
        QVERIFY(!cache.request(0, -10));
        QCOMPARE(rasterizer->startedCount(), 0);
    }

    void testRequestDeliversSignal() {
        auto rasterizer = makeRasterizer();
        PageRasterCache cache(rasterizer);
        QSignalSpy ready(&cache, &PageRasterCache::rasterReady);

        QVERIFY(!cache.request(1, 100));
        QTRY_COMPARE(ready.count(), 1);
        QCOMPARE(ready.at(0).at(0).toInt(), 1);
        QCOMPARE(ready.at(0).at(1).toReal(), 100.0);
        QVERIFY(cache.contains(1, 100));
        QVERIFY(!cache.isInFlight(1, 100));
    }

    void testRequestsCoalesce() {
        auto rasterizer = makeRasterizer();
        PageRasterCache cache(rasterizer);
        QSignalSpy ready(&cache, &PageRasterCache::rasterReady);

        rasterizer->closeGate();
        QVERIFY(!cache.request(0, 100));
        QVERIFY(!cache.request(0, 100));
        QVERIFY(cache.isInFlight(0, 100));
        rasterizer->openGate();

        QTRY_COMPARE(ready.count(), 1);
        QCOMPARE(rasterizer->startedCount(), 1);
    }

    void testEnsureJoinsRequest() {
        auto rasterizer = makeRasterizer();
        PageRasterCache cache(rasterizer);
        QSignalSpy ready(&cache, &PageRasterCache::rasterReady);

        rasterizer->closeGate();
        QVERIFY(!cache.request(3, 100));
        QFuture<RasterResult> worker = QtConcurrent::run([&cache]() {
            return cache.ensure(3, 100);
        });
        rasterizer->openGate();

        worker.waitForFinished();
        QVERIFY(worker.result().success());
        QTRY_COMPARE(ready.count(), 1);
        QTRY_VERIFY(!cache.isInFlight(3, 100));
        QTest::qWait(50);
        QCOMPARE(ready.count(), 1);
        QCOMPARE(rasterizer->startedCount(), 1);
        QCOMPARE(cache.size(), 1);
    }

    void testEnsureAtOtherDpiNotifiesOwner() {
        auto rasterizer = makeRasterizer();
        PageRasterCache cache(rasterizer);
        QSignalSpy ready(&cache, &PageRasterCache::rasterReady);

        // A view request is pending when an export asks for a higher resolution
        rasterizer->closeGate();
        QVERIFY(!cache.request(0, 100));
        QFuture<RasterResult> worker = QtConcurrent::run([&cache]() {
            return cache.ensure(0, 200);
        });
        QTRY_COMPARE(rasterizer->startedCount(), 2);
        rasterizer->openGate();

        worker.waitForFinished();
        QVERIFY(worker.result().success());
        QTRY_COMPARE(ready.count(), 1);
        QTRY_VERIFY(!cache.isInFlight(0, 100));
        QTest::qWait(100);

        QCOMPARE(ready.count(), 1);
        QCOMPARE(ready.at(0).at(0).toInt(), 0);
        QCOMPARE(ready.at(0).at(1).toReal(), 200.0);
        QCOMPARE(cache.cachedDpi(0), 200.0);
    }

    void testEnsureReportsStoredBuffer() {
        auto rasterizer = makeRasterizer();
        PageRasterCache cache(rasterizer);
        QSignalSpy ready(&cache, &PageRasterCache::rasterReady);

        QVERIFY(cache.ensure(4, 100).success());
        QCOMPARE(ready.count(), 1);

        // Hits store nothing new
        QVERIFY(cache.ensure(4, 100).success());
        QCOMPARE(ready.count(), 1);
    }

    void testClearDiscardsInFlight() {
        auto rasterizer = makeRasterizer();
        PageRasterCache cache(rasterizer);
        QSignalSpy ready(&cache, &PageRasterCache::rasterReady);

        rasterizer->closeGate();
        QVERIFY(!cache.request(0, 100));
        cache.clear();
        QVERIFY(!cache.isInFlight(0, 100));
        rasterizer->openGate();

        QTRY_COMPARE(rasterizer->finishedCount(), 1);
        QTest::qWait(100);
        QVERIFY(!cache.contains(0, 100));
        QCOMPARE(cache.size(), 0);
        QCOMPARE(ready.count(), 0);
    }

    void testStaleResolutionDiscarded() {
        auto rasterizer = makeRasterizer();
        PageRasterCache cache(rasterizer);
        QSignalSpy ready(&cache, &PageRasterCache::rasterReady);

        rasterizer->closeGate();
        QVERIFY(!cache.request(0, 100));
        QVERIFY(!cache.request(0, 200));
        rasterizer->openGate();

        QTRY_VERIFY(!cache.isInFlight(0, 100) && !cache.isInFlight(0, 200));
        QTRY_COMPARE(ready.count(), 1);
        QCOMPARE(ready.at(0).at(1).toReal(), 200.0);
        QVERIFY(cache.contains(0, 200));
        QVERIFY(!cache.contains(0, 100));
    }

    void testInvalidatePage() {
        auto rasterizer = makeRasterizer();
        PageRasterCache cache(rasterizer);

        QVERIFY(cache.ensure(0, 100).success());
        QVERIFY(cache.ensure(1, 100).success());
        cache.invalidate(0);

        QVERIFY(!cache.contains(0, 100));
        QVERIFY(cache.contains(1, 100));
        QVERIFY(cache.ensure(0, 100).success());
        QCOMPARE(rasterizer->startedCount(), 3);
    }

    void testOneResolutionPerPage() {
        auto rasterizer = makeRasterizer();
        PageRasterCache cache(rasterizer);

        QVERIFY(cache.ensure(0, 100).success());
        QVERIFY(cache.ensure(0, 200).success());

        QCOMPARE(cache.size(), 1);
        QCOMPARE(cache.cachedDpi(0), 200.0);
        QVERIFY(!cache.contains(0, 100));
        QCOMPARE(cache.cached(0, 200).image.size(), QSize(200, 200));
    }

    void testEvictsFurthestPage() {
        auto rasterizer = makeRasterizer();
        PageRasterCache cache(rasterizer, 2);
        QCOMPARE(cache.capacity(), 2);

        QVERIFY(cache.ensure(0, 100).success());
        QVERIFY(cache.ensure(4, 100).success());
        QVERIFY(cache.ensure(5, 100).success());

        QCOMPARE(cache.size(), 2);
        QVERIFY(!cache.contains(0, 100));
        QVERIFY(cache.contains(4, 100));
        QVERIFY(cache.contains(5, 100));
    }

    void testFailureLeavesCacheUnchanged() {
        auto rasterizer = makeRasterizer();
        rasterizer->setFailing(3);
        PageRasterCache cache(rasterizer);
        QSignalSpy failed(&cache, &PageRasterCache::rasterFailed);

        QVERIFY(cache.ensure(0, 100).success());

        RasterResult result = cache.ensure(3, 100);
        QVERIFY(!result.success());
        QCOMPARE(result.error, BlockError::RasterizationError);
        QVERIFY(result.errorMessage.contains(QStringLiteral("page 3")));
        QVERIFY(result.errorMessage.contains(QStringLiteral("simulated failure")));
        QCOMPARE(cache.size(), 1);
        QVERIFY(!cache.isInFlight(3, 100));

        QVERIFY(!cache.request(3, 100));
        QTRY_COMPARE(failed.count(), 1);
        QCOMPARE(failed.at(0).at(0).toInt(), 3);
        QCOMPARE(cache.size(), 1);
    }
};

#endif // PAGERASTERCACHETESTS_H
