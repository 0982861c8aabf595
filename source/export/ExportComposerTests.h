#ifndef EXPORTCOMPOSERTESTS_H
#define EXPORTCOMPOSERTESTS_H

#include <QObject>
#include <QTest>
#include <QDir>
#include <QImageReader>
#include <QPainter>
#include <QTemporaryDir>
#include <memory>
#include "ExportComposer.h"
#include "ExportWriter.h"
#include "MergeLayout.h"
#include "../core/BlockStore.h"
#include "../core/PageRasterCache.h"
#include "../core/SessionConfig.h"
#include "../core/TestRasterizer.h"

/**
 * Unit tests for ExportComposer, VerticalStackLayout and ExportWriter.
 * Run with: blockcrop --test-export
 */
class ExportComposerTests : public QObject {
    Q_OBJECT

private:
    // Places segments left to right, top aligned, with no gap
    class SideBySideLayout : public MergeLayout {
    public:
        QImage compose(const QVector<QImage>& segments) const override {
            if (segments.isEmpty()) {
                return QImage();
            }
            int width = 0;
            int height = 0;
            for (const QImage& segment : segments) {
                width += segment.width();
                height = qMax(height, segment.height());
            }
            QImage merged(width, height, QImage::Format_ARGB32);
            merged.fill(Qt::white);
            QPainter painter(&merged);
            int x = 0;
            for (const QImage& segment : segments) {
                painter.drawImage(x, 0, segment);
                x += segment.width();
            }
            return merged;
        }
    };

    struct Fixture {
        std::shared_ptr<TestRasterizer> rasterizer;
        SessionConfig config;
        PageRasterCache cache;
        BlockStore store;
        ExportComposer composer;

        Fixture()
            : rasterizer(std::make_shared<TestRasterizer>(QVector<QSizeF>(3, QSizeF(612, 792))))
            , cache(rasterizer)
            , composer(cache, config)
        {
            store.setPageBounds(QVector<QSizeF>(3, QSizeF(612, 792)));
        }

        int create(int page, const QRectF& rect) {
            return store.create(page, rect).block.id;
        }
    };

private slots:
    void testSingleCropSize() {
        Fixture f;
        int id = f.create(0, QRectF(QPointF(10, 10), QPointF(100, 50)));

        ExportResult result = f.composer.exportSingle(f.store.snapshot(), id, 150);
        QVERIFY2(result.success(), qPrintable(result.errorMessage));
        QCOMPARE(result.name, QStringLiteral("page1_block%1").arg(id));
        QCOMPARE(result.blockId, id);
        QCOMPARE(result.buffer.dpi, 150.0);
        QCOMPARE(result.buffer.image.size(), QSize(188, 83));
        QCOMPARE(result.buffer.image.pixelColor(5, 5), TestRasterizer::pageColor(0));
    }

    void testDpiResolution() {
        Fixture f;
        int id = f.create(0, QRectF(0, 0, 72, 72));

        // Nothing cached: default export DPI
        ExportResult fallback = f.composer.exportSingle(f.store.snapshot(), id);
        QCOMPARE(fallback.buffer.dpi, f.config.exportDpi);
        QCOMPARE(fallback.buffer.image.width(), qRound(f.config.exportDpi));

        // Cached page: reuse its resolution
        QVERIFY(f.cache.ensure(0, 144).success());
        ExportResult reuse = f.composer.exportSingle(f.store.snapshot(), id);
        QCOMPARE(reuse.buffer.dpi, 144.0);
        QCOMPARE(reuse.buffer.image.size(), QSize(144, 144));
    }

    void testGroupStacksVertically() {
        Fixture f;
        int b1 = f.create(0, QRectF(0, 0, 100, 40));
        int b2 = f.create(1, QRectF(0, 0, 150, 60));
        int groupId = f.store.group({b1, b2}).groupId;

        ExportResult result = f.composer.exportGroup(f.store.snapshot(), groupId, 72);
        QVERIFY2(result.success(), qPrintable(result.errorMessage));
        QCOMPARE(result.name, QStringLiteral("group%1").arg(groupId));
        QCOMPARE(result.groupId, groupId);

        const QImage& image = result.buffer.image;
        QCOMPARE(image.width(), 150);
        QCOMPARE(image.height(), 40 + f.config.separatorMargin + 60);

        QCOMPARE(image.pixelColor(5, 5), TestRasterizer::pageColor(0));
        QCOMPARE(image.pixelColor(120, 10), QColor(Qt::white));
        QCOMPARE(image.pixelColor(5, 45), QColor(Qt::white));
        QCOMPARE(image.pixelColor(140, 40 + f.config.separatorMargin + 5), TestRasterizer::pageColor(1));
    }

    void testCustomMergeLayout() {
        Fixture f;
        ExportComposer composer(f.cache, f.config, std::make_unique<SideBySideLayout>());
        int b1 = f.create(0, QRectF(0, 0, 100, 40));
        int b2 = f.create(1, QRectF(0, 0, 150, 60));
        int groupId = f.store.group({b1, b2}).groupId;

        ExportResult result = composer.exportGroup(f.store.snapshot(), groupId, 72);
        QVERIFY2(result.success(), qPrintable(result.errorMessage));
        QCOMPARE(result.buffer.image.size(), QSize(250, 60));
        QCOMPARE(result.buffer.image.pixelColor(5, 5), TestRasterizer::pageColor(0));
        QCOMPARE(result.buffer.image.pixelColor(5, 50), QColor(Qt::white));
        QCOMPARE(result.buffer.image.pixelColor(105, 50), TestRasterizer::pageColor(1));

        // The default composer still stacks vertically
        QCOMPARE(f.composer.exportGroup(f.store.snapshot(), groupId, 72).buffer.image.size(),
                 QSize(150, 40 + f.config.separatorMargin + 60));
    }

    void testGroupSkipsDisabledMember() {
        Fixture f;
        int b1 = f.create(0, QRectF(0, 0, 100, 40));
        int b2 = f.create(1, QRectF(0, 0, 150, 60));
        int groupId = f.store.group({b1, b2}).groupId;
        f.store.toggle(b1);

        ExportResult group = f.composer.exportGroup(f.store.snapshot(), groupId, 72);
        ExportResult single = f.composer.exportSingle(f.store.snapshot(), b2, 72);
        QVERIFY(group.success());
        QVERIFY(single.success());
        QCOMPARE(group.buffer.image.size(), QSize(150, 60));
        QCOMPARE(group.buffer.image, single.buffer.image);
    }

    void testGroupDpiFollowsFirstEnabledMember() {
        Fixture f;
        int b1 = f.create(0, QRectF(0, 0, 72, 72));
        int b2 = f.create(1, QRectF(0, 0, 72, 72));
        int groupId = f.store.group({b1, b2}).groupId;
        f.store.toggle(b1);

        QVERIFY(f.cache.ensure(0, 100).success());
        QVERIFY(f.cache.ensure(1, 200).success());

        ExportResult result = f.composer.exportGroup(f.store.snapshot(), groupId);
        QVERIFY(result.success());
        QCOMPARE(result.buffer.dpi, 200.0);
        QCOMPARE(result.buffer.pageIndex, 1);
    }

    void testGroupAfterMemberRemoved() {
        Fixture f;
        int b1 = f.create(0, QRectF(0, 0, 100, 40));
        int b2 = f.create(1, QRectF(0, 0, 150, 60));
        int groupId = f.store.group({b1, b2}).groupId;

        f.store.remove(b1);
        QVERIFY(f.composer.exportGroup(f.store.snapshot(), groupId, 72).success());

        f.store.toggle(b2);
        QCOMPARE(f.composer.exportGroup(f.store.snapshot(), groupId, 72).error, BlockError::EmptyExport);
    }

    void testMissingAndDisabled() {
        Fixture f;
        int id = f.create(0, QRectF(0, 0, 50, 50));
        f.store.toggle(id);

        QCOMPARE(f.composer.exportSingle(f.store.snapshot(), 999).error, BlockError::NotFound);
        QCOMPARE(f.composer.exportGroup(f.store.snapshot(), 999).error, BlockError::NotFound);
        QCOMPARE(f.composer.exportSingle(f.store.snapshot(), id).error, BlockError::EmptyExport);
        QCOMPARE(f.rasterizer->startedCount(), 0);
    }

    void testExportAllOrder() {
        Fixture f;
        int a = f.create(0, QRectF(0, 0, 50, 50));
        int b1 = f.create(1, QRectF(0, 0, 50, 50));
        int disabled = f.create(0, QRectF(100, 100, 50, 50));
        int b2 = f.create(2, QRectF(0, 0, 50, 50));
        int c = f.create(2, QRectF(100, 100, 50, 50));
        int groupId = f.store.group({b2, b1}).groupId;
        f.store.toggle(disabled);

        QVector<ExportResult> results = f.composer.exportAll(f.store.snapshot(), true, 72);
        QCOMPARE(results.size(), 3);
        QCOMPARE(results[0].blockId, a);
        QCOMPARE(results[1].groupId, groupId);
        QCOMPARE(results[2].blockId, c);
        for (const ExportResult& result : results) {
            QVERIFY(result.success());
        }

        QVector<ExportResult> everything = f.composer.exportAll(f.store.snapshot(), false, 72);
        QCOMPARE(everything.size(), 4);
        QCOMPARE(everything[2].blockId, disabled);
        QCOMPARE(everything[2].error, BlockError::EmptyExport);
    }

    void testRasterFailureIsPerUnit() {
        Fixture f;
        f.rasterizer->setFailing(1);
        int good = f.create(0, QRectF(0, 0, 50, 50));
        int bad = f.create(1, QRectF(0, 0, 50, 50));

        QVector<ExportResult> results = f.composer.exportAll(f.store.snapshot(), true, 72);
        QCOMPARE(results.size(), 2);
        QCOMPARE(results[0].blockId, good);
        QVERIFY(results[0].success());
        QCOMPARE(results[1].blockId, bad);
        QCOMPARE(results[1].error, BlockError::RasterizationError);
        QVERIFY(results[1].errorMessage.contains(QStringLiteral("page 1")));
    }

    void testStackLayoutEdges() {
        VerticalStackLayout layout(8);
        QVERIFY(layout.compose({}).isNull());

        QImage only(30, 20, QImage::Format_ARGB32);
        only.fill(Qt::red);
        QCOMPARE(layout.compose({only}), only);

        QImage wide(50, 10, QImage::Format_ARGB32);
        wide.fill(Qt::blue);
        QImage merged = layout.compose({only, wide});
        QCOMPARE(merged.size(), QSize(50, 20 + 8 + 10));
        QCOMPARE(merged.pixelColor(40, 5), QColor(Qt::white));
        QCOMPARE(merged.pixelColor(40, 30), QColor(Qt::blue));
    }

    void testWriterWritesUnits() {
        Fixture f;
        int a = f.create(0, QRectF(0, 0, 50, 40));
        int disabled = f.create(0, QRectF(100, 100, 50, 50));
        f.store.toggle(disabled);

        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString outDir = dir.filePath("nested/out");

        QVector<ExportResult> results = f.composer.exportAll(f.store.snapshot(), false, 72);
        ExportWriteSummary summary = ExportWriter::writeAll(results, outDir);

        QCOMPARE(summary.written, 1);
        QCOMPARE(summary.skipped, 1);
        QCOMPARE(summary.failed, 0);
        QVERIFY(summary.errors.isEmpty());
        QVERIFY(summary.allSucceeded());

        const QString expected = QDir(outDir).filePath(QStringLiteral("page1_block%1.png").arg(a));
        QCOMPARE(summary.writtenFiles, QStringList({expected}));
        QImageReader reader(expected);
        QCOMPARE(reader.size(), QSize(50, 40));
    }

    void testWriterCountsComposerErrorsAsFailed() {
        Fixture f;
        f.rasterizer->setFailing(1);
        f.create(0, QRectF(0, 0, 50, 40));
        f.create(1, QRectF(0, 0, 50, 40));
        int disabled = f.create(2, QRectF(0, 0, 50, 40));
        f.store.toggle(disabled);

        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        QVector<ExportResult> results = f.composer.exportAll(f.store.snapshot(), false, 72);
        results.append(f.composer.exportSingle(f.store.snapshot(), 999, 72));
        ExportWriteSummary summary = ExportWriter::writeAll(results, dir.path());

        QCOMPARE(summary.written, 1);
        QCOMPARE(summary.skipped, 1);
        QCOMPARE(summary.failed, 2);
        QCOMPARE(summary.errors.size(), 2);
        QVERIFY(summary.errors.at(0).contains(QStringLiteral("page 1")));
        QVERIFY(!summary.allSucceeded());
    }

    void testWriterFormats() {
        QVERIFY(ExportWriter::isFormatSupported(QStringLiteral("png")));
        QVERIFY(ExportWriter::isFormatSupported(QStringLiteral("PNG")));
        QVERIFY(!ExportWriter::isFormatSupported(QStringLiteral("nope")));
    }
};

#endif // EXPORTCOMPOSERTESTS_H
