#ifndef CLITESTS_H
#define CLITESTS_H

#include <QObject>
#include <QTest>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QImage>
#include <QTemporaryDir>
#include "CliHandler.h"
#include "CliParser.h"
#include "../core/BlockStore.h"
#include "../core/SelectionSession.h"
#include "../pdf/TestPdf.h"

/**
 * Tests for the headless export command: argument validation, exit codes
 * and files written.
 * Run with: blockcrop --test-cli
 */
class CliTests : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_dir;
    QString m_pdf;
    int m_single = 0;
    int m_disabled = 0;
    int m_group = 0;

    // Same as "blockcrop export <args>" after the command word is stripped
    static int runExport(const QStringList& args) {
        QCommandLineParser parser;
        Cli::setupParser(parser, Cli::Command::Export);
        if (!parser.parse(QStringList{QStringLiteral("blockcrop")} + args)) {
            return -1;
        }
        return Cli::handleExport(parser);
    }

    QString outDir(const QString& name) const {
        return m_dir.filePath(name);
    }

private slots:
    void initTestCase() {
        QVERIFY(m_dir.isValid());
        m_pdf = m_dir.filePath("doc.pdf");
        QVERIFY(TestPdf::write(m_pdf, 2));

        auto session = SelectionSession::openPdf(m_pdf);
        QVERIFY(session);
        BlockStore& store = session->store();
        m_single = store.create(0, TestPdf::markRect()).block.id;
        m_disabled = store.create(0, QRectF(300, 300, 100, 100)).block.id;
        store.toggle(m_disabled);
        int b1 = store.create(1, QRectF(0, 0, 100, 50)).block.id;
        int b2 = store.create(1, QRectF(0, 100, 100, 50)).block.id;
        m_group = store.group({b1, b2}).groupId;

        QString error;
        QVERIFY2(session->saveBlocks(&error), qPrintable(error));
    }

    void testParseCommand() {
        char app[] = "blockcrop";
        char exportWord[] = "export";
        char version[] = "--version";
        char file[] = "doc.pdf";

        char* gui[] = {app, file};
        char* cli[] = {app, exportWord, file};
        char* ver[] = {app, version};
        QVERIFY(Cli::parseCommand(1, gui) == Cli::Command::None);
        QVERIFY(Cli::parseCommand(2, gui) == Cli::Command::None);
        QVERIFY(Cli::parseCommand(3, cli) == Cli::Command::Export);
        QVERIFY(Cli::parseCommand(2, ver) == Cli::Command::Version);
        QVERIFY(Cli::isCliMode(3, cli));
        QVERIFY(!Cli::isCliMode(2, gui));
    }

    void testInvalidArguments() {
        const QString out = outDir("invalid");
        QCOMPARE(runExport({}), Cli::ExitCode::InvalidArgs);
        QCOMPARE(runExport({m_pdf}), Cli::ExitCode::InvalidArgs);
        QCOMPARE(runExport({m_pdf, "-o", out, "--dpi", "abc"}), Cli::ExitCode::InvalidArgs);
        QCOMPARE(runExport({m_pdf, "-o", out, "--dpi", "0"}), Cli::ExitCode::InvalidArgs);
        QCOMPARE(runExport({m_pdf, "-o", out, "--format", "nope"}), Cli::ExitCode::InvalidArgs);
        QCOMPARE(runExport({m_pdf, "-o", out, "--block", "x"}), Cli::ExitCode::InvalidArgs);
        QVERIFY(!QFileInfo::exists(out));
    }

    void testMissingInputs() {
        const QString out = outDir("missing");
        QCOMPARE(runExport({m_dir.filePath("nope.pdf"), "-o", out}), Cli::ExitCode::IoError);
        QCOMPARE(runExport({m_pdf, "-o", out, "--blocks", m_dir.filePath("nope.json")}),
                 Cli::ExitCode::IoError);
    }

    void testExportAll() {
        const QString out = outDir("all");
        QCOMPARE(runExport({m_pdf, "-o", out, "--dpi", "72", "--json"}), Cli::ExitCode::Success);

        QDir dir(out);
        QVERIFY(dir.exists(QStringLiteral("page1_block%1.png").arg(m_single)));
        QVERIFY(dir.exists(QStringLiteral("group%1.png").arg(m_group)));
        QVERIFY(!dir.exists(QStringLiteral("page1_block%1.png").arg(m_disabled)));
        QCOMPARE(dir.entryList(QDir::Files).size(), 2);

        QImage single(dir.filePath(QStringLiteral("page1_block%1.png").arg(m_single)));
        QCOMPARE(single.size(), QSize(144, 144));
    }

    void testIncludeDisabledIsSkipped() {
        const QString out = outDir("disabled");
        QCOMPARE(runExport({m_pdf, "-o", out, "--dpi", "72", "--include-disabled"}),
                 Cli::ExitCode::Success);
        QCOMPARE(QDir(out).entryList(QDir::Files).size(), 2);
    }

    void testSelectedUnits() {
        const QString out = outDir("selected");
        QCOMPARE(runExport({m_pdf, "-o", out, "--dpi", "72", "--group", QString::number(m_group)}),
                 Cli::ExitCode::Success);
        QCOMPARE(QDir(out).entryList(QDir::Files),
                 QStringList({QStringLiteral("group%1.png").arg(m_group)}));

        // One good unit and one unknown id
        const QString partial = outDir("partial");
        QCOMPARE(runExport({m_pdf, "-o", partial, "--dpi", "72",
                            "--block", QString::number(m_single), "--block", "999"}),
                 Cli::ExitCode::PartialFailure);

        QCOMPARE(runExport({m_pdf, "-o", outDir("none"), "--block", "999"}),
                 Cli::ExitCode::TotalFailure);
    }

    void testDryRunWritesNothing() {
        QCOMPARE(runExport({m_pdf, "--dry-run", "--dpi", "72", "--verbose"}), Cli::ExitCode::Success);

        const QString out = outDir("dry");
        QCOMPARE(runExport({m_pdf, "-o", out, "--dry-run", "--dpi", "72"}), Cli::ExitCode::Success);
        QVERIFY(!QFileInfo::exists(out));
    }

    void testExitCodeFromSummary() {
        Cli::ExportSummary summary;
        QCOMPARE(Cli::exitCodeFromSummary(summary), Cli::ExitCode::Success);
        summary.skippedCount = 1;
        QCOMPARE(Cli::exitCodeFromSummary(summary), Cli::ExitCode::Success);
        summary.errorCount = 1;
        QCOMPARE(Cli::exitCodeFromSummary(summary), Cli::ExitCode::PartialFailure);
        summary.skippedCount = 0;
        QCOMPARE(Cli::exitCodeFromSummary(summary), Cli::ExitCode::TotalFailure);
    }
};

#endif // CLITESTS_H
