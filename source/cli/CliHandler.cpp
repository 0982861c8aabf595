#include "CliHandler.h"
#include "../core/BlockStore.h"
#include "../core/SelectionSession.h"
#include "../core/SessionConfig.h"
#include "../export/ExportWriter.h"

#include <QCoreApplication>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>

/**
 * @file CliHandler.cpp
 * @brief Implementation of CLI command handlers.
 *
 * @see CliHandler.h for API documentation
 */

namespace Cli {

// =============================================================================
// Helper Functions
// =============================================================================

OutputMode getOutputMode(const QCommandLineParser& parser)
{
    if (parser.isSet(QStringLiteral("json"))) {
        return OutputMode::Json;
    }
    if (parser.isSet(QStringLiteral("verbose"))) {
        return OutputMode::Verbose;
    }
    return OutputMode::Simple;
}

int exitCodeFromSummary(const ExportSummary& summary)
{
    if (summary.errorCount == 0) {
        return ExitCode::Success;
    }
    if (summary.successCount == 0 && summary.skippedCount == 0) {
        return ExitCode::TotalFailure;
    }
    return ExitCode::PartialFailure;
}

/**
 * Parse repeatable integer options (--block, --group).
 * Returns false if any value is not an integer.
 */
static bool parseIdList(const QStringList& values, QVector<int>* ids)
{
    for (const QString& value : values) {
        bool ok = false;
        int id = value.toInt(&ok);
        if (!ok) {
            return false;
        }
        ids->append(id);
    }
    return true;
}

// =============================================================================
// Export Handler
// =============================================================================

int handleExport(const QCommandLineParser& parser)
{
    OutputMode outputMode = getOutputMode(parser);
    ConsoleProgress progress(outputMode);

    // ----- Arguments -----
    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Exactly one PDF file is required. Use 'blockcrop export --help' for usage."));
        return ExitCode::InvalidArgs;
    }
    const QString pdfPath = QDir::cleanPath(QDir::current().absoluteFilePath(positional.first()));

    const bool dryRun = parser.isSet(QStringLiteral("dry-run"));
    QString outputDir = parser.value(QStringLiteral("output"));
    if (outputDir.isEmpty() && !dryRun) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Output directory required. Use -o or --output to specify destination."));
        return ExitCode::InvalidArgs;
    }
    if (!outputDir.isEmpty()) {
        outputDir = QDir::cleanPath(QDir::current().absoluteFilePath(outputDir));
    }

    const QString format = parser.value(QStringLiteral("format")).toLower();
    if (!ExportWriter::isFormatSupported(format)) {
        progress.reportError(QCoreApplication::translate("CLI", "Unsupported image format: %1").arg(format));
        return ExitCode::InvalidArgs;
    }

    qreal dpi = 0;
    if (parser.isSet(QStringLiteral("dpi"))) {
        bool dpiOk = false;
        dpi = parser.value(QStringLiteral("dpi")).toDouble(&dpiOk);
        if (!dpiOk || dpi <= 0) {
            progress.reportError(QCoreApplication::translate("CLI", "Invalid DPI: %1")
                                     .arg(parser.value(QStringLiteral("dpi"))));
            return ExitCode::InvalidArgs;
        }
    }

    QVector<int> blockIds;
    QVector<int> groupIds;
    if (!parseIdList(parser.values(QStringLiteral("block")), &blockIds)
        || !parseIdList(parser.values(QStringLiteral("group")), &groupIds)) {
        progress.reportError(QCoreApplication::translate("CLI", "Block and group ids must be integers."));
        return ExitCode::InvalidArgs;
    }

    // ----- Open document and blocks -----
    if (!QFileInfo::exists(pdfPath)) {
        progress.reportError(QCoreApplication::translate("CLI", "File not found: %1").arg(pdfPath));
        return ExitCode::IoError;
    }

    SessionConfig config = SessionConfig::load();
    QString error;
    std::unique_ptr<SelectionSession> session = SelectionSession::openPdf(pdfPath, config, &error);
    if (!session) {
        progress.reportError(error);
        return ExitCode::IoError;
    }

    QString blocksPath = parser.value(QStringLiteral("blocks"));
    blocksPath = blocksPath.isEmpty()
        ? session->blocksPath()
        : QDir::cleanPath(QDir::current().absoluteFilePath(blocksPath));
    if (!session->store().load(blocksPath, &error)) {
        progress.reportError(QCoreApplication::translate("CLI", "Cannot read block data %1: %2")
                                 .arg(blocksPath, error));
        return ExitCode::IoError;
    }

    // ----- Export -----
    QElapsedTimer timer;
    timer.start();

    QVector<ExportResult> results;
    if (blockIds.isEmpty() && groupIds.isEmpty()) {
        results = session->exportAll(!parser.isSet(QStringLiteral("include-disabled")), dpi);
    } else {
        for (int id : blockIds) {
            results.append(session->exportSingle(id, dpi));
        }
        for (int id : groupIds) {
            results.append(session->exportGroup(id, dpi));
        }
    }

    if (results.isEmpty()) {
        progress.reportWarning(QCoreApplication::translate("CLI", "No enabled blocks to export."));
    }

    ExportSummary summary;
    for (int i = 0; i < results.size(); ++i) {
        const ExportResult& result = results[i];
        UnitStatus status = UnitStatus::Success;
        QString outputPath;
        QString message;

        if (result.error == BlockError::EmptyExport) {
            status = UnitStatus::Skipped;
            message = result.errorMessage;
        } else if (!result.success()) {
            status = UnitStatus::Error;
            message = result.errorMessage;
        } else if (!dryRun) {
            if (!ExportWriter::write(result, outputDir, format, &outputPath, &message)) {
                status = UnitStatus::Error;
            }
        }

        switch (status) {
            case UnitStatus::Success: summary.successCount++; break;
            case UnitStatus::Skipped: summary.skippedCount++; break;
            case UnitStatus::Error:   summary.errorCount++; break;
        }
        progress.reportUnit(i + 1, results.size(), result, status, outputPath, message);
    }

    summary.elapsedMs = timer.elapsed();
    progress.reportSummary(summary, dryRun);

    session->close();
    return exitCodeFromSummary(summary);
}

} // namespace Cli
