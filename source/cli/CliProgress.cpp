#include "CliProgress.h"

#include <QCoreApplication>
#include <QJsonDocument>
#include <QJsonObject>

/**
 * @file CliProgress.cpp
 * @brief Implementation of the console export reporter.
 *
 * @see CliProgress.h for API documentation
 */

namespace Cli {

ConsoleProgress::ConsoleProgress(OutputMode mode)
    : m_mode(mode)
    , m_out(stdout)
    , m_err(stderr)
{
}

// =============================================================================
// Unit Reporting
// =============================================================================

void ConsoleProgress::reportUnit(int index, int total, const ExportResult& result, UnitStatus status,
                                 const QString& outputPath, const QString& message)
{
    const QSize size = result.buffer.image.size();

    if (m_mode == OutputMode::Json) {
        // {"type":"unit","name":"group2","status":"success","output":"...","width":188,"height":83,"dpi":300}
        QJsonObject obj;
        obj["type"] = QStringLiteral("unit");
        obj["name"] = result.name;
        obj["status"] = statusString(status);
        obj["output"] = outputPath;
        if (status == UnitStatus::Success) {
            obj["width"] = size.width();
            obj["height"] = size.height();
            obj["dpi"] = result.buffer.dpi;
        }
        if (!message.isEmpty()) {
            obj["error"] = blockErrorName(result.error);
            obj["message"] = message;
        }
        writeJsonLine(obj, m_out);
        return;
    }

    if (m_mode == OutputMode::Verbose) {
        m_out << QStringLiteral("[%1/%2] %3\n").arg(index).arg(total).arg(result.name);
        if (!outputPath.isEmpty()) {
            m_out << QCoreApplication::translate("CLI", "  Output: ") << outputPath << "\n";
        }
        m_out << QCoreApplication::translate("CLI", "  Status: ");
        switch (status) {
            case UnitStatus::Success:
                m_out << QCoreApplication::translate("CLI", "Success")
                      << QStringLiteral(" (%1x%2 px at %3 dpi)")
                             .arg(size.width()).arg(size.height()).arg(result.buffer.dpi);
                break;
            case UnitStatus::Skipped:
                m_out << QCoreApplication::translate("CLI", "Skipped") << " - " << message;
                break;
            case UnitStatus::Error:
                m_out << QCoreApplication::translate("CLI", "Error") << " - " << message;
                break;
        }
        m_out << "\n\n";
        m_out.flush();
        return;
    }

    // [1/4] page1_block3... OK (188x83)
    QString statusStr;
    switch (status) {
        case UnitStatus::Success:
            statusStr = QCoreApplication::translate("CLI", "OK")
                      + QStringLiteral(" (%1x%2)").arg(size.width()).arg(size.height());
            break;
        case UnitStatus::Skipped:
            statusStr = QCoreApplication::translate("CLI", "SKIPPED") + QStringLiteral(" (%1)").arg(message);
            break;
        case UnitStatus::Error:
            statusStr = QCoreApplication::translate("CLI", "ERROR") + QStringLiteral(": %1").arg(message);
            break;
    }

    m_out << QStringLiteral("[%1/%2] %3... %4\n").arg(index).arg(total).arg(result.name, statusStr);
    m_out.flush();
}

// =============================================================================
// Summary Reporting
// =============================================================================

void ConsoleProgress::reportSummary(const ExportSummary& summary, bool dryRun)
{
    if (m_mode == OutputMode::Json) {
        QJsonObject obj;
        obj["type"] = QStringLiteral("summary");
        obj["total"] = summary.totalCount();
        obj["success"] = summary.successCount;
        obj["skipped"] = summary.skippedCount;
        obj["errors"] = summary.errorCount;
        obj["elapsed_ms"] = summary.elapsedMs;
        obj["dry_run"] = dryRun;
        writeJsonLine(obj, m_out);
        return;
    }

    m_out << "\n";
    if (dryRun) {
        m_out << QCoreApplication::translate("CLI", "=== Dry Run Summary ===\n");
    } else {
        m_out << QCoreApplication::translate("CLI", "=== Summary ===\n");
    }

    m_out << QCoreApplication::translate("CLI", "Total:    ")
          << summary.totalCount() << QCoreApplication::translate("CLI", " units\n");
    m_out << QCoreApplication::translate("CLI", "Success:  ") << summary.successCount << "\n";
    if (summary.skippedCount > 0) {
        m_out << QCoreApplication::translate("CLI", "Skipped:  ") << summary.skippedCount << "\n";
    }
    if (summary.errorCount > 0) {
        m_out << QCoreApplication::translate("CLI", "Errors:   ") << summary.errorCount << "\n";
    }
    m_out << QCoreApplication::translate("CLI", "Time:     ")
          << formatDuration(summary.elapsedMs) << "\n";
    m_out.flush();
}

// =============================================================================
// Error/Warning Reporting
// =============================================================================

void ConsoleProgress::reportError(const QString& message)
{
    if (m_mode == OutputMode::Json) {
        QJsonObject obj;
        obj["type"] = QStringLiteral("error");
        obj["message"] = message;
        writeJsonLine(obj, m_err);
        return;
    }
    m_err << QCoreApplication::translate("CLI", "Error: ") << message << "\n";
    m_err.flush();
}

void ConsoleProgress::reportWarning(const QString& message)
{
    if (m_mode == OutputMode::Json) {
        QJsonObject obj;
        obj["type"] = QStringLiteral("warning");
        obj["message"] = message;
        writeJsonLine(obj, m_err);
        return;
    }
    m_err << QCoreApplication::translate("CLI", "Warning: ") << message << "\n";
    m_err.flush();
}

// =============================================================================
// Utility Functions
// =============================================================================

void ConsoleProgress::writeJsonLine(const QJsonObject& obj, QTextStream& stream)
{
    stream << QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact)) << "\n";
    stream.flush();
}

QString ConsoleProgress::statusString(UnitStatus status)
{
    switch (status) {
        case UnitStatus::Success: return QStringLiteral("success");
        case UnitStatus::Skipped: return QStringLiteral("skipped");
        case UnitStatus::Error:   return QStringLiteral("error");
    }
    return QStringLiteral("unknown");
}

QString ConsoleProgress::formatDuration(qint64 ms)
{
    if (ms < 1000) {
        return QStringLiteral("%1 ms").arg(ms);
    }
    if (ms < 60 * 1000) {
        return QStringLiteral("%1 s").arg(ms / 1000.0, 0, 'f', 1);
    }
    qint64 minutes = ms / (60 * 1000);
    qint64 seconds = (ms % (60 * 1000)) / 1000;
    return QStringLiteral("%1m %2s").arg(minutes).arg(seconds);
}

} // namespace Cli
