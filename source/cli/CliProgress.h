#ifndef CLIPROGRESS_H
#define CLIPROGRESS_H

/**
 * @file CliProgress.h
 * @brief Console reporter for headless block export.
 *
 * Supports three output modes:
 * - Simple: One line per unit (`[1/4] page1_block3... OK (188x83)`)
 * - Verbose: Output path, size and resolution per unit
 * - JSON: One compact JSON object per line for scripting
 */

#include "CliParser.h"
#include "../export/ExportComposer.h"

#include <QJsonObject>
#include <QTextStream>

namespace Cli {

/**
 * @brief Outcome of one export unit as seen by the CLI.
 */
enum class UnitStatus {
    Success,
    Skipped,        ///< No enabled blocks (EmptyExport)
    Error
};

/**
 * @brief Totals for the run.
 */
struct ExportSummary {
    int successCount = 0;
    int skippedCount = 0;
    int errorCount = 0;
    qint64 elapsedMs = 0;

    int totalCount() const { return successCount + skippedCount + errorCount; }
};

class ConsoleProgress {
public:
    explicit ConsoleProgress(OutputMode mode = OutputMode::Simple);

    /**
     * @brief Report one finished unit.
     * @param index 1-based position of the unit.
     * @param outputPath Written file, empty if nothing was written.
     * @param message Failure reason (composer or writer).
     */
    void reportUnit(int index, int total, const ExportResult& result, UnitStatus status,
                    const QString& outputPath, const QString& message);

    void reportSummary(const ExportSummary& summary, bool dryRun);

    void reportError(const QString& message);
    void reportWarning(const QString& message);

    static QString statusString(UnitStatus status);

private:
    void writeJsonLine(const QJsonObject& obj, QTextStream& stream);

    static QString formatDuration(qint64 ms);

    OutputMode m_mode;
    QTextStream m_out;      ///< stdout stream
    QTextStream m_err;      ///< stderr stream
};

} // namespace Cli

#endif // CLIPROGRESS_H
