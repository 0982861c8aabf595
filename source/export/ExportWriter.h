#pragma once

// ============================================================================
// ExportWriter - Persists export results as image files
// ============================================================================
// Each successful ExportResult becomes "<directory>/<name>.<format>".
// Failed units and write errors are logged and counted, never fatal.
// ============================================================================

#include "ExportComposer.h"

#include <QString>
#include <QStringList>
#include <QVector>

/**
 * @brief Summary of a batch write.
 */
struct ExportWriteSummary {
    int written = 0;            ///< Files written
    int skipped = 0;            ///< Units without enabled blocks (EmptyExport)
    int failed = 0;             ///< Composer errors and files that could not be written
    QStringList writtenFiles;
    QStringList errors;         ///< One message per failed unit

    bool allSucceeded() const { return failed == 0; }
};

class ExportWriter {
public:
    /**
     * @brief Write one result.
     * @param format Image format understood by QImageWriter ("png", "jpg", ...).
     * @param outputPath If non-null, receives the written file path.
     * @return False if the result failed or the file could not be written.
     */
    static bool write(const ExportResult& result, const QString& directory,
                      const QString& format = QStringLiteral("png"),
                      QString* outputPath = nullptr, QString* errorMessage = nullptr);

    static ExportWriteSummary writeAll(const QVector<ExportResult>& results,
                                       const QString& directory,
                                       const QString& format = QStringLiteral("png"));

    /**
     * @brief Check that QImageWriter can produce the format.
     */
    static bool isFormatSupported(const QString& format);
};
