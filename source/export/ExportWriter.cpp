#include "ExportWriter.h"

#include <QDir>
#include <QImageWriter>
#include <QDebug>

bool ExportWriter::isFormatSupported(const QString& format)
{
    return QImageWriter::supportedImageFormats().contains(format.toLower().toLatin1());
}

bool ExportWriter::write(const ExportResult& result, const QString& directory,
                         const QString& format, QString* outputPath, QString* errorMessage)
{
    if (!result.success()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1: %2 (%3)")
                                .arg(result.name, result.errorMessage, blockErrorName(result.error));
        }
        return false;
    }

    QDir dir(directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qWarning() << "ExportWriter: Cannot create output directory" << directory;
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot create directory %1").arg(directory);
        }
        return false;
    }

    const QString suffix = format.toLower();
    const QString path = dir.filePath(result.name + QLatin1Char('.') + suffix);

    QImageWriter writer(path, suffix.toLatin1());
    if (!writer.write(result.buffer.image)) {
        qWarning() << "ExportWriter: Failed to write" << path << writer.errorString();
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1: %2").arg(path, writer.errorString());
        }
        return false;
    }

    if (outputPath) {
        *outputPath = path;
    }
    return true;
}

ExportWriteSummary ExportWriter::writeAll(const QVector<ExportResult>& results,
                                          const QString& directory, const QString& format)
{
    ExportWriteSummary summary;

    for (const ExportResult& result : results) {
        QString path;
        QString error;
        if (write(result, directory, format, &path, &error)) {
            summary.written++;
            summary.writtenFiles.append(path);
        } else if (result.error == BlockError::EmptyExport) {
            summary.skipped++;
        } else {
            summary.failed++;
            summary.errors.append(error);
        }
    }

    qDebug() << "ExportWriter: Wrote" << summary.written << "files to" << directory
             << "(" << summary.skipped << "skipped," << summary.failed << "failed)";
    return summary;
}
