#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handlers for headless block export.
 *
 * Each handler parses command-specific options, runs the operation and
 * reports results through ConsoleProgress.
 */

#include "CliParser.h"
#include "CliProgress.h"

#include <QCommandLineParser>

namespace Cli {

/**
 * @brief Handle the export command.
 *
 * Opens the PDF, loads its block data, exports the requested units (all
 * enabled units by default) and writes one image per unit.
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleExport(const QCommandLineParser& parser);

/**
 * @brief Determine the output mode from parser options.
 *
 * Priority: --json > --verbose > Simple
 */
OutputMode getOutputMode(const QCommandLineParser& parser);

/**
 * @brief Map a run summary to an exit code.
 *
 * - Nothing failed → Success (0)
 * - Some units failed → PartialFailure (1)
 * - Every unit failed → TotalFailure (2)
 */
int exitCodeFromSummary(const ExportSummary& summary);

} // namespace Cli

#endif // CLIHANDLER_H
