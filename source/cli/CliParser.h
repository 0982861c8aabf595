#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line argument parsing for headless block export.
 *
 * When the first argument is a known command, BlockCrop runs without the
 * GUI and exits with one of the ExitCode values.
 *
 * Supported commands:
 * - export: Crop the saved blocks of a PDF into image files
 */

#include <QString>
#include <QStringList>
#include <QCommandLineParser>

class QCoreApplication;

namespace Cli {

// =============================================================================
// CLI Commands
// =============================================================================

/**
 * @brief Known CLI commands.
 */
enum class Command {
    None,           ///< No command - launch GUI
    Help,           ///< Show help message
    Version,        ///< Show version information
    Export          ///< Export blocks of a PDF to images
};

/**
 * @brief Output mode for CLI progress/results.
 */
enum class OutputMode {
    Simple,         ///< One line per export unit (default)
    Verbose,        ///< Sizes, resolution and output paths
    Json            ///< JSON lines for scripting
};

// =============================================================================
// Exit Codes
// =============================================================================

/**
 * @brief Exit codes for CLI operations.
 */
namespace ExitCode {
    constexpr int Success = 0;        ///< All units exported
    constexpr int PartialFailure = 1; ///< Some units failed
    constexpr int TotalFailure = 2;   ///< Every unit failed
    constexpr int InvalidArgs = 3;    ///< Bad command line arguments
    constexpr int IoError = 4;        ///< Can't read the PDF/block data or write output
}

// =============================================================================
// CLI Detection
// =============================================================================

/**
 * @brief Quick check if the application should run in CLI mode.
 *
 * Looks only at argv[1]; safe to call before any Qt application exists.
 */
bool isCliMode(int argc, char* argv[]);

/**
 * @brief Parse the command keyword from argv[1].
 * @return The detected command, or Command::None for GUI mode
 */
Command parseCommand(int argc, char* argv[]);

/**
 * @brief Get command name as string (e.g. "export").
 */
QString commandName(Command cmd);

// =============================================================================
// Parser Setup
// =============================================================================

/**
 * @brief Configure QCommandLineParser for a specific command.
 */
void setupParser(QCommandLineParser& parser, Command cmd);

/**
 * @brief Print help for a command (general help for Command::None).
 */
void showHelp(const QCommandLineParser& parser, Command cmd);

/**
 * @brief Print version information.
 */
void showVersion();

// =============================================================================
// Main Entry Point
// =============================================================================

/**
 * @brief Run CLI operations.
 *
 * Parses arguments, executes the requested command and returns an exit
 * code (see ExitCode namespace).
 */
int run(QCoreApplication& app, int argc, char* argv[]);

} // namespace Cli

#endif // CLIPARSER_H
