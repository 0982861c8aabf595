#include "CliParser.h"
#include "CliHandler.h"
#include "../pdf/PdfProvider.h"

#include <QCoreApplication>
#include <QTextStream>
#include <cstring>

/**
 * @file CliParser.cpp
 * @brief Implementation of CLI argument parsing.
 *
 * @see CliParser.h for API documentation
 */

namespace Cli {

// Application version (matches CMakeLists.txt project VERSION)
static const char* APP_VERSION = "0.3.0";

// =============================================================================
// CLI Detection
// =============================================================================

bool isCliMode(int argc, char* argv[])
{
    return parseCommand(argc, argv) != Command::None;
}

Command parseCommand(int argc, char* argv[])
{
    if (argc < 2) {
        return Command::None;
    }

    const char* arg1 = argv[1];

    if (std::strcmp(arg1, "export") == 0) {
        return Command::Export;
    }

    // Global flags (e.g., "blockcrop --help" or "blockcrop -v")
    if (std::strcmp(arg1, "--help") == 0 || std::strcmp(arg1, "-h") == 0) {
        return Command::Help;
    }
    if (std::strcmp(arg1, "--version") == 0 || std::strcmp(arg1, "-v") == 0) {
        return Command::Version;
    }

    return Command::None;
}

QString commandName(Command cmd)
{
    switch (cmd) {
        case Command::Export:  return QStringLiteral("export");
        case Command::Help:    return QStringLiteral("help");
        case Command::Version: return QStringLiteral("version");
        default:               return QString();
    }
}

// =============================================================================
// Parser Setup
// =============================================================================

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "BlockCrop - Select regions of PDF pages and export them as images"));

    parser.addHelpOption();
    parser.addVersionOption();

    if (cmd != Command::Export) {
        return;
    }

    parser.addPositionalArgument(
        QStringLiteral("pdf"),
        QCoreApplication::translate("CLI", "PDF file whose blocks are exported"),
        QStringLiteral("<pdf>"));

    parser.addOption(QCommandLineOption(
        {QStringLiteral("o"), QStringLiteral("output")},
        QCoreApplication::translate("CLI", "Output directory"),
        QStringLiteral("dir")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("blocks"),
        QCoreApplication::translate("CLI", "Block data file (default: <pdf>.blocks.json)"),
        QStringLiteral("file")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("dpi"),
        QCoreApplication::translate("CLI", "Export DPI (default: from settings, 300)"),
        QStringLiteral("N")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("block"),
        QCoreApplication::translate("CLI", "Export only this block (repeatable)"),
        QStringLiteral("id")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("group"),
        QCoreApplication::translate("CLI", "Export only this group (repeatable)"),
        QStringLiteral("id")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("include-disabled"),
        QCoreApplication::translate("CLI", "Report units without enabled blocks as skipped")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("format"),
        QCoreApplication::translate("CLI", "Image format (default: png)"),
        QStringLiteral("fmt"),
        QStringLiteral("png")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("verbose"),
        QCoreApplication::translate("CLI", "Show detailed progress")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("json"),
        QCoreApplication::translate("CLI", "Output results as JSON")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("dry-run"),
        QCoreApplication::translate("CLI", "Compose images without writing files")));
}

// =============================================================================
// Help and Version
// =============================================================================

void showHelp(const QCommandLineParser& parser, Command cmd)
{
    QTextStream out(stdout);

    if (cmd == Command::None || cmd == Command::Help) {
        out << QCoreApplication::translate("CLI",
            "Usage: blockcrop [command] [options] [files...]\n"
            "\n"
            "BlockCrop - Select regions of PDF pages and export them as images.\n"
            "\n"
            "COMMANDS:\n"
            "  export          Export the saved blocks of a PDF\n"
            "  (no command)    Launch GUI application\n"
            "\n"
            "GLOBAL OPTIONS:\n"
            "  -h, --help      Show this help message\n"
            "  -v, --version   Show version information\n"
            "\n"
            "EXIT CODES:\n"
            "  0   All units exported\n"
            "  1   Some units failed\n"
            "  2   All units failed\n"
            "  3   Invalid arguments\n"
            "  4   I/O error\n"
            "\n"
            "Run 'blockcrop <command> --help' for command-specific options.\n");
    } else if (cmd == Command::Export) {
        out << QCoreApplication::translate("CLI",
            "Usage: blockcrop export [OPTIONS] <pdf> -o <dir>\n"
            "\n"
            "Crop every block saved for <pdf> and write one image per block or group.\n"
            "\n"
            "ARGUMENTS:\n"
            "  <pdf>                   Source PDF\n"
            "\n"
            "INPUT OPTIONS:\n"
            "  --blocks <file>         Block data (default: <pdf>.blocks.json)\n"
            "  --block <id>            Export only this block (repeatable)\n"
            "  --group <id>            Export only this group (repeatable)\n"
            "  --include-disabled      List units without enabled blocks as skipped\n"
            "\n"
            "OUTPUT OPTIONS:\n"
            "  -o, --output <dir>      Output directory [required]\n"
            "  --dpi <N>               Export resolution (default: 300)\n"
            "  --format <fmt>          png, jpg, bmp, ... (default: png)\n"
            "\n"
            "COMMON OPTIONS:\n"
            "  --verbose               Show detailed progress\n"
            "  --json                  Output results as JSON\n"
            "  --dry-run               Compose images without writing files\n"
            "  -h, --help              Show this help\n"
            "\n"
            "EXAMPLES:\n"
            "  blockcrop export paper.pdf -o crops/\n"
            "  blockcrop export paper.pdf -o crops/ --dpi 600 --group 2\n");
    } else {
        out << parser.helpText();
    }
}

void showVersion()
{
    QTextStream out(stdout);
    out << "BlockCrop " << APP_VERSION << "\n";
    out << "PDF backend: " << PdfProvider::backendName() << "\n";
}

// =============================================================================
// Main Entry Point
// =============================================================================

int run(QCoreApplication& app, int argc, char* argv[])
{
    Q_UNUSED(app)

    Command cmd = parseCommand(argc, argv);

    if (cmd == Command::Version) {
        showVersion();
        return ExitCode::Success;
    }

    if (cmd == Command::Help || cmd == Command::None) {
        QCommandLineParser parser;
        setupParser(parser, Command::None);
        showHelp(parser, cmd);
        return (cmd == Command::Help) ? ExitCode::Success : ExitCode::InvalidArgs;
    }

    QCommandLineParser parser;
    setupParser(parser, cmd);

    // QCommandLineParser doesn't understand subcommands: drop the keyword
    QStringList args;
    args << QString::fromLocal8Bit(argv[0]);
    for (int i = 2; i < argc; ++i) {
        args << QString::fromLocal8Bit(argv[i]);
    }

    if (!parser.parse(args)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: ")
            << parser.errorText() << "\n\n";
        showHelp(parser, cmd);
        return ExitCode::InvalidArgs;
    }

    if (parser.isSet(QStringLiteral("help"))) {
        showHelp(parser, cmd);
        return ExitCode::Success;
    }

    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }

    switch (cmd) {
        case Command::Export:
            return handleExport(parser);
        default:
            return ExitCode::InvalidArgs;
    }
}

} // namespace Cli
