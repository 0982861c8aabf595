// ============================================================================
// BlockCrop - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QCoreApplication>
#include <QTranslator>
#include <QLocale>
#include <QSettings>
#include <QStandardPaths>

#include "MainWindow.h"
#include "cli/CliParser.h"
#include "TestSuites.h"

// ============================================================================
// Translation Loading
// ============================================================================

static void loadTranslations(QApplication& app, QTranslator& translator)
{
    QSettings settings("BlockCrop", "App");
    bool useSystemLanguage = settings.value("useSystemLanguage", true).toBool();

    QString langCode;
    if (useSystemLanguage) {
        langCode = QLocale::system().name().section('_', 0, 0);
    } else {
        langCode = settings.value("languageOverride", "en").toString();
    }

    QStringList translationPaths = {
        QCoreApplication::applicationDirPath(),
        QCoreApplication::applicationDirPath() + "/translations",
        "/usr/share/blockcrop/translations",
        "/usr/local/share/blockcrop/translations",
        QStandardPaths::locate(QStandardPaths::GenericDataLocation,
                               "blockcrop/translations", QStandardPaths::LocateDirectory)
    };

    for (const QString& path : translationPaths) {
        if (translator.load(path + "/app_" + langCode + ".qm")) {
            app.installTranslator(&translator);
            break;
        }
    }
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    // ========== Headless Commands ==========
    // Decided before any GUI object exists so export works without a display.
    if (Cli::isCliMode(argc, argv)) {
        QCoreApplication app(argc, argv);
        app.setOrganizationName("BlockCrop");
        app.setApplicationName("App");
        return Cli::run(app, argc, argv);
    }

    QApplication app(argc, argv);
    app.setOrganizationName("BlockCrop");
    app.setApplicationName("App");

    QTranslator translator;
    loadTranslations(app, translator);

    // ========== Parse Command Line Arguments ==========
    QString inputFile;
    QString testToRun;

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg.startsWith("--test-")) {
            testToRun = arg.mid(7);
        } else if (!arg.startsWith("--") && inputFile.isEmpty()) {
            inputFile = arg;
        }
    }

    if (!testToRun.isEmpty()) {
        return TestSuites::run(testToRun);
    }

    // ========== Launch Application ==========
    auto* w = new MainWindow();
    w->setAttribute(Qt::WA_DeleteOnClose);
    w->show();
    if (!inputFile.isEmpty()) {
        w->openPdf(inputFile);
    }
    return app.exec();
}
