#include "TestSuites.h"

#include "cli/CliTests.h"
#include "core/BlockStoreTests.h"
#include "core/CoordinateMapperTests.h"
#include "core/PageRasterCacheTests.h"
#include "core/SelectionControllerTests.h"
#include "core/SelectionSessionTests.h"
#include "export/ExportComposerTests.h"
#include "pdf/PdfProviderTests.h"
#include "ui/BlockViewportTests.h"

#include <QDebug>
#include <QtTest/QTest>

namespace TestSuites {

QStringList names()
{
    return {
        QStringLiteral("mapper"),
        QStringLiteral("store"),
        QStringLiteral("cache"),
        QStringLiteral("selection"),
        QStringLiteral("export"),
        QStringLiteral("session"),
        QStringLiteral("pdf"),
        QStringLiteral("cli"),
        QStringLiteral("viewport")
    };
}

static int runOne(const QString& name)
{
    if (name == QLatin1String("mapper")) {
        CoordinateMapperTests tests;
        return QTest::qExec(&tests);
    }
    if (name == QLatin1String("store")) {
        BlockStoreTests tests;
        return QTest::qExec(&tests);
    }
    if (name == QLatin1String("cache")) {
        PageRasterCacheTests tests;
        return QTest::qExec(&tests);
    }
    if (name == QLatin1String("selection")) {
        SelectionControllerTests tests;
        return QTest::qExec(&tests);
    }
    if (name == QLatin1String("export")) {
        ExportComposerTests tests;
        return QTest::qExec(&tests);
    }
    if (name == QLatin1String("session")) {
        SelectionSessionTests tests;
        return QTest::qExec(&tests);
    }
    if (name == QLatin1String("pdf")) {
        PdfProviderTests tests;
        return QTest::qExec(&tests);
    }
    if (name == QLatin1String("cli")) {
        CliTests tests;
        return QTest::qExec(&tests);
    }
    if (name == QLatin1String("viewport")) {
        BlockViewportTests tests;
        return QTest::qExec(&tests);
    }

    qWarning() << "Unknown test suite:" << name << "- available:" << names().join(QStringLiteral(", "));
    return -1;
}

int run(const QString& name)
{
    if (name != QLatin1String("all")) {
        return runOne(name);
    }

    int failures = 0;
    for (const QString& suite : names()) {
        failures += runOne(suite);
    }
    return failures;
}

} // namespace TestSuites
