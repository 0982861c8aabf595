// ============================================================================
// BlockCrop - Test Runner
// ============================================================================
// Usage: blockcrop_tests <suite>|all
// ============================================================================

#include <QApplication>
#include <QDebug>

#include "TestSuites.h"

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("BlockCrop");
    app.setApplicationName("Tests");

    const QString suite = argc > 1 ? QString::fromLocal8Bit(argv[1]) : QStringLiteral("all");
    const int failures = TestSuites::run(suite);
    if (failures < 0) {
        return 2;
    }
    return failures == 0 ? 0 : 1;
}
