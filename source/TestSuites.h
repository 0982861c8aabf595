#ifndef TESTSUITES_H
#define TESTSUITES_H

#include <QString>
#include <QStringList>

/**
 * @brief Registry of the QTest suites built into the binaries.
 *
 * Shared by `blockcrop --test-<suite>` and the `blockcrop_tests` runner.
 */
namespace TestSuites {

/**
 * @brief Names accepted by run(), in execution order.
 */
QStringList names();

/**
 * @brief Run one suite, or every suite for "all".
 * @return Number of failed test functions; -1 for an unknown suite name.
 */
int run(const QString& name);

} // namespace TestSuites

#endif // TESTSUITES_H
