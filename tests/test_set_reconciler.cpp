#include <QtTest/QtTest>

#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "common/errors.hpp"
#include "providers/vscode_provider.hpp"
#include "reconcile/set_reconciler.hpp"

namespace {

using Names = std::vector<std::string>;
using NameSet = std::unordered_set<std::string>;

std::string describe(const std::string &name)
{
    return name;
}

} // namespace

class SetReconcilerTests : public QObject
{
    Q_OBJECT
private slots:
    void testMissingPreservesDesiredOrder();
    void testDuplicatesAreNotCollapsed();
    void testPresentDuplicatesAreSkipped();
    void testInstallsOnlyMissing();
    void testNothingMissingInstallsNothing();
    void testFailedInstallAbortsRemainder();
    void testQueryHappensBeforeInstalls();
    void testEmptyDesiredSkipsQuery();
    void testCaseInsensitiveIdentity();
};

void SetReconcilerTests::testMissingPreservesDesiredOrder()
{
    const Names desired = {"zsh", "git", "jq", "bat"};
    const NameSet actual = {"git", "curl"};

    const Names missing = hostform::missingIdentities(desired, actual);
    QCOMPARE(missing, (Names{"zsh", "jq", "bat"}));
}

void SetReconcilerTests::testDuplicatesAreNotCollapsed()
{
    const Names desired = {"a", "a", "b"};
    const NameSet actual;

    const Names missing = hostform::missingIdentities(desired, actual);
    QCOMPARE(missing, (Names{"a", "a", "b"}));
}

void SetReconcilerTests::testPresentDuplicatesAreSkipped()
{
    const Names desired = {"a", "a", "b"};
    const NameSet actual = {"a"};

    const Names missing = hostform::missingIdentities(desired, actual);
    QCOMPARE(missing, (Names{"b"}));
}

void SetReconcilerTests::testInstallsOnlyMissing()
{
    Names installed;
    hostform::SetReconciler<std::string> reconciler(
        QStringLiteral("test"),
        []() { return NameSet{"git"}; },
        [&installed](const std::string &name) { installed.push_back(name); },
        describe);

    const auto outcome = reconciler.reconcile({"git", "jq", "jq", "bat"});
    QCOMPARE(installed, (Names{"jq", "jq", "bat"}));
    QCOMPARE(outcome.installedCount, static_cast<size_t>(3));
    QCOMPARE(outcome.desiredCount, static_cast<size_t>(4));
    QCOMPARE(outcome.actualCount, static_cast<size_t>(1));
    QVERIFY(outcome.changed());
}

void SetReconcilerTests::testNothingMissingInstallsNothing()
{
    int installs = 0;
    hostform::SetReconciler<std::string> reconciler(
        QStringLiteral("test"),
        []() { return NameSet{"git", "jq"}; },
        [&installs](const std::string &) { ++installs; },
        describe);

    const auto outcome = reconciler.reconcile({"jq", "git"});
    QCOMPARE(installs, 0);
    QVERIFY(!outcome.changed());
    QVERIFY(outcome.missing.empty());
}

void SetReconcilerTests::testFailedInstallAbortsRemainder()
{
    Names attempted;
    hostform::SetReconciler<std::string> reconciler(
        QStringLiteral("test"),
        []() { return NameSet{}; },
        [&attempted](const std::string &name) {
            attempted.push_back(name);
            if (name == "broken") {
                throw hostform::ReconcileError(hostform::ErrorKind::WriteFailed, "install failed");
            }
        },
        describe);

    try {
        reconciler.reconcile({"first", "broken", "never"});
        QFAIL("expected the install failure to propagate");
    } catch (const hostform::ReconcileError &ex) {
        QCOMPARE(ex.kind(), hostform::ErrorKind::WriteFailed);
    }
    QCOMPARE(attempted, (Names{"first", "broken"}));
}

void SetReconcilerTests::testQueryHappensBeforeInstalls()
{
    QStringList events;
    hostform::SetReconciler<std::string> reconciler(
        QStringLiteral("test"),
        [&events]() {
            events.push_back(QStringLiteral("query"));
            return NameSet{};
        },
        [&events](const std::string &name) {
            events.push_back(QStringLiteral("install:") + QString::fromStdString(name));
        },
        describe);

    reconciler.reconcile({"a", "b"});
    QCOMPARE(events, (QStringList{QStringLiteral("query"), QStringLiteral("install:a"),
                                  QStringLiteral("install:b")}));
}

void SetReconcilerTests::testEmptyDesiredSkipsQuery()
{
    bool queried = false;
    hostform::SetReconciler<std::string> reconciler(
        QStringLiteral("test"),
        [&queried]() {
            queried = true;
            return NameSet{};
        },
        [](const std::string &) {},
        describe);

    const auto outcome = reconciler.reconcile({});
    QVERIFY(!queried);
    QVERIFY(!outcome.changed());
}

void SetReconcilerTests::testCaseInsensitiveIdentity()
{
    const Names desired = {"Foo.Bar", "ms-python.Python", "Other.Ext"};
    const hostform::ExtensionSet actual = {"foo.bar", "ms-python.python"};

    const Names missing = hostform::missingIdentities(desired, actual);
    QCOMPARE(missing, (Names{"Other.Ext"}));
}

QTEST_MAIN(SetReconcilerTests)
#include "test_set_reconciler.moc"
