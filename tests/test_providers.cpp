#include <QtTest/QtTest>

#include "common/errors.hpp"
#include "fake_process_executor.hpp"
#include "providers/brew_provider.hpp"
#include "providers/mas_provider.hpp"
#include "providers/vscode_provider.hpp"

class ProviderTests : public QObject
{
    Q_OBJECT
private slots:
    void testBrewInstallsMissingFormulaeInOrder();
    void testBrewCasksUseCaskFlag();
    void testBrewQueryFailure();
    void testBrewInstallFailureStopsRemaining();
    void testBrewMissingProgram();
    void testMasMatchesById();
    void testMasMalformedListingFails();
    void testVscodeCaseInsensitiveMatch();
    void testVscodeInstallsWithConfiguredCase();
    void testDryRunInstallsNothing();
};

void ProviderTests::testBrewInstallsMissingFormulaeInOrder()
{
    FakeProcessExecutor executor;
    executor.script(QStringLiteral("brew list --formula -1"),
                    FakeProcessExecutor::ok(QStringLiteral("git\nripgrep\n")));

    hostform::BrewProvider provider(executor);
    const auto outcome = provider.reconcileFormulae({"jq", "git", "fd", "jq"});

    QCOMPARE(outcome.installedCount, static_cast<size_t>(3));
    const QStringList installs = [&executor]() {
        QStringList lines;
        for (const QString &line : executor.commandLines()) {
            if (line.startsWith(QStringLiteral("brew install"))) {
                lines.push_back(line);
            }
        }
        return lines;
    }();
    QCOMPARE(installs, (QStringList{QStringLiteral("brew install jq"),
                                    QStringLiteral("brew install fd"),
                                    QStringLiteral("brew install jq")}));
    QCOMPARE(executor.count(QStringLiteral("brew install git")), 0);
}

void ProviderTests::testBrewCasksUseCaskFlag()
{
    FakeProcessExecutor executor;
    executor.script(QStringLiteral("brew list --cask -1"),
                    FakeProcessExecutor::ok(QStringLiteral("firefox\n")));

    hostform::BrewProvider provider(executor);
    const auto outcome = provider.reconcileCasks({"firefox", "iterm2"});

    QCOMPARE(outcome.installedCount, static_cast<size_t>(1));
    QCOMPARE(executor.count(QStringLiteral("brew install --cask iterm2")), 1);
    QCOMPARE(executor.countPrefix(QStringLiteral("brew install --cask firefox")), 0);
}

void ProviderTests::testBrewQueryFailure()
{
    FakeProcessExecutor executor;
    executor.script(QStringLiteral("brew list --formula -1"),
                    FakeProcessExecutor::failed(1, QStringLiteral("Error: broken")));

    hostform::BrewProvider provider(executor);
    try {
        provider.reconcileFormulae({"git"});
        QFAIL("expected a query failure");
    } catch (const hostform::ReconcileError &ex) {
        QCOMPARE(ex.kind(), hostform::ErrorKind::QueryFailed);
    }
    QCOMPARE(executor.countPrefix(QStringLiteral("brew install")), 0);
}

void ProviderTests::testBrewInstallFailureStopsRemaining()
{
    FakeProcessExecutor executor;
    executor.script(QStringLiteral("brew list --formula -1"), FakeProcessExecutor::ok());
    executor.script(QStringLiteral("brew install nope"),
                    FakeProcessExecutor::failed(1, QStringLiteral("No available formula")));

    hostform::BrewProvider provider(executor);
    try {
        provider.reconcileFormulae({"git", "nope", "jq"});
        QFAIL("expected an install failure");
    } catch (const hostform::ReconcileError &ex) {
        QCOMPARE(ex.kind(), hostform::ErrorKind::WriteFailed);
        QVERIFY(QString::fromUtf8(ex.what()).contains(QStringLiteral("No available formula")));
    }
    QCOMPARE(executor.count(QStringLiteral("brew install git")), 1);
    QCOMPARE(executor.count(QStringLiteral("brew install jq")), 0);
}

void ProviderTests::testBrewMissingProgram()
{
    FakeProcessExecutor executor;
    executor.removeProgram(QStringLiteral("brew"));

    hostform::BrewProvider provider(executor);
    try {
        provider.checkInstalled();
        QFAIL("expected a missing program failure");
    } catch (const hostform::ReconcileError &ex) {
        QCOMPARE(ex.kind(), hostform::ErrorKind::PreconditionNotFound);
    }
}

void ProviderTests::testMasMatchesById()
{
    FakeProcessExecutor executor;
    executor.script(QStringLiteral("mas list"),
                    FakeProcessExecutor::ok(QStringLiteral(
                        "937984704   Amphetamine  (5.3.2)\n"
                        "1352211125  Tide Alert (NOAA) - Tide Chart  (3.2)\n")));

    hostform::MasProvider provider(executor);
    // The configured name does not need to match the store listing.
    const auto outcome = provider.reconcile({
        hostform::MasApp{"937984704", "Amphetamine (renamed)", ""},
        hostform::MasApp{"497799835", "Xcode", ""},
    });

    QCOMPARE(outcome.installedCount, static_cast<size_t>(1));
    QCOMPARE(executor.count(QStringLiteral("mas install 497799835")), 1);
    QCOMPARE(executor.count(QStringLiteral("mas install 937984704")), 0);
}

void ProviderTests::testMasMalformedListingFails()
{
    FakeProcessExecutor executor;
    executor.script(QStringLiteral("mas list"),
                    FakeProcessExecutor::ok(QStringLiteral("937984704   Amphetamine\n")));

    hostform::MasProvider provider(executor);
    try {
        provider.reconcile({hostform::MasApp{"497799835", "Xcode", ""}});
        QFAIL("expected a parse failure");
    } catch (const hostform::ReconcileError &ex) {
        QCOMPARE(ex.kind(), hostform::ErrorKind::ParseFailed);
    }
    QCOMPARE(executor.countPrefix(QStringLiteral("mas install")), 0);
}

void ProviderTests::testVscodeCaseInsensitiveMatch()
{
    FakeProcessExecutor executor;
    executor.script(QStringLiteral("code --list-extensions"),
                    FakeProcessExecutor::ok(QStringLiteral("foo.bar\nms-python.python\n")));

    hostform::VscodeProvider provider(executor);
    const auto outcome = provider.reconcile({"Foo.Bar"});

    QVERIFY(!outcome.changed());
    QCOMPARE(executor.countPrefix(QStringLiteral("code --install-extension")), 0);
}

void ProviderTests::testVscodeInstallsWithConfiguredCase()
{
    FakeProcessExecutor executor;
    executor.script(QStringLiteral("code --list-extensions"),
                    FakeProcessExecutor::ok(QStringLiteral("foo.bar\n")));

    hostform::VscodeProvider provider(executor);
    provider.reconcile({"Foo.Bar", "GitHub.Copilot"});

    QCOMPARE(executor.count(QStringLiteral("code --install-extension GitHub.Copilot")), 1);
}

void ProviderTests::testDryRunInstallsNothing()
{
    FakeProcessExecutor executor;
    executor.script(QStringLiteral("brew list --formula -1"), FakeProcessExecutor::ok());

    hostform::BrewProvider provider(executor, true);
    const auto outcome = provider.reconcileFormulae({"git", "jq"});

    QCOMPARE(outcome.missing.size(), static_cast<size_t>(2));
    QCOMPARE(outcome.installedCount, static_cast<size_t>(0));
    QCOMPARE(executor.countPrefix(QStringLiteral("brew install")), 0);
}

QTEST_MAIN(ProviderTests)
#include "test_providers.moc"
