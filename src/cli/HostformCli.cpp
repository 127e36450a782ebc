#include "cli/HostformCli.hpp"

#include <filesystem>
#include <iostream>

#include <QDir>

#include <nlohmann/json.hpp>

#include "cli/run_coordinator.hpp"
#include "common/config_loader.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

namespace hostform {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  hostform run --system-config-dir DIR --dotfiles-dir DIR [--dry-run] [--trace]\n"
        "  hostform help\n"
        "\n"
        "Reads DIR/system.json and brings packages, app store apps, dotfile links,\n"
        "editor extensions and macOS preferences in line with it.\n");
}

QString getArgValue(const QStringList &args, const QString &longKey, const QString &shortKey)
{
    int idx = args.indexOf(longKey);
    if (idx < 0) {
        idx = args.indexOf(shortKey);
    }
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

void printSummary(const RunSummary &summary)
{
    const int changes = summary.totalChanges();
    if (changes == 0) {
        std::cout << "Everything is already in the desired state.\n";
    } else if (summary.dryRun) {
        std::cout << changes << " change(s) pending (dry run, nothing was modified).\n";
    } else {
        std::cout << changes << " change(s) applied.\n";
    }
}

} // namespace

HostformCli::HostformCli(ProcessExecutor *executor)
    : m_executor(executor)
{
    if (!m_executor) {
        m_ownedExecutor = std::make_unique<QProcessExecutor>();
        m_executor = m_ownedExecutor.get();
    }
}

int HostformCli::run(int argc, char *argv[])
{
    QStringList args;
    for (int i = 1; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.takeFirst();
    if (command == QStringLiteral("help") || command == QStringLiteral("--help")
        || command == QStringLiteral("-h")) {
        std::cout << usageText().toStdString();
        return 0;
    }
    if (command == QStringLiteral("run")) {
        return runSync(args);
    }

    std::cerr << "Unknown command: " << command.toStdString() << "\n"
              << usageText().toStdString();
    return 1;
}

int HostformCli::runSync(const QStringList &args)
{
    const QString configDir = getArgValue(args, QStringLiteral("--system-config-dir"),
                                          QStringLiteral("-s"));
    const QString dotfilesDir = getArgValue(args, QStringLiteral("--dotfiles-dir"),
                                            QStringLiteral("-d"));
    const bool dryRun = args.contains(QStringLiteral("--dry-run"));

    if (configDir.isEmpty() || dotfilesDir.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    try {
        const SystemConfig config = loadSystemConfig(configDir.toStdString());
        RunCoordinator coordinator(*m_executor, std::cout, dryRun);
        const RunSummary summary = coordinator.run(config,
                                                   std::filesystem::path(dotfilesDir.toStdString()),
                                                   std::filesystem::path(QDir::homePath().toStdString()));
        printSummary(summary);
        return 0;
    } catch (const ReconcileError &ex) {
        HFLOG_ERROR(QStringLiteral("HostformCli"),
                    QStringLiteral("runSync"),
                    QStringLiteral("run_failed"),
                    QString::fromStdString(toErrorKindString(ex.kind())),
                    QStringLiteral("fail_fast"),
                    hostform::logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"error", ex.what()}});
        std::cerr << "Error (" << toErrorKindString(ex.kind()) << "): " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception &ex) {
        HFLOG_ERROR(QStringLiteral("HostformCli"),
                    QStringLiteral("runSync"),
                    QStringLiteral("run_failed"),
                    QStringLiteral("unexpected_error"),
                    QStringLiteral("fail_fast"),
                    hostform::logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"error", ex.what()}});
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}

} // namespace hostform
