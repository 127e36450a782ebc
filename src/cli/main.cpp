#include <QCoreApplication>

#include <vector>

#include <nlohmann/json.hpp>

#include "cli/HostformCli.hpp"
#include "common/logging.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("hostform"));

    bool trace = qEnvironmentVariableIntValue("HOSTFORM_TRACE") == 1;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    hostform::logging::initLogging(QStringLiteral("hostform"), trace);
    HFLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               hostform::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", filteredArgs.size()}, {"trace", trace}}));

    hostform::HostformCli cli;
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
