#include "common/config_loader.hpp"

#include <QByteArray>
#include <QFile>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace hostform {

namespace {

nlohmann::json sectionSummary(const SystemConfig &config)
{
    return nlohmann::json{
        {"brew", config.brew.has_value()},
        {"mas", config.mas.has_value()},
        {"dotfiles", config.dotfiles.has_value()},
        {"vscode", config.vscode.has_value()},
        {"macos", config.macos.has_value()}
    };
}

} // namespace

SystemConfig parseSystemConfig(const std::string &document)
{
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(document);
    } catch (const nlohmann::json::parse_error &ex) {
        throw ReconcileError(ErrorKind::ConfigInvalid,
                             std::string("Malformed configuration: ") + ex.what());
    }

    return root.get<SystemConfig>();
}

SystemConfig loadSystemConfig(const std::filesystem::path &configDir)
{
    const std::filesystem::path path = configDir / kSystemConfigFileName;
    const QString qpath = QString::fromStdString(path.string());

    QFile file(qpath);
    if (!file.open(QIODevice::ReadOnly)) {
        HFLOG_ERROR(QStringLiteral("ConfigLoader"),
                    QStringLiteral("loadSystemConfig"),
                    QStringLiteral("config_open_failed"),
                    QStringLiteral("run_start"),
                    QStringLiteral("file_open"),
                    hostform::logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"path", path.string()},
                                   {"error", file.errorString().toStdString()}});
        throw ReconcileError(ErrorKind::ConfigInvalid,
                             "Cannot read configuration file " + path.string() + ": "
                                 + file.errorString().toStdString());
    }

    const QByteArray data = file.readAll();
    SystemConfig config = parseSystemConfig(data.toStdString());

    HFLOG_INFO(QStringLiteral("ConfigLoader"),
               QStringLiteral("loadSystemConfig"),
               QStringLiteral("config_loaded"),
               QStringLiteral("run_start"),
               QStringLiteral("json"),
               hostform::logging::defaultWho(),
               QString(),
               nlohmann::json{{"path", path.string()},
                              {"sections", sectionSummary(config)}});
    return config;
}

} // namespace hostform
