#include "reconcile/defaults_writer.hpp"

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace hostform {

namespace {

const QString kDefaultsProgram = QStringLiteral("defaults");

// `defaults read` reports a missing key on stderr and exits 1:
// "The domain/default pair of (com.apple.dock, foo) does not exist"
bool isUnsetKeyError(const ProcessResult &result)
{
    return result.started && result.exitCode != 0
        && result.standardError.contains(QStringLiteral("does not exist"));
}

nlohmann::json keyContext(const PreferenceKey &key)
{
    return nlohmann::json{{"domain", key.domain}, {"key", key.key}};
}

} // namespace

DefaultsWriter::DefaultsWriter(ProcessExecutor &executor, bool dryRun)
    : m_executor(executor)
    , m_dryRun(dryRun)
{
}

std::optional<std::string> DefaultsWriter::readRaw(const PreferenceKey &key) const
{
    const QStringList arguments = {QStringLiteral("read"),
                                   QString::fromStdString(key.domain),
                                   QString::fromStdString(key.key)};
    const ProcessResult result = m_executor.run(kDefaultsProgram, arguments);

    if (isUnsetKeyError(result)) {
        HFLOG_INFO(QStringLiteral("DefaultsWriter"),
                   QStringLiteral("readRaw"),
                   QStringLiteral("preference_unset"),
                   QStringLiteral("actual_state_query"),
                   QStringLiteral("defaults_read"),
                   hostform::logging::defaultWho(),
                   QString(),
                   keyContext(key));
        return std::nullopt;
    }

    if (!result.succeeded()) {
        nlohmann::json context = keyContext(key);
        context["exitCode"] = result.exitCode;
        context["stderr"] = result.standardError.trimmed().toStdString();
        HFLOG_ERROR(QStringLiteral("DefaultsWriter"),
                    QStringLiteral("readRaw"),
                    QStringLiteral("preference_read_failed"),
                    QStringLiteral("actual_state_query"),
                    QStringLiteral("defaults_read"),
                    hostform::logging::defaultWho(),
                    QString(),
                    context);
        throw ReconcileError(ErrorKind::QueryFailed,
                             "defaults read failed for " + key.domain + "." + key.key
                                 + ": " + result.standardError.trimmed().toStdString());
    }

    return result.standardOutput.trimmed().toStdString();
}

void DefaultsWriter::writeRaw(const PreferenceKey &key, const char *typeFlag,
                              const std::string &value, const std::string &previous,
                              bool wasUnset)
{
    nlohmann::json context = keyContext(key);
    context["type"] = typeFlag;
    context["value"] = value;
    context["previous"] = wasUnset ? nlohmann::json() : nlohmann::json(previous);

    if (m_dryRun) {
        HFLOG_INFO(QStringLiteral("DefaultsWriter"),
                   QStringLiteral("writeRaw"),
                   QStringLiteral("preference_write_skipped"),
                   QStringLiteral("dry_run"),
                   QStringLiteral("defaults_write"),
                   hostform::logging::defaultWho(),
                   QString(),
                   context);
        return;
    }

    const QStringList arguments = {QStringLiteral("write"),
                                   QString::fromStdString(key.domain),
                                   QString::fromStdString(key.key),
                                   QString::fromLatin1(typeFlag),
                                   QString::fromStdString(value)};
    const ProcessResult result = m_executor.run(kDefaultsProgram, arguments);
    if (!result.succeeded()) {
        context["exitCode"] = result.exitCode;
        HFLOG_ERROR(QStringLiteral("DefaultsWriter"),
                    QStringLiteral("writeRaw"),
                    QStringLiteral("preference_write_failed"),
                    QStringLiteral("desired_differs"),
                    QStringLiteral("defaults_write"),
                    hostform::logging::defaultWho(),
                    QString(),
                    context);
        throw ReconcileError(ErrorKind::WriteFailed,
                             "defaults write failed for " + key.domain + "." + key.key);
    }

    ++m_writeCount;
    HFLOG_INFO(QStringLiteral("DefaultsWriter"),
               QStringLiteral("writeRaw"),
               QStringLiteral("preference_written"),
               wasUnset ? QStringLiteral("preference_unset") : QStringLiteral("desired_differs"),
               QStringLiteral("defaults_write"),
               hostform::logging::defaultWho(),
               QString(),
               context);
}

void DefaultsWriter::logUnchanged(const PreferenceKey &key, const std::string &value) const
{
    nlohmann::json context = keyContext(key);
    context["value"] = value;
    HFLOG_DEBUG(QStringLiteral("DefaultsWriter"),
                QStringLiteral("write"),
                QStringLiteral("preference_unchanged"),
                QStringLiteral("desired_matches_actual"),
                QStringLiteral("typed_compare"),
                hostform::logging::defaultWho(),
                QString(),
                context);
}

} // namespace hostform
