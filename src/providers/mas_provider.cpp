#include "providers/mas_provider.hpp"

#include "common/errors.hpp"
#include "reconcile/mas_list_parser.hpp"

namespace hostform {

namespace {

const QString kMasProgram = QStringLiteral("mas");

std::string describeApp(const MasApp &app)
{
    if (app.name.empty()) {
        return app.id;
    }
    return app.name + " (" + app.id + ")";
}

} // namespace

MasProvider::MasProvider(ProcessExecutor &executor, bool dryRun)
    : m_executor(executor)
    , m_dryRun(dryRun)
{
}

void MasProvider::checkInstalled() const
{
    requireProgram(m_executor, kMasProgram);
}

MasAppSet MasProvider::installedApps() const
{
    const ProcessResult result =
        runChecked(m_executor, kMasProgram, {QStringLiteral("list")}, ErrorKind::QueryFailed);

    const std::vector<MasApp> apps = parseMasList(result.standardOutput.toStdString());
    return MasAppSet(apps.begin(), apps.end());
}

void MasProvider::installApp(const MasApp &app) const
{
    runChecked(m_executor, kMasProgram,
               {QStringLiteral("install"), QString::fromStdString(app.id)},
               ErrorKind::WriteFailed);
}

SetOutcome<MasApp> MasProvider::reconcile(const std::vector<MasApp> &desired) const
{
    SetReconciler<MasApp, MasAppIdHash, MasAppIdEqual> reconciler(
        QStringLiteral("mas_app"),
        [this]() { return installedApps(); },
        [this](const MasApp &app) { installApp(app); },
        describeApp);
    if (m_dryRun) {
        return reconciler.plan(desired);
    }
    return reconciler.reconcile(desired);
}

} // namespace hostform
