#include "providers/brew_provider.hpp"

#include "common/errors.hpp"

namespace hostform {

namespace {

const QString kBrewProgram = QStringLiteral("brew");

std::string identityOf(const std::string &name)
{
    return name;
}

} // namespace

BrewProvider::BrewProvider(ProcessExecutor &executor, bool dryRun)
    : m_executor(executor)
    , m_dryRun(dryRun)
{
}

void BrewProvider::checkInstalled() const
{
    requireProgram(m_executor, kBrewProgram);
}

std::unordered_set<std::string> BrewProvider::listInstalled(const QStringList &arguments) const
{
    const ProcessResult result =
        runChecked(m_executor, kBrewProgram, arguments, ErrorKind::QueryFailed);

    std::unordered_set<std::string> installed;
    for (const QString &line : outputLines(result)) {
        installed.insert(line.toStdString());
    }
    return installed;
}

// `brew leaves` would hide formulae that are also dependencies of other
// formulae, so every installed formula is listed.
std::unordered_set<std::string> BrewProvider::installedFormulae() const
{
    return listInstalled({QStringLiteral("list"), QStringLiteral("--formula"),
                          QStringLiteral("-1")});
}

std::unordered_set<std::string> BrewProvider::installedCasks() const
{
    return listInstalled({QStringLiteral("list"), QStringLiteral("--cask"),
                          QStringLiteral("-1")});
}

void BrewProvider::installFormula(const std::string &formula) const
{
    runChecked(m_executor, kBrewProgram,
               {QStringLiteral("install"), QString::fromStdString(formula)},
               ErrorKind::WriteFailed);
}

void BrewProvider::installCask(const std::string &cask) const
{
    runChecked(m_executor, kBrewProgram,
               {QStringLiteral("install"), QStringLiteral("--cask"),
                QString::fromStdString(cask)},
               ErrorKind::WriteFailed);
}

SetOutcome<std::string> BrewProvider::run(SetReconciler<std::string> &reconciler,
                                          const std::vector<std::string> &desired) const
{
    if (m_dryRun) {
        return reconciler.plan(desired);
    }
    return reconciler.reconcile(desired);
}

SetOutcome<std::string> BrewProvider::reconcileFormulae(
    const std::vector<std::string> &desired) const
{
    SetReconciler<std::string> reconciler(
        QStringLiteral("brew_formula"),
        [this]() { return installedFormulae(); },
        [this](const std::string &formula) { installFormula(formula); },
        identityOf);
    return run(reconciler, desired);
}

SetOutcome<std::string> BrewProvider::reconcileCasks(
    const std::vector<std::string> &desired) const
{
    SetReconciler<std::string> reconciler(
        QStringLiteral("brew_cask"),
        [this]() { return installedCasks(); },
        [this](const std::string &cask) { installCask(cask); },
        identityOf);
    return run(reconciler, desired);
}

} // namespace hostform
