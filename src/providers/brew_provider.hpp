#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "common/models.hpp"
#include "common/process_executor.hpp"
#include "reconcile/set_reconciler.hpp"

namespace hostform {

// Homebrew formulae and casks. Identities are plain package names compared
// exactly.
class BrewProvider
{
public:
    explicit BrewProvider(ProcessExecutor &executor, bool dryRun = false);

    // Throws PreconditionNotFound when brew is not on PATH.
    void checkInstalled() const;

    std::unordered_set<std::string> installedFormulae() const;
    std::unordered_set<std::string> installedCasks() const;

    void installFormula(const std::string &formula) const;
    void installCask(const std::string &cask) const;

    SetOutcome<std::string> reconcileFormulae(const std::vector<std::string> &desired) const;
    SetOutcome<std::string> reconcileCasks(const std::vector<std::string> &desired) const;

private:
    std::unordered_set<std::string> listInstalled(const QStringList &arguments) const;
    SetOutcome<std::string> run(SetReconciler<std::string> &reconciler,
                                const std::vector<std::string> &desired) const;

    ProcessExecutor &m_executor;
    bool m_dryRun = false;
};

} // namespace hostform
