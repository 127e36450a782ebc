#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

#include "common/models.hpp"
#include "common/process_executor.hpp"
#include "reconcile/set_reconciler.hpp"

namespace hostform {

// App store apps are the same app whenever their numeric ids match.
struct MasAppIdHash {
    std::size_t operator()(const MasApp &app) const
    {
        return std::hash<std::string>{}(app.id);
    }
};

struct MasAppIdEqual {
    bool operator()(const MasApp &lhs, const MasApp &rhs) const
    {
        return lhs.id == rhs.id;
    }
};

using MasAppSet = std::unordered_set<MasApp, MasAppIdHash, MasAppIdEqual>;

class MasProvider
{
public:
    explicit MasProvider(ProcessExecutor &executor, bool dryRun = false);

    // Throws PreconditionNotFound when mas is not on PATH.
    void checkInstalled() const;

    // Every line of `mas list` must parse; one malformed line fails the query.
    MasAppSet installedApps() const;

    void installApp(const MasApp &app) const;

    SetOutcome<MasApp> reconcile(const std::vector<MasApp> &desired) const;

private:
    ProcessExecutor &m_executor;
    bool m_dryRun = false;
};

} // namespace hostform
