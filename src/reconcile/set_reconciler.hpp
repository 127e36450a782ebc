#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace hostform {

// Desired identities absent from actual, in desired order. Duplicates in
// desired are kept, so each one is attempted.
template <typename Identity, typename Hash, typename Equal>
std::vector<Identity> missingIdentities(
    const std::vector<Identity> &desired,
    const std::unordered_set<Identity, Hash, Equal> &actual)
{
    std::vector<Identity> missing;
    for (const Identity &identity : desired) {
        if (actual.find(identity) == actual.end()) {
            missing.push_back(identity);
        }
    }
    return missing;
}

template <typename Identity>
struct SetOutcome {
    std::size_t desiredCount = 0;
    std::size_t actualCount = 0;
    std::vector<Identity> missing;
    std::size_t installedCount = 0;

    bool changed() const
    {
        return installedCount > 0;
    }
};

/**
 * Desired-set vs actual-set reconciliation for one resource kind.
 *
 * - queryActual: reads the live system once; must throw on failure.
 * - installOne: installs a single identity; must throw on failure, which
 *   aborts the remaining installs.
 *
 * The actual set is fully read before the first install.
 */
template <typename Identity,
          typename Hash = std::hash<Identity>,
          typename Equal = std::equal_to<Identity>>
class SetReconciler
{
public:
    using ActualSet = std::unordered_set<Identity, Hash, Equal>;
    using QueryFn = std::function<ActualSet()>;
    using InstallFn = std::function<void(const Identity &)>;
    using DescribeFn = std::function<std::string(const Identity &)>;

    SetReconciler(QString kind, QueryFn queryActual, InstallFn installOne,
                  DescribeFn describe)
        : m_kind(std::move(kind))
        , m_queryActual(std::move(queryActual))
        , m_installOne(std::move(installOne))
        , m_describe(std::move(describe))
    {
    }

    SetOutcome<Identity> plan(const std::vector<Identity> &desired) const
    {
        SetOutcome<Identity> outcome;
        outcome.desiredCount = desired.size();
        if (desired.empty()) {
            return outcome;
        }

        const ActualSet actual = m_queryActual();
        outcome.actualCount = actual.size();
        outcome.missing = missingIdentities(desired, actual);

        nlohmann::json missingNames = nlohmann::json::array();
        for (const Identity &identity : outcome.missing) {
            missingNames.push_back(m_describe(identity));
        }
        HFLOG_INFO(QStringLiteral("SetReconciler"),
                   QStringLiteral("plan"),
                   QStringLiteral("set_diff_computed"),
                   QStringLiteral("reconcile_step"),
                   QStringLiteral("hash_membership"),
                   hostform::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"kind", m_kind.toStdString()},
                                  {"desired", outcome.desiredCount},
                                  {"actual", outcome.actualCount},
                                  {"missing", missingNames}});
        return outcome;
    }

    void apply(SetOutcome<Identity> &outcome) const
    {
        for (const Identity &identity : outcome.missing) {
            HFLOG_INFO(QStringLiteral("SetReconciler"),
                       QStringLiteral("apply"),
                       QStringLiteral("install_identity"),
                       QStringLiteral("missing_from_actual"),
                       QStringLiteral("install_one"),
                       hostform::logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"kind", m_kind.toStdString()},
                                      {"identity", m_describe(identity)}});
            m_installOne(identity);
            ++outcome.installedCount;
        }
    }

    SetOutcome<Identity> reconcile(const std::vector<Identity> &desired) const
    {
        SetOutcome<Identity> outcome = plan(desired);
        apply(outcome);
        return outcome;
    }

private:
    QString m_kind;
    QueryFn m_queryActual;
    InstallFn m_installOne;
    DescribeFn m_describe;
};

} // namespace hostform
