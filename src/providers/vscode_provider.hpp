#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

#include "common/process_executor.hpp"
#include "reconcile/set_reconciler.hpp"

namespace hostform {

// Extension ids are "publisher.name". `code --list-extensions` reports them
// lower-cased while the configured id keeps its case for installation, so
// matching ignores ASCII case.
struct ExtensionIdHash {
    std::size_t operator()(const std::string &id) const;
};

struct ExtensionIdEqual {
    bool operator()(const std::string &lhs, const std::string &rhs) const;
};

using ExtensionSet = std::unordered_set<std::string, ExtensionIdHash, ExtensionIdEqual>;

class VscodeProvider
{
public:
    explicit VscodeProvider(ProcessExecutor &executor, bool dryRun = false);

    // Throws PreconditionNotFound when code is not on PATH.
    void checkInstalled() const;

    ExtensionSet installedExtensions() const;
    void installExtension(const std::string &id) const;

    SetOutcome<std::string> reconcile(const std::vector<std::string> &desired) const;

private:
    ProcessExecutor &m_executor;
    bool m_dryRun = false;
};

} // namespace hostform
