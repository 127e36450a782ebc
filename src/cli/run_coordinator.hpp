#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "common/enums.hpp"
#include "common/models.hpp"
#include "common/process_executor.hpp"

namespace hostform {

struct KindSummary {
    std::string kind;
    bool configured = false;
    // Units that differed from the desired state: packages installed,
    // links created or repaired, preferences written. In dry-run mode these
    // are the changes that would have been made.
    int changes = 0;
};

struct RunSummary {
    std::vector<KindSummary> kinds;
    std::vector<Subsystem> restarted;
    std::vector<Subsystem> restartFailed;
    bool reloginRequired = false;
    bool dryRun = false;

    int totalChanges() const;
    const KindSummary *find(const std::string &kind) const;
};

/**
 * Sequences the resource kinds of one run: brew formulae, brew casks, app
 * store apps, dotfiles, editor extensions, macOS preferences.
 *
 * Each kind checks its tool, reads the live state, diffs, then applies. The
 * first error propagates out of run() and ends the run; kinds after it are
 * not attempted.
 */
class RunCoordinator
{
public:
    RunCoordinator(ProcessExecutor &executor, std::ostream &out, bool dryRun = false);

    RunSummary run(const SystemConfig &config,
                   const std::filesystem::path &dotfilesDir,
                   const std::filesystem::path &home);

private:
    void runBrew(const std::optional<BrewConfig> &brew, RunSummary &summary);
    void runMas(const std::optional<MasConfig> &mas, RunSummary &summary);
    void runDotfiles(const std::optional<DotfilesConfig> &dotfiles,
                     const std::filesystem::path &dotfilesDir,
                     const std::filesystem::path &home,
                     RunSummary &summary);
    void runVscode(const std::optional<VscodeConfig> &vscode, RunSummary &summary);
    void runMacos(const std::optional<MacosConfig> &macos, RunSummary &summary);

    void reportMissingSection(const std::string &section, RunSummary &summary);
    void reportKind(const KindSummary &kind);

    ProcessExecutor &m_executor;
    std::ostream &m_out;
    bool m_dryRun = false;
};

} // namespace hostform
