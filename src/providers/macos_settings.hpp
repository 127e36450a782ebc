#pragma once

#include <vector>

#include "common/enums.hpp"
#include "common/models.hpp"
#include "common/process_executor.hpp"
#include "reconcile/defaults_writer.hpp"

namespace hostform {

// ORs together the changed flags of preference writes per subsystem.
class RestartTracker
{
public:
    void record(Subsystem subsystem, bool changed);
    bool needsRestart(Subsystem subsystem) const;

    // Subsystems with at least one change, in restart order (Dock, Safari,
    // Finder). Each appears once.
    std::vector<Subsystem> pending() const;

private:
    bool m_dock = false;
    bool m_safari = false;
    bool m_finder = false;
};

struct MacosOutcome {
    int changes = 0;
    // Subsystems that needed a restart, whether or not one was issued.
    std::vector<Subsystem> pendingRestarts;
    std::vector<Subsystem> restarted;
    // killall ran but exited non-zero, usually because the process was not
    // running.
    std::vector<Subsystem> restartFailed;
    bool reloginRequired = false;

    bool changed() const
    {
        return changes > 0;
    }
};

/**
 * Applies the macOS preference catalogue through DefaultsWriter.
 *
 * All preference writes finish before any restart. Each subsystem that saw
 * at least one change is restarted exactly once with `killall`; subsystems
 * without changes are never touched.
 */
class MacosSettingsProvider
{
public:
    explicit MacosSettingsProvider(ProcessExecutor &executor, bool dryRun = false);

    // Throws PreconditionNotFound when defaults or killall is not on PATH.
    void checkInstalled() const;

    MacosOutcome reconcile(const MacosConfig &config);

    int applyDock(DefaultsWriter &writer, const DockSettings &dock) const;
    int applyMissionControl(DefaultsWriter &writer,
                            const MissionControlSettings &missionControl) const;
    int applySafari(DefaultsWriter &writer, const SafariSettings &safari) const;
    int applyFileExtensions(DefaultsWriter &writer, const SystemSettings &system) const;
    int applyNaturalScrolling(DefaultsWriter &writer, const SystemSettings &system) const;
    int applyMagicMouse(DefaultsWriter &writer, const MagicMouseSettings &magicMouse) const;
    int applyFinder(DefaultsWriter &writer, const FinderSettings &finder) const;

    // Returns false when killall exited non-zero.
    bool restart(Subsystem subsystem) const;

private:
    ProcessExecutor &m_executor;
    bool m_dryRun = false;
};

} // namespace hostform
