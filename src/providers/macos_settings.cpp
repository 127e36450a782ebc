#include "providers/macos_settings.hpp"

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace hostform {

namespace {

const QString kKillallProgram = QStringLiteral("killall");

const PreferenceKey kDockOrientation{"com.apple.dock", "orientation"};
const PreferenceKey kDockAutohide{"com.apple.dock", "autohide"};
const PreferenceKey kDockTileSize{"com.apple.dock", "tilesize"};
const PreferenceKey kGroupWindowsByApp{"com.apple.dock", "expose-group-apps"};
const PreferenceKey kRearrangeSpaces{"com.apple.dock", "mru-spaces"};
const PreferenceKey kSafariShowFullUrl{"com.apple.Safari", "ShowFullURLInSmartSearchField"};
const PreferenceKey kShowAllExtensions{"NSGlobalDomain", "AppleShowAllExtensions"};
const PreferenceKey kNaturalScrolling{"NSGlobalDomain", "com.apple.swipescrolldirection"};
const PreferenceKey kMouseButtonMode{"com.apple.driver.AppleBluetoothMultitouch.mouse",
                                     "MouseButtonMode"};
const PreferenceKey kFinderPathBar{"com.apple.finder", "ShowPathbar"};
const PreferenceKey kFinderStatusBar{"com.apple.finder", "ShowStatusBar"};
const PreferenceKey kFinderViewStyle{"com.apple.finder", "FXPreferredViewStyle"};

template <typename T>
int writeIfSet(DefaultsWriter &writer, const PreferenceKey &key, const std::optional<T> &value)
{
    if (!value.has_value()) {
        return 0;
    }
    return writer.write(key, *value) ? 1 : 0;
}

nlohmann::json subsystemList(const std::vector<Subsystem> &subsystems)
{
    nlohmann::json names = nlohmann::json::array();
    for (Subsystem subsystem : subsystems) {
        names.push_back(toSubsystemProcessName(subsystem));
    }
    return names;
}

} // namespace

void RestartTracker::record(Subsystem subsystem, bool changed)
{
    if (!changed) {
        return;
    }
    switch (subsystem) {
    case Subsystem::Dock:
        m_dock = true;
        break;
    case Subsystem::Safari:
        m_safari = true;
        break;
    case Subsystem::Finder:
        m_finder = true;
        break;
    }
}

bool RestartTracker::needsRestart(Subsystem subsystem) const
{
    switch (subsystem) {
    case Subsystem::Dock:
        return m_dock;
    case Subsystem::Safari:
        return m_safari;
    case Subsystem::Finder:
        return m_finder;
    }
    return false;
}

std::vector<Subsystem> RestartTracker::pending() const
{
    std::vector<Subsystem> subsystems;
    for (Subsystem subsystem : {Subsystem::Dock, Subsystem::Safari, Subsystem::Finder}) {
        if (needsRestart(subsystem)) {
            subsystems.push_back(subsystem);
        }
    }
    return subsystems;
}

MacosSettingsProvider::MacosSettingsProvider(ProcessExecutor &executor, bool dryRun)
    : m_executor(executor)
    , m_dryRun(dryRun)
{
}

void MacosSettingsProvider::checkInstalled() const
{
    requireProgram(m_executor, QStringLiteral("defaults"));
    requireProgram(m_executor, kKillallProgram);
}

int MacosSettingsProvider::applyDock(DefaultsWriter &writer, const DockSettings &dock) const
{
    int changes = 0;
    changes += writeIfSet(writer, kDockOrientation, dock.orientation);
    changes += writeIfSet(writer, kDockAutohide, dock.autohide);
    changes += writeIfSet(writer, kDockTileSize, dock.iconSize);
    return changes;
}

int MacosSettingsProvider::applyMissionControl(
    DefaultsWriter &writer, const MissionControlSettings &missionControl) const
{
    int changes = 0;
    changes += writeIfSet(writer, kGroupWindowsByApp, missionControl.groupWindowsByApp);
    changes += writeIfSet(writer, kRearrangeSpaces, missionControl.rearrangeSpaces);
    return changes;
}

int MacosSettingsProvider::applySafari(DefaultsWriter &writer, const SafariSettings &safari) const
{
    return writeIfSet(writer, kSafariShowFullUrl, safari.showFullUrl);
}

int MacosSettingsProvider::applyFileExtensions(DefaultsWriter &writer,
                                               const SystemSettings &system) const
{
    return writeIfSet(writer, kShowAllExtensions, system.showFileExtensions);
}

int MacosSettingsProvider::applyNaturalScrolling(DefaultsWriter &writer,
                                                 const SystemSettings &system) const
{
    return writeIfSet(writer, kNaturalScrolling, system.naturalScrolling);
}

int MacosSettingsProvider::applyMagicMouse(DefaultsWriter &writer,
                                           const MagicMouseSettings &magicMouse) const
{
    if (!magicMouse.secondaryClick.has_value()) {
        return 0;
    }
    const MouseButtonMode mode = *magicMouse.secondaryClick
        ? MouseButtonMode::TwoButton
        : MouseButtonMode::OneButton;
    return writer.write(kMouseButtonMode, mode) ? 1 : 0;
}

int MacosSettingsProvider::applyFinder(DefaultsWriter &writer, const FinderSettings &finder) const
{
    int changes = 0;
    changes += writeIfSet(writer, kFinderPathBar, finder.showPathBar);
    changes += writeIfSet(writer, kFinderStatusBar, finder.showStatusBar);
    changes += writeIfSet(writer, kFinderViewStyle, finder.viewStyle);
    return changes;
}

bool MacosSettingsProvider::restart(Subsystem subsystem) const
{
    const QString process = QString::fromStdString(toSubsystemProcessName(subsystem));
    const ProcessResult result = m_executor.run(kKillallProgram, {process});
    if (!result.started) {
        throw ReconcileError(ErrorKind::WriteFailed,
                             "Failed to launch killall to restart " + process.toStdString());
    }
    if (result.exitCode != 0) {
        HFLOG_WARN(QStringLiteral("MacosSettings"),
                   QStringLiteral("restart"),
                   QStringLiteral("subsystem_restart_failed"),
                   QStringLiteral("preferences_changed"),
                   QStringLiteral("killall"),
                   hostform::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"process", process.toStdString()},
                                  {"exitCode", result.exitCode},
                                  {"stderr", result.standardError.trimmed().toStdString()}});
        return false;
    }

    HFLOG_INFO(QStringLiteral("MacosSettings"),
               QStringLiteral("restart"),
               QStringLiteral("subsystem_restarted"),
               QStringLiteral("preferences_changed"),
               QStringLiteral("killall"),
               hostform::logging::defaultWho(),
               QString(),
               nlohmann::json{{"process", process.toStdString()}});
    return true;
}

MacosOutcome MacosSettingsProvider::reconcile(const MacosConfig &config)
{
    MacosOutcome outcome;
    DefaultsWriter writer(m_executor, m_dryRun);
    RestartTracker restarts;

    // Mission Control lives in the Dock process, so both share one restart.
    if (config.dock.has_value()) {
        const int changes = applyDock(writer, *config.dock);
        restarts.record(Subsystem::Dock, changes > 0);
        outcome.changes += changes;
    }
    if (config.missionControl.has_value()) {
        const int changes = applyMissionControl(writer, *config.missionControl);
        restarts.record(Subsystem::Dock, changes > 0);
        outcome.changes += changes;
    }
    if (config.safari.has_value()) {
        const int changes = applySafari(writer, *config.safari);
        restarts.record(Subsystem::Safari, changes > 0);
        outcome.changes += changes;
    }
    if (config.system.has_value()) {
        const int extensionChanges = applyFileExtensions(writer, *config.system);
        restarts.record(Subsystem::Finder, extensionChanges > 0);
        outcome.changes += extensionChanges;

        const int scrollingChanges = applyNaturalScrolling(writer, *config.system);
        outcome.reloginRequired = scrollingChanges > 0;
        outcome.changes += scrollingChanges;
    }
    if (config.magicMouse.has_value()) {
        outcome.changes += applyMagicMouse(writer, *config.magicMouse);
    }
    if (config.finder.has_value()) {
        const int changes = applyFinder(writer, *config.finder);
        restarts.record(Subsystem::Finder, changes > 0);
        outcome.changes += changes;
    }

    const std::vector<Subsystem> pending = restarts.pending();
    outcome.pendingRestarts = pending;
    if (m_dryRun) {
        HFLOG_INFO(QStringLiteral("MacosSettings"),
                   QStringLiteral("reconcile"),
                   QStringLiteral("subsystem_restart_skipped"),
                   QStringLiteral("dry_run"),
                   QStringLiteral("killall"),
                   hostform::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"pending", subsystemList(pending)}});
        return outcome;
    }

    for (Subsystem subsystem : pending) {
        if (restart(subsystem)) {
            outcome.restarted.push_back(subsystem);
        } else {
            outcome.restartFailed.push_back(subsystem);
        }
    }

    HFLOG_INFO(QStringLiteral("MacosSettings"),
               QStringLiteral("reconcile"),
               QStringLiteral("macos_settings_complete"),
               QStringLiteral("reconcile_step"),
               QStringLiteral("defaults"),
               hostform::logging::defaultWho(),
               QString(),
               nlohmann::json{{"changes", outcome.changes},
                              {"restarted", subsystemList(outcome.restarted)},
                              {"restartFailed", subsystemList(outcome.restartFailed)},
                              {"reloginRequired", outcome.reloginRequired}});
    return outcome;
}

} // namespace hostform
