#include "cli/run_coordinator.hpp"

#include <QString>
#include <QUuid>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "providers/brew_provider.hpp"
#include "providers/macos_settings.hpp"
#include "providers/mas_provider.hpp"
#include "providers/vscode_provider.hpp"
#include "reconcile/symlink_reconciler.hpp"

namespace hostform {

namespace {

template <typename Identity>
KindSummary summarizeSet(const std::string &kind, const SetOutcome<Identity> &outcome)
{
    KindSummary summary;
    summary.kind = kind;
    summary.configured = true;
    summary.changes = static_cast<int>(outcome.missing.size());
    return summary;
}

} // namespace

int RunSummary::totalChanges() const
{
    int total = 0;
    for (const KindSummary &kind : kinds) {
        total += kind.changes;
    }
    return total;
}

const KindSummary *RunSummary::find(const std::string &kind) const
{
    for (const KindSummary &entry : kinds) {
        if (entry.kind == kind) {
            return &entry;
        }
    }
    return nullptr;
}

RunCoordinator::RunCoordinator(ProcessExecutor &executor, std::ostream &out, bool dryRun)
    : m_executor(executor)
    , m_out(out)
    , m_dryRun(dryRun)
{
}

RunSummary RunCoordinator::run(const SystemConfig &config,
                               const std::filesystem::path &dotfilesDir,
                               const std::filesystem::path &home)
{
    const logging::CorrelationScope scope(QUuid::createUuid().toString(QUuid::WithoutBraces));

    HFLOG_INFO(QStringLiteral("RunCoordinator"),
               QStringLiteral("run"),
               QStringLiteral("run_start"),
               QStringLiteral("user_invocation"),
               m_dryRun ? QStringLiteral("dry_run") : QStringLiteral("apply"),
               hostform::logging::defaultWho(),
               QString(),
               nlohmann::json{{"dotfilesDir", dotfilesDir.string()},
                              {"home", home.string()}});

    RunSummary summary;
    summary.dryRun = m_dryRun;

    runBrew(config.brew, summary);
    runMas(config.mas, summary);
    runDotfiles(config.dotfiles, dotfilesDir, home, summary);
    runVscode(config.vscode, summary);
    runMacos(config.macos, summary);

    HFLOG_INFO(QStringLiteral("RunCoordinator"),
               QStringLiteral("run"),
               QStringLiteral("run_complete"),
               QStringLiteral("user_invocation"),
               m_dryRun ? QStringLiteral("dry_run") : QStringLiteral("apply"),
               hostform::logging::defaultWho(),
               QString(),
               nlohmann::json{{"changes", summary.totalChanges()}});
    return summary;
}

void RunCoordinator::runBrew(const std::optional<BrewConfig> &brew, RunSummary &summary)
{
    if (!brew.has_value()) {
        reportMissingSection("brew", summary);
        return;
    }

    BrewProvider provider(m_executor, m_dryRun);
    provider.checkInstalled();

    const KindSummary formulae = summarizeSet("brew-formulae",
                                              provider.reconcileFormulae(brew->formulae));
    reportKind(formulae);
    summary.kinds.push_back(formulae);

    const KindSummary casks = summarizeSet("brew-casks", provider.reconcileCasks(brew->casks));
    reportKind(casks);
    summary.kinds.push_back(casks);
}

void RunCoordinator::runMas(const std::optional<MasConfig> &mas, RunSummary &summary)
{
    if (!mas.has_value()) {
        reportMissingSection("mas", summary);
        return;
    }

    MasProvider provider(m_executor, m_dryRun);
    provider.checkInstalled();

    const KindSummary apps = summarizeSet("mas", provider.reconcile(mas->apps));
    reportKind(apps);
    summary.kinds.push_back(apps);
}

void RunCoordinator::runDotfiles(const std::optional<DotfilesConfig> &dotfiles,
                                 const std::filesystem::path &dotfilesDir,
                                 const std::filesystem::path &home,
                                 RunSummary &summary)
{
    if (!dotfiles.has_value()) {
        reportMissingSection("dotfiles", summary);
        return;
    }

    const SymlinkReconciler reconciler(dotfilesDir, home, m_dryRun);
    const DotfilesOutcome outcome = reconciler.reconcile(dotfiles->files);

    KindSummary kind;
    kind.kind = "dotfiles";
    kind.configured = true;
    for (const LinkOutcome &entry : outcome.entries) {
        if (entry.state != LinkState::SymlinkCorrect) {
            ++kind.changes;
            m_out << "  " << toLinkStateString(entry.state) << ": "
                  << entry.paths.target.string() << " -> " << entry.paths.source.string()
                  << "\n";
        }
    }
    reportKind(kind);
    summary.kinds.push_back(kind);
}

void RunCoordinator::runVscode(const std::optional<VscodeConfig> &vscode, RunSummary &summary)
{
    if (!vscode.has_value()) {
        reportMissingSection("vscode", summary);
        return;
    }

    VscodeProvider provider(m_executor, m_dryRun);
    provider.checkInstalled();

    const KindSummary extensions = summarizeSet("vscode", provider.reconcile(vscode->extensions));
    reportKind(extensions);
    summary.kinds.push_back(extensions);
}

void RunCoordinator::runMacos(const std::optional<MacosConfig> &macos, RunSummary &summary)
{
    if (!macos.has_value()) {
        reportMissingSection("macos", summary);
        return;
    }

    MacosSettingsProvider provider(m_executor, m_dryRun);
    provider.checkInstalled();
    const MacosOutcome outcome = provider.reconcile(*macos);

    KindSummary kind;
    kind.kind = "macos";
    kind.configured = true;
    kind.changes = outcome.changes;
    reportKind(kind);
    summary.kinds.push_back(kind);

    summary.restarted = outcome.restarted;
    summary.restartFailed = outcome.restartFailed;
    summary.reloginRequired = outcome.reloginRequired;

    if (m_dryRun) {
        for (Subsystem subsystem : outcome.pendingRestarts) {
            m_out << "  would restart " << toSubsystemProcessName(subsystem) << "\n";
        }
    }
    for (Subsystem subsystem : outcome.restarted) {
        m_out << "  restarted " << toSubsystemProcessName(subsystem) << "\n";
    }
    for (Subsystem subsystem : outcome.restartFailed) {
        m_out << "  could not restart " << toSubsystemProcessName(subsystem)
              << " (is it running?)\n";
    }
    if (outcome.reloginRequired) {
        m_out << "  log out and back in for the scrolling change to take effect\n";
    }
}

void RunCoordinator::reportMissingSection(const std::string &section, RunSummary &summary)
{
    KindSummary kind;
    kind.kind = section;
    summary.kinds.push_back(kind);

    m_out << "No `" << section << "` section in configuration, skipping\n";
    HFLOG_INFO(QStringLiteral("RunCoordinator"),
               QStringLiteral("reportMissingSection"),
               QStringLiteral("section_not_configured"),
               QStringLiteral("config_section_absent"),
               QStringLiteral("skip"),
               hostform::logging::defaultWho(),
               QString(),
               nlohmann::json{{"section", section}});
}

void RunCoordinator::reportKind(const KindSummary &kind)
{
    if (kind.changes == 0) {
        m_out << kind.kind << ": up to date\n";
    } else if (m_dryRun) {
        m_out << kind.kind << ": " << kind.changes << " change(s) pending\n";
    } else {
        m_out << kind.kind << ": " << kind.changes << " change(s) applied\n";
    }

    HFLOG_INFO(QStringLiteral("RunCoordinator"),
               QStringLiteral("reportKind"),
               QStringLiteral("resource_kind_complete"),
               QStringLiteral("reconcile_step"),
               m_dryRun ? QStringLiteral("dry_run") : QStringLiteral("apply"),
               hostform::logging::defaultWho(),
               QString(),
               nlohmann::json{{"kind", kind.kind}, {"changes", kind.changes}});
}

} // namespace hostform
