#include "reconcile/symlink_reconciler.hpp"

#include <system_error>
#include <utility>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace fs = std::filesystem;

namespace hostform {

namespace {

nlohmann::json outcomeContext(const LinkOutcome &outcome)
{
    return nlohmann::json{{"source", outcome.paths.source.string()},
                          {"target", outcome.paths.target.string()},
                          {"state", toLinkStateString(outcome.state)}};
}

} // namespace

std::string toLinkStateString(LinkState state)
{
    switch (state) {
    case LinkState::Absent:
        return "absent";
    case LinkState::SymlinkCorrect:
        return "symlink_correct";
    case LinkState::SymlinkWrong:
        return "symlink_wrong";
    case LinkState::SymlinkBroken:
        return "symlink_broken";
    case LinkState::Occupied:
        return "occupied";
    }
    return "absent";
}

bool DotfilesOutcome::changed() const
{
    return mutations() > 0;
}

int DotfilesOutcome::mutations() const
{
    int total = 0;
    for (const LinkOutcome &entry : entries) {
        total += entry.mutations();
    }
    return total;
}

fs::path expandHomeMarker(const fs::path &path, const fs::path &home)
{
    auto it = path.begin();
    if (it == path.end() || *it != fs::path("~")) {
        return path;
    }

    fs::path expanded = home;
    for (++it; it != path.end(); ++it) {
        expanded /= *it;
    }
    return expanded;
}

ResolvedDotfile resolveDotfile(const DotfileEntry &entry, const fs::path &dotfilesRoot,
                               const fs::path &home)
{
    ResolvedDotfile resolved;
    resolved.source = dotfilesRoot / entry.original;
    if (entry.link.has_value()) {
        resolved.target = expandHomeMarker(*entry.link, home);
    } else {
        resolved.target = home / entry.original;
    }
    return resolved;
}

LinkState classifyLink(const fs::path &target, const fs::path &source)
{
    // Throws only for errors other than "not found".
    const fs::file_status status = fs::symlink_status(target);
    if (status.type() == fs::file_type::not_found) {
        return LinkState::Absent;
    }
    if (!fs::is_symlink(status)) {
        return LinkState::Occupied;
    }

    const fs::path referent = fs::read_symlink(target);
    const fs::path resolved = referent.is_absolute()
        ? referent
        : target.parent_path() / referent;
    if (resolved.lexically_normal() == source.lexically_normal()) {
        return LinkState::SymlinkCorrect;
    }

    std::error_code error;
    if (!fs::exists(target, error)) {
        return LinkState::SymlinkBroken;
    }
    if (fs::equivalent(target, source, error)) {
        return LinkState::SymlinkCorrect;
    }
    return LinkState::SymlinkWrong;
}

SymlinkReconciler::SymlinkReconciler(const fs::path &dotfilesRoot, fs::path home,
                                     bool dryRun)
    : m_home(std::move(home))
    , m_dryRun(dryRun)
{
    if (!fs::exists(dotfilesRoot)) {
        throw ReconcileError(ErrorKind::PreconditionNotFound,
                             "Dotfiles directory not found: " + dotfilesRoot.string());
    }
    m_root = fs::canonical(dotfilesRoot);
}

std::vector<LinkOutcome> SymlinkReconciler::plan(const std::vector<DotfileEntry> &entries) const
{
    std::vector<LinkOutcome> planned;
    planned.reserve(entries.size());

    for (const DotfileEntry &entry : entries) {
        LinkOutcome outcome;
        outcome.paths = resolveDotfile(entry, m_root, m_home);

        if (!fs::exists(outcome.paths.source)) {
            HFLOG_ERROR(QStringLiteral("SymlinkReconciler"),
                        QStringLiteral("plan"),
                        QStringLiteral("dotfile_source_missing"),
                        QStringLiteral("precondition_check"),
                        QStringLiteral("filesystem_exists"),
                        hostform::logging::defaultWho(),
                        QString(),
                        nlohmann::json{{"source", outcome.paths.source.string()}});
            throw ReconcileError(ErrorKind::PreconditionNotFound,
                                 "Original dotfile not found: "
                                     + outcome.paths.source.string());
        }

        outcome.state = classifyLink(outcome.paths.target, outcome.paths.source);
        if (outcome.state == LinkState::Occupied) {
            HFLOG_ERROR(QStringLiteral("SymlinkReconciler"),
                        QStringLiteral("plan"),
                        QStringLiteral("dotfile_target_occupied"),
                        QStringLiteral("link_classification"),
                        QStringLiteral("symlink_status"),
                        hostform::logging::defaultWho(),
                        QString(),
                        outcomeContext(outcome));
            throw ReconcileError(ErrorKind::FilesystemConflict,
                                 "Link path already exists as a file/directory: "
                                     + outcome.paths.target.string()
                                     + "\nPlease back up and remove it manually, then run"
                                       " hostform again.");
        }

        planned.push_back(std::move(outcome));
    }
    return planned;
}

void SymlinkReconciler::apply(LinkOutcome &outcome) const
{
    // An earlier entry with the same target may already have fixed it.
    if (!m_dryRun && outcome.state != LinkState::SymlinkCorrect) {
        outcome.state = classifyLink(outcome.paths.target, outcome.paths.source);
        if (outcome.state == LinkState::Occupied) {
            throw ReconcileError(ErrorKind::FilesystemConflict,
                                 "Link path already exists as a file/directory: "
                                     + outcome.paths.target.string());
        }
    }

    if (outcome.state == LinkState::SymlinkCorrect) {
        HFLOG_DEBUG(QStringLiteral("SymlinkReconciler"),
                    QStringLiteral("apply"),
                    QStringLiteral("dotfile_already_linked"),
                    QStringLiteral("link_classification"),
                    QStringLiteral("noop"),
                    hostform::logging::defaultWho(),
                    QString(),
                    outcomeContext(outcome));
        return;
    }

    const bool replace = outcome.state == LinkState::SymlinkWrong
        || outcome.state == LinkState::SymlinkBroken;

    if (m_dryRun) {
        HFLOG_INFO(QStringLiteral("SymlinkReconciler"),
                   QStringLiteral("apply"),
                   QStringLiteral("dotfile_link_skipped"),
                   QStringLiteral("dry_run"),
                   replace ? QStringLiteral("remove_then_symlink") : QStringLiteral("symlink"),
                   hostform::logging::defaultWho(),
                   QString(),
                   outcomeContext(outcome));
        return;
    }

    const fs::path parent = outcome.paths.target.parent_path();
    if (!parent.empty() && !fs::exists(parent)) {
        fs::create_directories(parent);
        outcome.createdParent = true;
    }

    if (replace) {
        fs::remove(outcome.paths.target);
        ++outcome.removals;
    }

    fs::create_symlink(outcome.paths.source, outcome.paths.target);
    ++outcome.creations;

    nlohmann::json context = outcomeContext(outcome);
    context["createdParent"] = outcome.createdParent;
    HFLOG_INFO(QStringLiteral("SymlinkReconciler"),
               QStringLiteral("apply"),
               replace ? QStringLiteral("dotfile_relinked") : QStringLiteral("dotfile_linked"),
               QStringLiteral("link_classification"),
               replace ? QStringLiteral("remove_then_symlink") : QStringLiteral("symlink"),
               hostform::logging::defaultWho(),
               QString(),
               context);
}

DotfilesOutcome SymlinkReconciler::reconcile(const std::vector<DotfileEntry> &entries) const
{
    DotfilesOutcome outcome;
    outcome.entries = plan(entries);
    for (LinkOutcome &entry : outcome.entries) {
        apply(entry);
    }
    return outcome;
}

} // namespace hostform
