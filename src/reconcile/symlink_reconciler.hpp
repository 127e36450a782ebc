#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace hostform {

enum class LinkState {
    Absent,
    SymlinkCorrect,
    SymlinkWrong,
    SymlinkBroken,
    Occupied
};

std::string toLinkStateString(LinkState state);

struct ResolvedDotfile {
    std::filesystem::path source;
    std::filesystem::path target;
};

struct LinkOutcome {
    ResolvedDotfile paths;
    LinkState state = LinkState::Absent;
    bool createdParent = false;
    int removals = 0;
    int creations = 0;

    int mutations() const
    {
        return removals + creations + (createdParent ? 1 : 0);
    }
};

struct DotfilesOutcome {
    std::vector<LinkOutcome> entries;

    bool changed() const;
    int mutations() const;
};

// Replaces a leading "~" segment with home. Only the first segment is
// considered; "~user/..." and paths with "~" elsewhere are returned as-is.
std::filesystem::path expandHomeMarker(const std::filesystem::path &path,
                                       const std::filesystem::path &home);

ResolvedDotfile resolveDotfile(const DotfileEntry &entry,
                               const std::filesystem::path &dotfilesRoot,
                               const std::filesystem::path &home);

// What currently sits at target, relative to the expected source.
// Relative link targets are resolved against the link's directory.
LinkState classifyLink(const std::filesystem::path &target,
                       const std::filesystem::path &source);

/**
 * Converges dotfile links under home onto sources under the dotfiles root.
 *
 * reconcile() first resolves and classifies every entry, failing with
 * PreconditionNotFound for a missing source and FilesystemConflict for a
 * target occupied by a real file or directory. Only then are links created
 * or replaced, in declared order. apply() classifies the target again right
 * before changing it, so a target repeated in the list is fixed once.
 * Filesystem errors propagate as std::filesystem::filesystem_error. Nothing
 * that is not a symlink is ever removed.
 */
class SymlinkReconciler
{
public:
    // Throws PreconditionNotFound when dotfilesRoot does not exist.
    SymlinkReconciler(const std::filesystem::path &dotfilesRoot,
                      std::filesystem::path home,
                      bool dryRun = false);

    std::vector<LinkOutcome> plan(const std::vector<DotfileEntry> &entries) const;
    void apply(LinkOutcome &outcome) const;
    DotfilesOutcome reconcile(const std::vector<DotfileEntry> &entries) const;

private:
    std::filesystem::path m_root;
    std::filesystem::path m_home;
    bool m_dryRun = false;
};

} // namespace hostform
