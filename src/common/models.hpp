#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace hostform {

struct BrewConfig {
    std::vector<std::string> formulae;
    std::vector<std::string> casks;
};

// One app store application. Identity is the numeric id only; the name is
// informational and the version is only known for installed apps.
struct MasApp {
    std::string id;
    std::string name;
    std::string version;
};

struct MasConfig {
    std::vector<MasApp> apps;
};

// Implicit entries carry only `original`; the link mirrors it under $HOME.
struct DotfileEntry {
    std::filesystem::path original;
    std::optional<std::filesystem::path> link;
};

struct DotfilesConfig {
    std::vector<DotfileEntry> files;
};

struct VscodeConfig {
    std::vector<std::string> extensions;
};

struct DockSettings {
    std::optional<DockOrientation> orientation;
    std::optional<bool> autohide;
    std::optional<int> iconSize;
};

struct MissionControlSettings {
    std::optional<bool> groupWindowsByApp;
    std::optional<bool> rearrangeSpaces;
};

struct SafariSettings {
    std::optional<bool> showFullUrl;
};

struct SystemSettings {
    std::optional<bool> showFileExtensions;
    std::optional<bool> naturalScrolling;
};

struct MagicMouseSettings {
    std::optional<bool> secondaryClick;
};

struct FinderSettings {
    std::optional<bool> showPathBar;
    std::optional<bool> showStatusBar;
    std::optional<FinderViewStyle> viewStyle;
};

struct MacosConfig {
    std::optional<DockSettings> dock;
    std::optional<MissionControlSettings> missionControl;
    std::optional<SafariSettings> safari;
    std::optional<SystemSettings> system;
    std::optional<MagicMouseSettings> magicMouse;
    std::optional<FinderSettings> finder;
};

// Desired state for one run, loaded from system.json. Every section is
// optional and immutable once loaded.
struct SystemConfig {
    std::optional<BrewConfig> brew;
    std::optional<MasConfig> mas;
    std::optional<DotfilesConfig> dotfiles;
    std::optional<VscodeConfig> vscode;
    std::optional<MacosConfig> macos;
};

} // namespace hostform
