#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/models.hpp"

namespace hostform {

namespace json_detail {

[[noreturn]] inline void invalidField(const std::string &key, const std::string &reason)
{
    throw ReconcileError(ErrorKind::ConfigInvalid,
                         "Invalid value for '" + key + "': " + reason);
}

// Absent and null both mean "not configured".
template <typename T>
void readOptional(const nlohmann::json &j, const std::string &key, std::optional<T> &out)
{
    out.reset();
    if (!j.contains(key) || j.at(key).is_null()) {
        return;
    }
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception &ex) {
        invalidField(key, ex.what());
    }
}

// nlohmann converts 48.7 to 48 on get<int>(); only whole numbers are accepted.
inline void readOptionalInteger(const nlohmann::json &j, const std::string &key,
                                std::optional<int> &out)
{
    if (j.contains(key) && !j.at(key).is_null() && !j.at(key).is_number_integer()) {
        invalidField(key, "expected an integer");
    }
    readOptional(j, key, out);
}

template <typename T>
void readList(const nlohmann::json &j, const std::string &key, std::vector<T> &out)
{
    out.clear();
    if (!j.contains(key) || j.at(key).is_null()) {
        return;
    }
    if (!j.at(key).is_array()) {
        invalidField(key, "expected an array");
    }
    try {
        out = j.at(key).get<std::vector<T>>();
    } catch (const nlohmann::json::exception &ex) {
        invalidField(key, ex.what());
    }
}

inline void requireObject(const nlohmann::json &j, const std::string &section)
{
    if (!j.is_object()) {
        invalidField(section, "expected a table/object");
    }
}

} // namespace json_detail

inline void from_json(const nlohmann::json &j, DockOrientation &orientation)
{
    if (!j.is_string()) {
        json_detail::invalidField("orientation", "expected a string");
    }
    const auto parsed = parseDockOrientationString(j.get<std::string>());
    if (!parsed.has_value()) {
        json_detail::invalidField("orientation",
                                  "expected one of left, bottom, right, got '"
                                      + j.get<std::string>() + "'");
    }
    orientation = *parsed;
}

inline void from_json(const nlohmann::json &j, FinderViewStyle &style)
{
    if (!j.is_string()) {
        json_detail::invalidField("view-style", "expected a string");
    }
    const auto parsed = parseFinderViewStyleString(j.get<std::string>());
    if (!parsed.has_value()) {
        json_detail::invalidField("view-style",
                                  "expected one of icon, list, column, gallery, got '"
                                      + j.get<std::string>() + "'");
    }
    style = *parsed;
}

inline void from_json(const nlohmann::json &j, BrewConfig &brew)
{
    json_detail::requireObject(j, "brew");
    json_detail::readList(j, "formulae", brew.formulae);
    json_detail::readList(j, "casks", brew.casks);
}

inline void from_json(const nlohmann::json &j, MasApp &app)
{
    json_detail::requireObject(j, "mas.apps[]");
    if (!j.contains("id")) {
        json_detail::invalidField("mas.apps[].id", "missing");
    }
    const auto &id = j.at("id");
    if (id.is_number_unsigned()) {
        app.id = std::to_string(id.get<unsigned long long>());
    } else if (id.is_string()) {
        app.id = id.get<std::string>();
    } else {
        json_detail::invalidField("mas.apps[].id", "expected a numeric id");
    }
    if (app.id.empty()
        || !std::all_of(app.id.begin(), app.id.end(), [](unsigned char ch) {
               return std::isdigit(ch) != 0;
           })) {
        json_detail::invalidField("mas.apps[].id", "expected digits, got '" + app.id + "'");
    }
    app.name = j.value("name", "");
    app.version.clear();
}

inline void from_json(const nlohmann::json &j, MasConfig &mas)
{
    json_detail::requireObject(j, "mas");
    json_detail::readList(j, "apps", mas.apps);
}

inline void from_json(const nlohmann::json &j, DotfileEntry &entry)
{
    if (j.is_string()) {
        entry.original = j.get<std::string>();
        entry.link.reset();
        return;
    }
    if (j.is_object() && j.contains("original") && j.contains("link")
        && j.at("original").is_string() && j.at("link").is_string()) {
        entry.original = j.at("original").get<std::string>();
        entry.link = std::filesystem::path(j.at("link").get<std::string>());
        return;
    }
    json_detail::invalidField("dotfiles.files[]",
                              "expected a path or an object with 'original' and 'link'");
}

inline void from_json(const nlohmann::json &j, DotfilesConfig &dotfiles)
{
    json_detail::requireObject(j, "dotfiles");
    json_detail::readList(j, "files", dotfiles.files);
}

inline void from_json(const nlohmann::json &j, VscodeConfig &vscode)
{
    json_detail::requireObject(j, "vscode");
    json_detail::readList(j, "extensions", vscode.extensions);
}

inline void from_json(const nlohmann::json &j, DockSettings &dock)
{
    json_detail::requireObject(j, "macos.dock");
    json_detail::readOptional(j, "orientation", dock.orientation);
    json_detail::readOptional(j, "autohide", dock.autohide);
    json_detail::readOptionalInteger(j, "icon-size", dock.iconSize);
    if (dock.iconSize.has_value() && *dock.iconSize <= 0) {
        json_detail::invalidField("icon-size", "expected a positive integer");
    }
}

inline void from_json(const nlohmann::json &j, MissionControlSettings &missionControl)
{
    json_detail::requireObject(j, "macos.mission-control");
    json_detail::readOptional(j, "group-windows-by-app", missionControl.groupWindowsByApp);
    json_detail::readOptional(j, "rearrange-spaces", missionControl.rearrangeSpaces);
}

inline void from_json(const nlohmann::json &j, SafariSettings &safari)
{
    json_detail::requireObject(j, "macos.safari");
    json_detail::readOptional(j, "show-full-url", safari.showFullUrl);
}

inline void from_json(const nlohmann::json &j, SystemSettings &system)
{
    json_detail::requireObject(j, "macos.system");
    json_detail::readOptional(j, "show-file-extensions", system.showFileExtensions);
    json_detail::readOptional(j, "natural-scrolling", system.naturalScrolling);
}

inline void from_json(const nlohmann::json &j, MagicMouseSettings &magicMouse)
{
    json_detail::requireObject(j, "macos.magic-mouse");
    json_detail::readOptional(j, "secondary-click", magicMouse.secondaryClick);
}

inline void from_json(const nlohmann::json &j, FinderSettings &finder)
{
    json_detail::requireObject(j, "macos.finder");
    json_detail::readOptional(j, "show-path-bar", finder.showPathBar);
    json_detail::readOptional(j, "show-status-bar", finder.showStatusBar);
    json_detail::readOptional(j, "view-style", finder.viewStyle);
}

inline void from_json(const nlohmann::json &j, MacosConfig &macos)
{
    json_detail::requireObject(j, "macos");
    json_detail::readOptional(j, "dock", macos.dock);
    json_detail::readOptional(j, "mission-control", macos.missionControl);
    json_detail::readOptional(j, "safari", macos.safari);
    json_detail::readOptional(j, "system", macos.system);
    json_detail::readOptional(j, "magic-mouse", macos.magicMouse);
    json_detail::readOptional(j, "finder", macos.finder);
}

inline void from_json(const nlohmann::json &j, SystemConfig &config)
{
    json_detail::requireObject(j, "system.json");
    json_detail::readOptional(j, "brew", config.brew);
    json_detail::readOptional(j, "mas", config.mas);
    json_detail::readOptional(j, "dotfiles", config.dotfiles);
    json_detail::readOptional(j, "vscode", config.vscode);
    json_detail::readOptional(j, "macos", config.macos);
}

} // namespace hostform
