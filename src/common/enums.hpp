#pragma once

#include <optional>
#include <string>

namespace hostform {

enum class DockOrientation {
    Left,
    Bottom,
    Right
};

enum class MouseButtonMode {
    OneButton,
    TwoButton
};

enum class FinderViewStyle {
    Icon,
    List,
    Column,
    Gallery
};

// Processes that only pick up preference writes after a restart.
enum class Subsystem {
    Dock,
    Safari,
    Finder
};

inline std::string toDockOrientationString(DockOrientation orientation)
{
    switch (orientation) {
    case DockOrientation::Left:
        return "left";
    case DockOrientation::Bottom:
        return "bottom";
    case DockOrientation::Right:
        return "right";
    }
    return "bottom";
}

inline std::optional<DockOrientation> parseDockOrientationString(const std::string &value)
{
    if (value == "left") {
        return DockOrientation::Left;
    }
    if (value == "bottom") {
        return DockOrientation::Bottom;
    }
    if (value == "right") {
        return DockOrientation::Right;
    }
    return std::nullopt;
}

// Tokens as stored by the defaults database.
inline std::string toMouseButtonModeString(MouseButtonMode mode)
{
    switch (mode) {
    case MouseButtonMode::OneButton:
        return "OneButton";
    case MouseButtonMode::TwoButton:
        return "TwoButton";
    }
    return "OneButton";
}

inline std::optional<MouseButtonMode> parseMouseButtonModeString(const std::string &value)
{
    if (value == "OneButton") {
        return MouseButtonMode::OneButton;
    }
    if (value == "TwoButton") {
        return MouseButtonMode::TwoButton;
    }
    return std::nullopt;
}

// Finder stores its view style as a four letter code.
inline std::string toFinderViewStyleCode(FinderViewStyle style)
{
    switch (style) {
    case FinderViewStyle::Icon:
        return "icnv";
    case FinderViewStyle::List:
        return "Nlsv";
    case FinderViewStyle::Column:
        return "clmv";
    case FinderViewStyle::Gallery:
        return "Flwv";
    }
    return "icnv";
}

inline std::optional<FinderViewStyle> parseFinderViewStyleCode(const std::string &value)
{
    if (value == "icnv") {
        return FinderViewStyle::Icon;
    }
    if (value == "Nlsv") {
        return FinderViewStyle::List;
    }
    if (value == "clmv") {
        return FinderViewStyle::Column;
    }
    if (value == "Flwv") {
        return FinderViewStyle::Gallery;
    }
    return std::nullopt;
}

// Names used in system.json.
inline std::string toFinderViewStyleString(FinderViewStyle style)
{
    switch (style) {
    case FinderViewStyle::Icon:
        return "icon";
    case FinderViewStyle::List:
        return "list";
    case FinderViewStyle::Column:
        return "column";
    case FinderViewStyle::Gallery:
        return "gallery";
    }
    return "icon";
}

inline std::optional<FinderViewStyle> parseFinderViewStyleString(const std::string &value)
{
    if (value == "icon") {
        return FinderViewStyle::Icon;
    }
    if (value == "list") {
        return FinderViewStyle::List;
    }
    if (value == "column") {
        return FinderViewStyle::Column;
    }
    if (value == "gallery") {
        return FinderViewStyle::Gallery;
    }
    return std::nullopt;
}

// Process name handed to killall.
inline std::string toSubsystemProcessName(Subsystem subsystem)
{
    switch (subsystem) {
    case Subsystem::Dock:
        return "Dock";
    case Subsystem::Safari:
        return "Safari";
    case Subsystem::Finder:
        return "Finder";
    }
    return "Dock";
}

} // namespace hostform
