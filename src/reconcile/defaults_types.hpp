#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>

#include "common/enums.hpp"

namespace hostform {

// Type tags for the defaults database. Each specialization owns the
// `defaults write` type flag, how `defaults read` output is parsed (nullopt
// when the text is not a value of that type), and how a value is written.
// A new scalar kind is a new specialization; DefaultsWriter stays the same.
template <typename T>
struct DefaultsType;

namespace defaults_detail {

inline std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

} // namespace defaults_detail

template <>
struct DefaultsType<bool> {
    static constexpr const char *typeFlag = "-bool";

    // defaults prints booleans as 1/0, but plists written by hand may say
    // true/false in any case.
    static std::optional<bool> parse(const std::string &text)
    {
        const std::string lowered = defaults_detail::toLower(text);
        if (lowered == "1" || lowered == "true") {
            return true;
        }
        if (lowered == "0" || lowered == "false") {
            return false;
        }
        return std::nullopt;
    }

    static std::string serialize(bool value)
    {
        return value ? "true" : "false";
    }
};

template <>
struct DefaultsType<int> {
    static constexpr const char *typeFlag = "-int";

    static std::optional<int> parse(const std::string &text)
    {
        int value = 0;
        const char *begin = text.data();
        const char *end = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end || text.empty()) {
            return std::nullopt;
        }
        return value;
    }

    static std::string serialize(int value)
    {
        return std::to_string(value);
    }
};

template <>
struct DefaultsType<DockOrientation> {
    static constexpr const char *typeFlag = "-string";

    static std::optional<DockOrientation> parse(const std::string &text)
    {
        return parseDockOrientationString(defaults_detail::toLower(text));
    }

    static std::string serialize(DockOrientation value)
    {
        return toDockOrientationString(value);
    }
};

template <>
struct DefaultsType<MouseButtonMode> {
    static constexpr const char *typeFlag = "-string";

    static std::optional<MouseButtonMode> parse(const std::string &text)
    {
        return parseMouseButtonModeString(text);
    }

    static std::string serialize(MouseButtonMode value)
    {
        return toMouseButtonModeString(value);
    }
};

template <>
struct DefaultsType<FinderViewStyle> {
    static constexpr const char *typeFlag = "-string";

    static std::optional<FinderViewStyle> parse(const std::string &text)
    {
        return parseFinderViewStyleCode(text);
    }

    static std::string serialize(FinderViewStyle value)
    {
        return toFinderViewStyleCode(value);
    }
};

} // namespace hostform
