#include "reconcile/mas_list_parser.hpp"

#include <cctype>
#include <regex>
#include <sstream>

#include "common/errors.hpp"

namespace hostform {

namespace {

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

} // namespace

MasApp parseMasListLine(const std::string &line)
{
    // Lazy name so the version group binds to the last parenthesized token.
    static const std::regex pattern(R"(^(\d+)\s+(.*?)\s*\(([^()]*)\)$)");

    const std::string record = trim(line);

    std::smatch match;
    if (!std::regex_match(record, match, pattern)) {
        throw ReconcileError(ErrorKind::ParseFailed,
                             "Unrecognized mas list record: '" + line + "'");
    }

    MasApp app;
    app.id = match[1].str();
    app.name = trim(match[2].str());
    app.version = trim(match[3].str());
    if (app.name.empty()) {
        throw ReconcileError(ErrorKind::ParseFailed,
                             "mas list record has no app name: '" + line + "'");
    }
    return app;
}

std::vector<MasApp> parseMasList(const std::string &output)
{
    std::vector<MasApp> apps;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (trim(line).empty()) {
            continue;
        }
        apps.push_back(parseMasListLine(line));
    }
    return apps;
}

} // namespace hostform
