#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace hostform {

/**
 * Parse one line of `mas list` output:
 *
 *     <digits><ws><name><ws>(<version>)
 *
 * The id is the leading run of digits, the version is the parenthesized
 * token anchored at the end of the line, and the name is everything in
 * between, trimmed. The name may contain spaces, parentheses and non-ASCII
 * glyphs. Leading and trailing whitespace on the line is ignored.
 *
 * Throws ReconcileError(ParseFailed) when the line does not have that shape.
 */
MasApp parseMasListLine(const std::string &line);

// Parses every non-blank line; the first malformed line throws.
std::vector<MasApp> parseMasList(const std::string &output);

} // namespace hostform
