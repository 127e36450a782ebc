#pragma once

#include <filesystem>
#include <string>

#include "common/models.hpp"

namespace hostform {

inline constexpr const char *kSystemConfigFileName = "system.json";

/**
 * Load the desired state from <configDir>/system.json.
 *
 * Throws ReconcileError(ConfigInvalid) when the file is missing, is not valid
 * JSON, or a field has the wrong type or an unknown enumerated value.
 */
SystemConfig loadSystemConfig(const std::filesystem::path &configDir);

// Same as loadSystemConfig, for an in-memory document.
SystemConfig parseSystemConfig(const std::string &document);

} // namespace hostform
