#pragma once

#include "carryover/common/result.hpp"
#include "carryover/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace carryover::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] common::Result<std::filesystem::path> sessions_dir(const Config &config);
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Keys not set in `toml` keep their defaults. Fails with InvalidConfig on malformed TOML or
/// when a known key holds a value of the wrong type.
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Hard errors fail with InvalidConfig; soft issues come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// CARRYOVER_SESSIONS_DIR and CARRYOVER_MAX_TOKENS_PER_SEGMENT; unparsable numbers are ignored.
void apply_env_overrides(Config &config);

} // namespace carryover::config
