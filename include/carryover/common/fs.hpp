#pragma once

#include "carryover/common/result.hpp"
#include <filesystem>
#include <string>

namespace carryover::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] std::filesystem::path normalize_path(const std::filesystem::path &path);

/// UTC wall clock formatted as RFC3339 with millisecond precision.
[[nodiscard]] std::string now_rfc3339();

/// Random version 4 UUID text drawn from OpenSSL RAND_bytes. Fails when the RNG is unseeded.
[[nodiscard]] Result<std::string> generate_uuid();

} // namespace carryover::common
