#include "carryover/config/config.hpp"

#include "carryover/common/fs.hpp"
#include "carryover/common/toml.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace carryover::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".carryover";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *SESSIONS_FOLDER = "sessions";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("CARRYOVER_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

bool is_known_backend(const std::string &name) {
  return name == "none" || name == "noop" || name == "log" || name == "log-verbose" ||
         name == "debug";
}

struct KeySchema {
  const char *key;
  common::TomlKind kind;
  const char *expected;
};

constexpr KeySchema kKnownKeys[] = {
    {"sessions_dir", common::TomlKind::String, "a string"},
    {"restore.max_tokens_per_segment", common::TomlKind::Integer, "an integer"},
    {"restore.handshake_timeout_ms", common::TomlKind::Integer, "an integer"},
    {"restore.auto_fallback", common::TomlKind::Bool, "a boolean"},
    {"restore.unattended_replay", common::TomlKind::Bool, "a boolean"},
    {"restore.show_all_projects", common::TomlKind::Bool, "a boolean"},
    {"restore.interactive", common::TomlKind::Bool, "a boolean"},
    {"project.markers", common::TomlKind::StringArray, "an array of strings"},
    {"execution.model", common::TomlKind::String, "a string"},
    {"execution.reasoning_effort", common::TomlKind::String, "a string"},
    {"execution.sandbox_policy", common::TomlKind::String, "a string"},
    {"observability.backend", common::TomlKind::String, "a string"},
};

// Unknown keys are tolerated; a known key holding the wrong type is an error.
common::Status check_key_types(const common::TomlDocument &doc) {
  for (const auto &schema : kKnownKeys) {
    const auto it = doc.values.find(schema.key);
    if (it != doc.values.end() && it->second.kind != schema.kind) {
      return common::Status::error(common::ErrorCode::InvalidConfig,
                                   std::string(schema.key) + " must be " + schema.expected +
                                       " (line " + std::to_string(it->second.line) + ")");
    }
  }
  return common::Status::success();
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorCode::Io, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.status());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

common::Result<std::filesystem::path> sessions_dir(const Config &config) {
  if (!common::trim(config.sessions_dir).empty()) {
    return common::ensure_dir(common::expand_path(config.sessions_dir));
  }
  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.status());
  }
  return common::ensure_dir(cfg_dir.value() / SESSIONS_FOLDER);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *dir = std::getenv("CARRYOVER_SESSIONS_DIR"); dir != nullptr && *dir) {
    config.sessions_dir = common::expand_path(dir);
  }

  if (const char *max_tokens = std::getenv("CARRYOVER_MAX_TOKENS_PER_SEGMENT");
      max_tokens != nullptr && *max_tokens) {
    const std::string value = common::trim(max_tokens);
    std::int64_t parsed = 0;
    const auto *first = value.data();
    const auto *last = first + value.size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec == std::errc() && ptr == last) {
      config.restore.max_tokens_per_segment = parsed;
    }
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }

  const auto &doc = parsed.value();
  if (auto status = check_key_types(doc); !status.ok()) {
    return common::Result<Config>::failure(status);
  }
  Config config;
  config.sessions_dir = expand_config_value(doc.get_string("sessions_dir", config.sessions_dir));

  auto &restore = config.restore;
  restore.max_tokens_per_segment =
      doc.get_i64("restore.max_tokens_per_segment", restore.max_tokens_per_segment);
  restore.handshake_timeout_ms =
      doc.get_i64("restore.handshake_timeout_ms", restore.handshake_timeout_ms);
  restore.auto_fallback = doc.get_bool("restore.auto_fallback", restore.auto_fallback);
  restore.unattended_replay = doc.get_bool("restore.unattended_replay", restore.unattended_replay);
  restore.show_all_projects = doc.get_bool("restore.show_all_projects", restore.show_all_projects);
  restore.interactive = doc.get_bool("restore.interactive", restore.interactive);

  config.project.markers = doc.get_string_array("project.markers", config.project.markers);

  config.execution.model = doc.get_string("execution.model");
  config.execution.reasoning_effort = doc.get_string("execution.reasoning_effort");
  config.execution.sandbox_policy = doc.get_string("execution.sandbox_policy");

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::ErrorCode::Io,
                                           "Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return config;
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return cfg_path_result.status();
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error(common::ErrorCode::Io,
                                   "Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error(common::ErrorCode::Io, "Unable to write temporary config file");
  }

  if (!config.sessions_dir.empty()) {
    file << "sessions_dir = " << common::quote_toml_string(config.sessions_dir) << "\n";
  }

  file << "\n[restore]\n";
  file << "max_tokens_per_segment = " << config.restore.max_tokens_per_segment << "\n";
  file << "handshake_timeout_ms = " << config.restore.handshake_timeout_ms << "\n";
  file << "auto_fallback = " << bool_to_toml(config.restore.auto_fallback) << "\n";
  file << "unattended_replay = " << bool_to_toml(config.restore.unattended_replay) << "\n";
  file << "show_all_projects = " << bool_to_toml(config.restore.show_all_projects) << "\n";
  file << "interactive = " << bool_to_toml(config.restore.interactive) << "\n";

  file << "\n[project]\n";
  file << "markers = " << common::toml_string_array(config.project.markers) << "\n";

  file << "\n[execution]\n";
  file << "model = " << common::quote_toml_string(config.execution.model) << "\n";
  file << "reasoning_effort = " << common::quote_toml_string(config.execution.reasoning_effort)
       << "\n";
  file << "sandbox_policy = " << common::quote_toml_string(config.execution.sandbox_policy)
       << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  file.close();
  if (!file) {
    return common::Status::error(common::ErrorCode::Io, "Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error(common::ErrorCode::Io,
                                 "Failed replacing config file: " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.restore.max_tokens_per_segment <= 0) {
    return Warnings::failure(common::ErrorCode::InvalidConfig,
                             "restore.max_tokens_per_segment must be positive");
  }
  if (config.restore.handshake_timeout_ms <= 0) {
    return Warnings::failure(common::ErrorCode::InvalidConfig,
                             "restore.handshake_timeout_ms must be positive");
  }
  if (config.restore.max_tokens_per_segment < 200) {
    warnings.push_back("restore.max_tokens_per_segment is very small; replay will send many "
                       "segments");
  }
  if (config.restore.unattended_replay && !config.restore.auto_fallback) {
    warnings.push_back("restore.unattended_replay has no effect on background fallback while "
                       "restore.auto_fallback is disabled");
  }

  if (config.project.markers.empty()) {
    warnings.push_back("project.markers is empty; every directory is its own project root");
  }
  for (const auto &marker : config.project.markers) {
    if (common::trim(marker).empty() || marker.find('/') != std::string::npos) {
      return Warnings::failure(common::ErrorCode::InvalidConfig,
                               "project.markers entries must be plain file names: " + marker);
    }
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    if (!is_known_backend(common::trim(part))) {
      return Warnings::failure(common::ErrorCode::InvalidConfig,
                               "Invalid observability.backend: " + config.observability.backend);
    }
  }

  return Warnings::success(std::move(warnings));
}

} // namespace carryover::config
