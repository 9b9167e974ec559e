#include "carryover/cli/commands.hpp"

#include "carryover/common/fs.hpp"
#include "carryover/config/config.hpp"
#include "carryover/observability/factory.hpp"
#include "carryover/observability/global.hpp"
#include "carryover/restore/orchestrator.hpp"
#include "carryover/restore/planner.hpp"
#include "carryover/restore/project_scope.hpp"
#include "carryover/restore/reconciler.hpp"
#include "carryover/rollout/catalog.hpp"
#include "carryover/rollout/reader.hpp"
#include "carryover/rollout/transcript.hpp"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace carryover::cli {

namespace {

std::string version_string() {
#ifdef CARRYOVER_VERSION
  std::string version = CARRYOVER_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "carryover " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

struct Environment {
  config::Config config;
  std::filesystem::path sessions_dir;
};

// Loads and validates config, installs the configured observer and resolves the sessions dir.
common::Result<Environment> load_environment() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return common::Result<Environment>::failure(cfg.status());
  }
  auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    return common::Result<Environment>::failure(warnings.status());
  }
  for (const auto &warning : warnings.value()) {
    std::cerr << "[WARN] " << warning << "\n";
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));

  auto dir = config::sessions_dir(cfg.value());
  if (!dir.ok()) {
    return common::Result<Environment>::failure(dir.status());
  }
  return common::Result<Environment>::success(
      Environment{.config = std::move(cfg.value()), .sessions_dir = dir.value()});
}

int report_error(const std::string &context, const common::Status &status) {
  std::cerr << context << ": " << status.error() << " ("
            << common::error_code_name(status.code()) << ")\n";
  return 1;
}

std::filesystem::path current_dir() {
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  return ec ? std::filesystem::path(".") : cwd;
}

int run_sessions(std::vector<std::string> args) {
  auto env = load_environment();
  if (!env.ok()) {
    return report_error("sessions", env.status());
  }

  rollout::CatalogFilter filter;
  filter.show_all = take_flag(args, "--all") || env.value().config.restore.show_all_projects;
  (void)take_option(args, "--search", "-s", filter.query);
  filter.project_root =
      restore::resolve_project_root(current_dir(), env.value().config.project.markers);

  const auto sessions = rollout::list_rollouts(env.value().sessions_dir, filter);
  if (sessions.empty()) {
    std::cout << (filter.show_all ? "No sessions found.\n"
                                  : "No sessions found for this project (use --all).\n");
    return 0;
  }
  for (const auto &summary : sessions) {
    std::cout << rollout::format_summary_label(summary) << "\n";
    std::cout << "  " << summary.path.string();
    if (summary.resume_token.has_value()) {
      std::cout << "  [resumable]";
    }
    std::cout << "\n";
  }
  return 0;
}

int run_show(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: carryover show PATH\n";
    return 1;
  }
  auto loaded = rollout::read_rollout(args[0]);
  if (!loaded.ok()) {
    return report_error("show", loaded.status());
  }
  const auto &source = loaded.value();
  std::cout << "session " << source.header.session_id << " (" << source.header.timestamp
            << ")\n";
  if (source.header.recorded_project_root.has_value()) {
    std::cout << "project " << *source.header.recorded_project_root << "\n";
  }
  std::cout << "\n";
  for (const auto &line : rollout::render_item_lines(source.items())) {
    std::cout << line << "\n";
  }
  if (source.skipped_lines > 0) {
    std::cerr << "[WARN] skipped " << source.skipped_lines << " unreadable line(s)\n";
  }
  return 0;
}

int run_plan(std::vector<std::string> args) {
  auto env = load_environment();
  if (!env.ok()) {
    return report_error("plan", env.status());
  }
  std::int64_t max_tokens = env.value().config.restore.max_tokens_per_segment;
  std::string max_tokens_raw;
  if (take_option(args, "--max-tokens", "", max_tokens_raw)) {
    const auto *first = max_tokens_raw.data();
    const auto *last = first + max_tokens_raw.size();
    auto [ptr, ec] = std::from_chars(first, last, max_tokens);
    if (ec != std::errc() || ptr != last) {
      std::cerr << "invalid --max-tokens value: " << max_tokens_raw << "\n";
      return 1;
    }
  }
  if (args.empty()) {
    std::cerr << "usage: carryover plan PATH [--max-tokens N]\n";
    return 1;
  }

  auto loaded = rollout::read_rollout(args[0]);
  if (!loaded.ok()) {
    return report_error("plan", loaded.status());
  }
  const auto original = loaded.value().items();
  const auto items = restore::reconcile(original);
  auto segments = restore::plan_segments(items, max_tokens);
  if (!segments.ok()) {
    return report_error("plan", segments.status());
  }

  std::size_t total_tokens = 0;
  for (const auto &segment : segments.value()) {
    total_tokens += segment.estimated_tokens;
  }
  std::cout << "Restore plan: " << segments.value().size() << " segments (~" << total_tokens
            << " tokens).\n";
  if (items.size() > original.size()) {
    std::cout << "Interrupted calls closed as aborted: " << items.size() - original.size()
              << "\n";
  }
  for (std::size_t i = 0; i < segments.value().size(); ++i) {
    const auto &segment = segments.value()[i];
    std::cout << "  segment " << i + 1 << ": items " << segment.begin << "-" << segment.end
              << " (~" << segment.estimated_tokens << " tokens)\n";
  }
  if (loaded.value().state.provider_resume_token.has_value()) {
    std::cout << "A resume token is recorded; server resume will be attempted first.\n";
  }
  return 0;
}

// Without a transport linked in, only manual continuation is available from the command line.
int run_continue(std::vector<std::string> args) {
  auto env = load_environment();
  if (!env.ok()) {
    return report_error("continue", env.status());
  }
  if (args.empty()) {
    std::cerr << "usage: carryover continue PATH\n";
    return 1;
  }

  const std::filesystem::path path = args[0];
  auto loaded = rollout::read_rollout(path);
  if (!loaded.ok()) {
    return report_error("continue", loaded.status());
  }
  const auto project_root =
      restore::resolve_project_root(current_dir(), env.value().config.project.markers);
  const auto &recorded = loaded.value().header.recorded_project_root;
  if (recorded.has_value() && !restore::in_scope(recorded, project_root, false)) {
    std::cout << "Session belongs to another project:\n" << *recorded << "\n";
  }

  restore::RestoreOrchestrator orchestrator(
      nullptr, nullptr,
      restore::OrchestratorOptions::from_config(env.value().config, env.value().sessions_dir));
  restore::SessionContext context;
  auto outcome = orchestrator.restore(
      restore::RestoreRequest{.rollout_path = path, .mode = restore::RestoreMode::Manual,
                              .cwd = current_dir()},
      context);
  if (!outcome.ok()) {
    return report_error("continue", outcome.status());
  }
  if (!loaded.value().state.provider_resume_token.has_value()) {
    std::cout << "Server restore unavailable: no token.\n";
  }
  std::cout << outcome.value().seed.value_or("") << "\n";
  return 0;
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: carryover [--config PATH] <command> [options]\n\n";
  std::cout << "commands:\n";
  std::cout << "  sessions [--all] [--search Q]   List restorable sessions for this project\n";
  std::cout << "  show PATH                       Print a rollout as a plain transcript\n";
  std::cout << "  plan PATH [--max-tokens N]      Show how a replay would be segmented\n";
  std::cout << "  continue PATH                   Print the manual continuation prompt\n";
  std::cout << "  config-path                     Print the config file location\n";
  std::cout << "  version                         Show version\n";
  std::cout << "  help                            Show this help\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "sessions") {
    return run_sessions(std::move(args));
  }
  if (subcommand == "show") {
    return run_show(std::move(args));
  }
  if (subcommand == "plan") {
    return run_plan(std::move(args));
  }
  if (subcommand == "continue") {
    return run_continue(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace carryover::cli
