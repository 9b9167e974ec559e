#include "carryover/rollout/catalog.hpp"

#include "carryover/common/fs.hpp"
#include "carryover/observability/global.hpp"
#include "carryover/restore/project_scope.hpp"
#include "carryover/rollout/reader.hpp"
#include "carryover/rollout/transcript.hpp"

#include <algorithm>

namespace carryover::rollout {

namespace {

constexpr std::size_t LABEL_PREVIEW_CHARS = 50;

std::string preview_text(const Item &item) {
  std::string out;
  for (const auto &part : item.parts) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    for (const char ch : part) {
      out.push_back(ch == '\n' ? ' ' : ch);
    }
  }
  return out;
}

// Truncates to `max` code points, appending an ellipsis when anything was cut.
std::string truncate_utf8(const std::string &value, const std::size_t max) {
  std::size_t count = 0;
  for (std::size_t i = 0; i < value.size(); ++i) {
    if ((static_cast<unsigned char>(value[i]) & 0xC0) == 0x80) {
      continue;
    }
    if (count == max) {
      return value.substr(0, i) + "\xE2\x80\xA6";
    }
    ++count;
  }
  return value;
}

} // namespace

common::Result<RolloutSummary> summarize_rollout(const std::filesystem::path &path) {
  auto reader = RolloutReader::open(path);
  if (!reader.ok()) {
    return common::Result<RolloutSummary>::failure(reader.status());
  }
  auto &source = reader.value();

  RolloutSummary summary;
  summary.path = path;
  summary.timestamp = source.header().timestamp;
  summary.session_id = source.header().session_id;
  summary.recorded_project_root = source.header().recorded_project_root;

  while (auto record = source.next()) {
    const auto *item = std::get_if<Item>(&*record);
    if (item == nullptr) {
      continue;
    }
    if (item->kind == ItemKind::FunctionCall) {
      ++summary.tool_calls;
    } else if (item->kind == ItemKind::Message && item->role == "user" &&
               !is_seed_message(*item)) {
      ++summary.user_messages;
      if (summary.first_message.empty()) {
        summary.first_message = preview_text(*item);
      }
    }
  }
  summary.resume_token = source.state().provider_resume_token;
  return common::Result<RolloutSummary>::success(std::move(summary));
}

std::vector<RolloutSummary> scan_rollouts(const std::filesystem::path &dir) {
  std::vector<RolloutSummary> out;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return out;
  }

  std::filesystem::recursive_directory_iterator it(
      dir, std::filesystem::directory_options::skip_permission_denied, ec);
  const std::filesystem::recursive_directory_iterator end;
  while (!ec && it != end) {
    const auto &entry = *it;
    std::error_code type_ec;
    if (entry.is_regular_file(type_ec) && entry.path().extension() == ".jsonl") {
      auto summary = summarize_rollout(entry.path());
      if (summary.ok()) {
        out.push_back(std::move(summary.value()));
      } else {
        observability::record_rollout_skipped(entry.path().string(), summary.error());
      }
    }
    it.increment(ec);
  }
  return out;
}

std::vector<RolloutSummary> list_rollouts(const std::filesystem::path &dir,
                                          const CatalogFilter &filter) {
  auto all = scan_rollouts(dir);
  const std::string query = common::to_lower(common::trim(filter.query));

  std::vector<RolloutSummary> out;
  out.reserve(all.size());
  for (auto &summary : all) {
    if (summary.user_messages == 0) {
      continue;
    }
    if (!restore::in_scope(summary.recorded_project_root, filter.project_root,
                           filter.show_all)) {
      continue;
    }
    if (!query.empty()) {
      const bool matches =
          common::to_lower(summary.first_message).find(query) != std::string::npos ||
          common::to_lower(summary.path.string()).find(query) != std::string::npos;
      if (!matches) {
        continue;
      }
    }
    out.push_back(std::move(summary));
  }

  std::sort(out.begin(), out.end(), [](const RolloutSummary &a, const RolloutSummary &b) {
    if (a.timestamp != b.timestamp) {
      return a.timestamp > b.timestamp;
    }
    return a.path > b.path;
  });
  return out;
}

std::string format_summary_label(const RolloutSummary &summary) {
  std::string when = summary.timestamp;
  // 2025-08-12T10:20:30.000Z -> 2025-08-12 10:20
  if (when.size() >= 16 && when[10] == 'T') {
    when = when.substr(0, 10) + " " + when.substr(11, 5);
  }
  return when + " \xC2\xB7 " + std::to_string(summary.user_messages) + " msgs/" +
         std::to_string(summary.tool_calls) + " tools \xC2\xB7 " +
         truncate_utf8(summary.first_message, LABEL_PREVIEW_CHARS);
}

} // namespace carryover::rollout
