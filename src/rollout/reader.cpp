#include "carryover/rollout/reader.hpp"

#include "carryover/common/fs.hpp"

#include <string>

namespace carryover::rollout {

RolloutReader::RolloutReader(std::filesystem::path path, std::unique_ptr<std::ifstream> in,
                             SessionHeader header)
    : path_(std::move(path)), in_(std::move(in)), header_(std::move(header)) {
  state_.provider_resume_token = header_.provider_resume_token;
}

common::Result<RolloutReader> RolloutReader::open(const std::filesystem::path &path) {
  auto in = std::make_unique<std::ifstream>(path);
  if (!*in) {
    return common::Result<RolloutReader>::failure(common::ErrorCode::Io,
                                                  "failed opening rollout: " + path.string());
  }
  std::string first_line;
  if (!std::getline(*in, first_line)) {
    return common::Result<RolloutReader>::failure(common::ErrorCode::CorruptHeader,
                                                  "rollout is empty: " + path.string());
  }
  auto header = parse_header_jsonl(first_line);
  if (!header.ok()) {
    return common::Result<RolloutReader>::failure(header.status());
  }
  return common::Result<RolloutReader>::success(
      RolloutReader(path, std::move(in), std::move(header.value())));
}

std::optional<Record> RolloutReader::next() {
  if (in_ == nullptr) {
    return std::nullopt;
  }
  std::string line;
  while (std::getline(*in_, line)) {
    if (common::trim(line).empty()) {
      continue;
    }
    auto parsed = parse_record_jsonl(line);
    if (!parsed.ok()) {
      ++skipped_;
      continue;
    }
    if (const auto *snapshot = std::get_if<StateSnapshot>(&parsed.value()); snapshot != nullptr) {
      state_.apply(*snapshot);
    }
    return std::move(parsed.value());
  }
  in_.reset();
  return std::nullopt;
}

common::Result<Rollout> read_rollout(const std::filesystem::path &path) {
  auto reader = RolloutReader::open(path);
  if (!reader.ok()) {
    return common::Result<Rollout>::failure(reader.status());
  }
  auto &source = reader.value();

  Rollout rollout;
  rollout.path = path;
  rollout.header = source.header();
  while (auto record = source.next()) {
    rollout.records.push_back(std::move(*record));
  }
  rollout.state = source.state();
  rollout.skipped_lines = source.skipped_lines();
  return common::Result<Rollout>::success(std::move(rollout));
}

} // namespace carryover::rollout
