#pragma once

#include "carryover/common/result.hpp"
#include "carryover/rollout/record.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <vector>

namespace carryover::rollout {

/// Lazy reader: the header is parsed on open, records are decoded one line at a time.
/// Malformed lines are skipped and counted; the effective state is folded as records arrive.
class RolloutReader {
public:
  [[nodiscard]] static common::Result<RolloutReader> open(const std::filesystem::path &path);

  RolloutReader(RolloutReader &&) noexcept = default;
  RolloutReader &operator=(RolloutReader &&) noexcept = default;

  /// Next decodable record, or nullopt at end of file.
  [[nodiscard]] std::optional<Record> next();

  [[nodiscard]] const SessionHeader &header() const { return header_; }
  [[nodiscard]] const EffectiveState &state() const { return state_; }
  [[nodiscard]] std::size_t skipped_lines() const { return skipped_; }
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  RolloutReader(std::filesystem::path path, std::unique_ptr<std::ifstream> in,
                SessionHeader header);

  std::filesystem::path path_;
  std::unique_ptr<std::ifstream> in_;
  SessionHeader header_;
  EffectiveState state_;
  std::size_t skipped_ = 0;
};

struct Rollout {
  std::filesystem::path path;
  SessionHeader header;
  std::vector<Record> records;
  EffectiveState state;
  std::size_t skipped_lines = 0;

  [[nodiscard]] std::vector<Item> items() const { return items_of(records); }
};

[[nodiscard]] common::Result<Rollout> read_rollout(const std::filesystem::path &path);

} // namespace carryover::rollout
