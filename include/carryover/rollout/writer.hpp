#pragma once

#include "carryover/common/result.hpp"
#include "carryover/rollout/record.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace carryover::rollout {

/// Append-only writer for one rollout file. Move-only; the owning context is the single writer.
class RolloutWriter {
public:
  /// Creates a new rollout and writes its header. Fails with Io if `path` already exists.
  [[nodiscard]] static common::Result<RolloutWriter> create(const std::filesystem::path &path,
                                                            const SessionHeader &header);

  /// Opens an existing rollout for appending after validating its header.
  [[nodiscard]] static common::Result<RolloutWriter>
  open_existing(const std::filesystem::path &path);

  RolloutWriter(RolloutWriter &&) noexcept = default;
  RolloutWriter &operator=(RolloutWriter &&) noexcept = default;
  RolloutWriter(const RolloutWriter &) = delete;
  RolloutWriter &operator=(const RolloutWriter &) = delete;

  [[nodiscard]] common::Status append(const Record &record);

  /// Records the resume token of a fully completed remote turn.
  [[nodiscard]] common::Status append_checkpoint(const std::string &token);

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] const SessionHeader &header() const { return header_; }
  [[nodiscard]] bool is_open() const { return out_ != nullptr && out_->is_open(); }
  void close();

private:
  RolloutWriter(std::filesystem::path path, SessionHeader header,
                std::unique_ptr<std::ofstream> out);

  [[nodiscard]] common::Status write_line(const std::string &line);

  std::filesystem::path path_;
  SessionHeader header_;
  std::unique_ptr<std::ofstream> out_;
};

/// Default file location for a new rollout: <sessions_dir>/YYYY/MM/DD/rollout-<timestamp>-<id>.jsonl
[[nodiscard]] std::filesystem::path rollout_path_for(const std::filesystem::path &sessions_dir,
                                                     const SessionHeader &header);

} // namespace carryover::rollout
