#include "carryover/rollout/writer.hpp"

#include "carryover/common/fs.hpp"

namespace carryover::rollout {

namespace {

std::string filename_timestamp(const std::string &timestamp) {
  std::string out;
  out.reserve(timestamp.size());
  for (const char ch : timestamp) {
    if (ch == ':' || ch == '.') {
      out.push_back('-');
    } else if (ch != 'Z') {
      out.push_back(ch);
    }
  }
  return out;
}

// True when the file is non-empty and its last byte is not a newline (a torn final line).
bool has_torn_tail(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  in.seekg(0, std::ios::end);
  if (in.tellg() <= 0) {
    return false;
  }
  in.seekg(-1, std::ios::end);
  char last = '\n';
  in.get(last);
  return last != '\n';
}

} // namespace

RolloutWriter::RolloutWriter(std::filesystem::path path, SessionHeader header,
                             std::unique_ptr<std::ofstream> out)
    : path_(std::move(path)), header_(std::move(header)), out_(std::move(out)) {}

common::Result<RolloutWriter> RolloutWriter::create(const std::filesystem::path &path,
                                                    const SessionHeader &header) {
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    return common::Result<RolloutWriter>::failure(common::ErrorCode::Io,
                                                  "rollout already exists: " + path.string());
  }
  if (path.has_parent_path()) {
    const auto dir = common::ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return common::Result<RolloutWriter>::failure(dir.status());
    }
  }

  auto out = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::binary);
  if (!*out) {
    return common::Result<RolloutWriter>::failure(common::ErrorCode::Io,
                                                  "failed creating rollout: " + path.string());
  }
  RolloutWriter writer(path, header, std::move(out));
  if (auto status = writer.write_line(encode_header_jsonl(header)); !status.ok()) {
    return common::Result<RolloutWriter>::failure(status);
  }
  return common::Result<RolloutWriter>::success(std::move(writer));
}

common::Result<RolloutWriter> RolloutWriter::open_existing(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in) {
    return common::Result<RolloutWriter>::failure(common::ErrorCode::Io,
                                                  "failed opening rollout: " + path.string());
  }
  std::string first_line;
  std::getline(in, first_line);
  in.close();
  auto header = parse_header_jsonl(first_line);
  if (!header.ok()) {
    return common::Result<RolloutWriter>::failure(header.status());
  }

  const bool torn = has_torn_tail(path);
  auto out = std::make_unique<std::ofstream>(path, std::ios::app | std::ios::binary);
  if (!*out) {
    return common::Result<RolloutWriter>::failure(common::ErrorCode::Io,
                                                  "failed opening rollout for append: " +
                                                      path.string());
  }
  if (torn) {
    // Terminate the partial line so the next record starts on its own line.
    *out << '\n';
    out->flush();
  }
  return common::Result<RolloutWriter>::success(
      RolloutWriter(path, std::move(header.value()), std::move(out)));
}

common::Status RolloutWriter::write_line(const std::string &line) {
  if (!is_open()) {
    return common::Status::error(common::ErrorCode::Io, "rollout writer is closed");
  }
  std::string buffer;
  buffer.reserve(line.size() + 1);
  buffer += line;
  buffer.push_back('\n');
  out_->write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  out_->flush();
  if (!*out_) {
    return common::Status::error(common::ErrorCode::Io,
                                 "failed appending to rollout: " + path_.string());
  }
  return common::Status::success();
}

common::Status RolloutWriter::append(const Record &record) {
  return write_line(encode_record_jsonl(record));
}

common::Status RolloutWriter::append_checkpoint(const std::string &token) {
  StateSnapshot snapshot;
  snapshot.provider_resume_token = token;
  return append(Record{std::move(snapshot)});
}

void RolloutWriter::close() {
  if (out_ != nullptr) {
    out_->close();
    out_.reset();
  }
}

std::filesystem::path rollout_path_for(const std::filesystem::path &sessions_dir,
                                       const SessionHeader &header) {
  std::filesystem::path dir = sessions_dir;
  // Timestamps look like 2025-01-31T12:00:00.000Z; partition by date when the shape allows.
  if (header.timestamp.size() >= 10 && header.timestamp[4] == '-' && header.timestamp[7] == '-') {
    dir = dir / header.timestamp.substr(0, 4) / header.timestamp.substr(5, 2) /
          header.timestamp.substr(8, 2);
  }
  return dir / ("rollout-" + filename_timestamp(header.timestamp) + "-" + header.session_id +
                ".jsonl");
}

} // namespace carryover::rollout
