#include "carryover/restore/handshake.hpp"

#include "carryover/observability/global.hpp"

#include <condition_variable>
#include <mutex>
#include <thread>

namespace carryover::restore {

namespace {

struct PendingHandshake {
  std::mutex mutex;
  std::condition_variable cv;
  bool complete = false;
  std::optional<HandshakeReply> reply;
  std::optional<std::string> error;
};

HandshakeResult record(const HandshakeResult &result,
                       const std::chrono::steady_clock::time_point started) {
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_handshake(std::string(handshake_outcome_name(result.outcome)),
                                  result.reason, elapsed);
  return result;
}

} // namespace

std::string_view handshake_outcome_name(const HandshakeOutcome outcome) {
  switch (outcome) {
  case HandshakeOutcome::Confirmed:
    return "confirmed";
  case HandshakeOutcome::Missing:
    return "missing";
  case HandshakeOutcome::Rejected:
    return "rejected";
  }
  return "rejected";
}

common::Status HandshakeResult::status() const {
  switch (outcome) {
  case HandshakeOutcome::Confirmed:
    return common::Status::success();
  case HandshakeOutcome::Missing:
    return common::Status::error(common::ErrorCode::HandshakeRejected, "no resume token");
  case HandshakeOutcome::Rejected:
    break;
  }
  if (timed_out) {
    return common::Status::error(common::ErrorCode::HandshakeTimeout,
                                 "handshake timed out");
  }
  return common::Status::error(common::ErrorCode::HandshakeRejected, reason);
}

ResumeHandshake::ResumeHandshake(std::shared_ptr<ExecutionService> service,
                                 const std::chrono::milliseconds timeout)
    : service_(std::move(service)), timeout_(timeout) {}

HandshakeResult ResumeHandshake::run(const std::optional<std::string> &token) const {
  const auto started = std::chrono::steady_clock::now();
  if (!token.has_value() || token->empty()) {
    return record(HandshakeResult::missing(), started);
  }
  if (service_ == nullptr) {
    return record(HandshakeResult::rejected("no execution service"), started);
  }

  auto pending = std::make_shared<PendingHandshake>();
  // The worker owns references to everything it touches so a late reply after a timeout is
  // harmless.
  std::thread([pending, service = service_, token = *token]() {
    std::optional<HandshakeReply> reply;
    std::optional<std::string> error;
    try {
      auto result = service->handshake(token);
      if (result.ok()) {
        reply = result.value();
      } else {
        error = result.error();
      }
    } catch (const std::exception &ex) {
      error = ex.what();
    }
    {
      std::lock_guard<std::mutex> lock(pending->mutex);
      pending->reply = std::move(reply);
      pending->error = std::move(error);
      pending->complete = true;
    }
    pending->cv.notify_all();
  }).detach();

  std::unique_lock<std::mutex> lock(pending->mutex);
  const bool done = pending->cv.wait_for(lock, timeout_, [&]() { return pending->complete; });
  if (!done) {
    return record(HandshakeResult::timeout(), started);
  }
  if (pending->error.has_value()) {
    return record(HandshakeResult::rejected(*pending->error), started);
  }
  if (!pending->reply.has_value() || !pending->reply->resumable) {
    std::string reason = pending->reply.has_value() ? pending->reply->reason : "";
    return record(HandshakeResult::rejected(reason.empty() ? "rejected" : reason), started);
  }
  return record(HandshakeResult::confirmed(), started);
}

std::string handshake_notice(const HandshakeResult &result) {
  switch (result.outcome) {
  case HandshakeOutcome::Confirmed:
    return "Server session resumed; continuing in the same rollout.";
  case HandshakeOutcome::Missing:
    return "No resume token recorded for this session; replay from the rollout log is "
           "available.";
  case HandshakeOutcome::Rejected:
    return "Server resume rejected (" + result.reason +
           "); replay from the rollout log is available.";
  }
  return "";
}

} // namespace carryover::restore
