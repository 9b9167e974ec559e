#pragma once

#include "carryover/restore/execution_service.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace carryover::restore {

enum class HandshakeOutcome {
  Confirmed,
  Missing,
  Rejected,
};

[[nodiscard]] std::string_view handshake_outcome_name(HandshakeOutcome outcome);

struct HandshakeResult {
  HandshakeOutcome outcome = HandshakeOutcome::Missing;
  std::string reason;
  bool timed_out = false;

  [[nodiscard]] static HandshakeResult confirmed() { return {HandshakeOutcome::Confirmed, ""}; }
  [[nodiscard]] static HandshakeResult missing() { return {HandshakeOutcome::Missing, ""}; }
  [[nodiscard]] static HandshakeResult rejected(std::string reason) {
    return {HandshakeOutcome::Rejected, std::move(reason)};
  }
  [[nodiscard]] static HandshakeResult timeout() {
    return {HandshakeOutcome::Rejected, "timeout", true};
  }

  [[nodiscard]] bool is_confirmed() const { return outcome == HandshakeOutcome::Confirmed; }
  /// Success when confirmed; otherwise HandshakeTimeout or HandshakeRejected with the reason.
  [[nodiscard]] common::Status status() const;
};

/// Validates a resume token against the service without touching any transcript. The call runs
/// on a worker thread; a reply that does not arrive within `timeout` counts as a rejection with
/// reason "timeout".
class ResumeHandshake {
public:
  ResumeHandshake(std::shared_ptr<ExecutionService> service, std::chrono::milliseconds timeout);

  [[nodiscard]] HandshakeResult run(const std::optional<std::string> &token) const;

private:
  std::shared_ptr<ExecutionService> service_;
  std::chrono::milliseconds timeout_;
};

/// One-line notice for the user, including the next action on offer.
[[nodiscard]] std::string handshake_notice(const HandshakeResult &result);

} // namespace carryover::restore
