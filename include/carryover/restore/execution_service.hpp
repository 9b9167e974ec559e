#pragma once

#include "carryover/common/result.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace carryover::restore {

/// One transmission to the remote execution context.
struct ReplayInput {
  std::string text;
  // Segment index for replay payloads; empty for the end-of-restore marker.
  std::optional<std::size_t> segment;
};

struct HandshakeReply {
  bool resumable = false;
  std::string reason;
};

/// Remote execution context. Calls block until the service answers. The transport behind it
/// (streaming, auth) lives outside this library.
class ExecutionService {
public:
  virtual ~ExecutionService() = default;

  [[nodiscard]] virtual common::Status send(const ReplayInput &input) = 0;
  [[nodiscard]] virtual common::Status interrupt() = 0;
  /// Non-mutating validation of a resume token.
  [[nodiscard]] virtual common::Result<HandshakeReply> handshake(const std::string &token) = 0;
  [[nodiscard]] virtual std::vector<std::string> current_tools() const = 0;
  /// Resume token carried by the most recent turn-completed notification. Empty until a turn
  /// has fully completed; a turn still streaming never changes it.
  [[nodiscard]] virtual std::optional<std::string> last_completed_token() const = 0;
};

/// Opens fresh execution contexts for replay.
class ExecutionServiceFactory {
public:
  virtual ~ExecutionServiceFactory() = default;

  [[nodiscard]] virtual common::Result<std::shared_ptr<ExecutionService>> create_context() = 0;
};

} // namespace carryover::restore
