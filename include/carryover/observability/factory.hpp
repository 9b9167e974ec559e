#pragma once

#include "carryover/config/schema.hpp"
#include "carryover/observability/observer.hpp"

#include <memory>

namespace carryover::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace carryover::observability
