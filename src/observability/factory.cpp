#include "carryover/observability/factory.hpp"

#include "carryover/common/fs.hpp"
#include "carryover/observability/composite_observer.hpp"
#include "carryover/observability/log_observer.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <vector>

namespace carryover::observability {

namespace {

std::unique_ptr<IObserver> create_backend(const std::string &name) {
  if (name == "log") {
    return std::make_unique<LogObserver>();
  }
  if (name == "log-verbose" || name == "debug") {
    return std::make_unique<LogObserver>(std::cerr, true);
  }
  return nullptr;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  std::vector<std::string> seen;
  CompositeObserver composite;

  std::stringstream stream(config.observability.backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string name = common::to_lower(common::trim(part));
    if (name.empty() || std::find(seen.begin(), seen.end(), name) != seen.end()) {
      continue;
    }
    seen.push_back(name);
    composite.attach(create_backend(name));
  }

  if (composite.size() == 0) {
    return std::make_unique<NullObserver>();
  }
  if (auto single = composite.release_single(); single != nullptr) {
    return single;
  }
  return std::make_unique<CompositeObserver>(std::move(composite));
}

} // namespace carryover::observability
