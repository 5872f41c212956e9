#pragma once

#include "crucible/config/schema.hpp"
#include "crucible/observability/observer.hpp"

#include <memory>

namespace crucible::observability {

/// Backend names: "log", "none"/"noop", or a comma separated list of them.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace crucible::observability
