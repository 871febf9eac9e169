#pragma once

#include "core/config/gate_config.hpp"
#include "tools/capability.hpp"

namespace toolgate::tools {

// Every capability this build ships, in registration order. Callers narrow
// the result with filter_for() and filter_by_permissions().
CapabilityCatalog builtin_capabilities(const core::config::GateConfig& config);

}  // namespace toolgate::tools
