// === Version Metadata ========================================================
//
// Exposes the relay's semantic version string used in logs and the health
// endpoint.

#pragma once

#include <string_view>

namespace swarm_ops {

inline constexpr std::string_view k_version{"0.1.0"};

}  // namespace swarm_ops
