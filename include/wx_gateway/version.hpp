// === Version Metadata ========================================================
//
// Exposes the gateway's semantic version string used in logs and responses.

#pragma once

#include <string_view>

namespace wx_gateway {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace wx_gateway
