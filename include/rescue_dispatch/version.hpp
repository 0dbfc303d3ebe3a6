// === Version Metadata ========================================================
//
// Exposes the dispatch service's semantic version string used in logs.

#pragma once

#include <string_view>

namespace rescue_dispatch {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace rescue_dispatch
