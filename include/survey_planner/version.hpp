// === Version Metadata ========================================================
//
// Exposes the planner's semantic version string used in logs and CLI output.

#pragma once

#include <string_view>

namespace survey_planner {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace survey_planner
