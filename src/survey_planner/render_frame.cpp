#include "survey_planner/render_frame.hpp"

#include <cmath>

namespace survey_planner {

namespace {

constexpr double k_render_forward_heading_deg{90.0};  /**< Compass heading of the renderer's +X axis. */

double normalize_degrees(double angle_deg) noexcept {
    double wrapped = std::fmod(angle_deg, 360.0);
    if (wrapped < 0.0) {
        wrapped += 360.0;
    }
    return wrapped >= 360.0 ? 0.0 : wrapped;
}

}  // namespace

double heading_to_render_yaw(double heading_deg) noexcept {
    return normalize_degrees(k_render_forward_heading_deg - heading_deg);
}

double render_yaw_to_heading(double yaw_deg) noexcept {
    return normalize_degrees(k_render_forward_heading_deg - yaw_deg);
}

}  // namespace survey_planner
