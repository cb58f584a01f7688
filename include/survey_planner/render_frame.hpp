// === Render / Body Frame Adapter =============================================
//
// Axis permutations between the mission ENU frame and the conventions used by
// consumers: a Y-up renderer (x = east, y = up, z = north) and the
// North-East-Down navigation frame used by flight controllers. Headings are
// mapped between compass convention and the renderer's counter-clockwise yaw.
// Everything here is exact and invertible.

#pragma once

#include "survey_planner/types.hpp"

namespace survey_planner {

/** @brief Renderer coordinate: x = east, y = up, z = north. Never persisted. */
struct RenderCoord final {
    double x{};
    double y{};
    double z{};
};

/** @brief North-East-Down coordinate in metres. */
struct NedCoord final {
    double north{};
    double east{};
    double down{};
};

[[nodiscard]] constexpr RenderCoord to_render_frame(const LocalCoord& local) noexcept {
    return RenderCoord{local.x, local.z, local.y};
}

[[nodiscard]] constexpr LocalCoord from_render_frame(const RenderCoord& render) noexcept {
    return LocalCoord{render.x, render.z, render.y};
}

[[nodiscard]] constexpr NedCoord to_ned(const LocalCoord& local) noexcept {
    return NedCoord{local.y, local.x, -local.z};
}

[[nodiscard]] constexpr LocalCoord from_ned(const NedCoord& ned) noexcept {
    return LocalCoord{ned.east, ned.north, -ned.down};
}

/**
 * @brief Convert a compass heading (clockwise from north) to renderer yaw
 *        (counter-clockwise from the +X/east axis), normalized to [0, 360).
 */
[[nodiscard]] double heading_to_render_yaw(double heading_deg) noexcept;

/** @brief Inverse of heading_to_render_yaw, normalized to [0, 360). */
[[nodiscard]] double render_yaw_to_heading(double yaw_deg) noexcept;

}  // namespace survey_planner
