// === Path Assembler ==========================================================
//
// Turns a raw local-frame pattern into a flyable PathSegment: a ground
// waypoint at the takeoff point, every pattern point as a full Waypoint, and
// a ground return waypoint when the mission ends with RTL or LAND.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "survey_planner/chunked_processor.hpp"
#include "survey_planner/types.hpp"
#include "survey_planner/waypoint.hpp"

namespace survey_planner {

/**
 * @brief Behaviour once the final pattern waypoint has been reached.
 */
enum class MissionEndAction {
    Rtl,   /**< Return to launch. */
    Land,  /**< Land at the takeoff point. */
    Hold   /**< Hover at the final waypoint. */
};

/**
 * @brief Mission-wide safety settings consumed by the assembler.
 */
struct SafetyParams final {
    MissionEndAction mission_end_action{MissionEndAction::Rtl};
    double rtl_altitude_m{50.0};
    double climb_speed_mps{2.5};
};

/**
 * @brief Presentation details applied to every assembled waypoint.
 */
struct AssemblyOptions final {
    std::string identifier{};
    PathType type{PathType::Grid};
    double speed_mps{5.0};
    AltitudeReference altitude_reference{AltitudeReference::Relative};
    CameraPose camera_pose{};                             /**< Pose at pattern waypoints. */
    CameraPose transition_camera_pose{0.0, 0.0, 0.0};     /**< Pose at takeoff/landing waypoints. */
    std::optional<MissionAction> pattern_action{};        /**< Appended to every pattern waypoint. */
};

/** @brief Tolerance under which two local coordinates count as identical. */
inline constexpr double k_coincident_tolerance_m{1e-6};

/**
 * @brief Assemble the full flight path around @p raster_points.
 *
 * Builds a new PathSegment; nothing passed in is modified.
 *
 * @throws PlanningError (MissingPrecondition) when @p takeoff or @p origin is
 *         absent or @p raster_points is empty.
 */
[[nodiscard]] PathSegment assemble(
    const std::vector<LocalCoord>& raster_points,
    const std::optional<LocalCoord>& takeoff,
    const SafetyParams& safety,
    const std::optional<LocalOrigin>& origin,
    const AssemblyOptions& options = {}
);

/**
 * @brief Same as assemble(), converting pattern points to waypoints through
 *        process_in_chunks() so very large patterns yield between slices.
 *
 * @throws PlanningError (Cancelled) when @p chunk_options' cancel flag is
 *         raised before every slice has been converted.
 */
[[nodiscard]] PathSegment assemble_in_chunks(
    const std::vector<LocalCoord>& raster_points,
    const std::optional<LocalCoord>& takeoff,
    const SafetyParams& safety,
    const std::optional<LocalOrigin>& origin,
    const AssemblyOptions& options,
    const ChunkOptions& chunk_options
);

/** @brief True when @p lhs and @p rhs differ by at most @p tolerance_m on every axis. */
[[nodiscard]] bool coincident(const LocalCoord& lhs, const LocalCoord& rhs, double tolerance_m = k_coincident_tolerance_m) noexcept;

}  // namespace survey_planner
