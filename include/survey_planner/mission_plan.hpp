// === Mission Plan ============================================================
//
// Owns everything tied to a single mission's local frame: the immutable
// origin, the takeoff point, safety settings and the assembled path segments.
// `plan_survey` wires footprint -> raster -> assembly into one call, and
// `vehicle_pose_in_mission_frame` is the read path for live bridge poses.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "survey_planner/camera_footprint.hpp"
#include "survey_planner/chunked_processor.hpp"
#include "survey_planner/coverage_path_generator.hpp"
#include "survey_planner/local_frame.hpp"
#include "survey_planner/logging.hpp"
#include "survey_planner/path_assembler.hpp"
#include "survey_planner/types.hpp"
#include "survey_planner/waypoint.hpp"

namespace survey_planner {

/**
 * @brief In-memory model of one survey mission.
 *
 * The origin is fixed at construction. Segments are only changed through
 * add/replace/remove; each call builds or swaps whole values.
 */
class MissionPlan final {
  public:
    MissionPlan(std::string name, LocalOrigin origin, SafetyParams safety);

    [[nodiscard]] const std::string& name() const noexcept;
    [[nodiscard]] const LocalOrigin& origin() const noexcept;
    [[nodiscard]] const LocalFrame& frame() const noexcept;
    [[nodiscard]] const SafetyParams& safety() const noexcept;
    [[nodiscard]] const std::optional<LocalCoord>& takeoff_point() const noexcept;
    [[nodiscard]] const std::vector<PathSegment>& segments() const noexcept;

    void set_takeoff_point(std::optional<LocalCoord> takeoff);
    void set_safety(SafetyParams safety) noexcept;

    /**
     * @brief Plan a raster survey starting at the takeoff point shifted by
     *        `params.start_offset` and append it.
     *
     * Resolves line spacing from @p camera unless overridden, generates the
     * raster, assembles takeoff/landing transitions and stores the segment.
     * A segment identifier is generated when @p options leaves it empty.
     *
     * @throws PlanningError on invalid parameters, a missing takeoff point or
     *         cancellation through @p chunk_options.
     */
    const PathSegment& plan_survey(
        const CoverageParams& params,
        const CameraProfile& camera,
        AssemblyOptions options = {},
        const ChunkOptions& chunk_options = {}
    );

    /** @brief Append an externally built segment; returns its identifier. */
    const std::string& add_segment(PathSegment segment);
    /** @brief Swap the segment named @p identifier for @p segment. */
    void replace_segment(const std::string& identifier, PathSegment segment);
    /** @brief Delete the segment named @p identifier. */
    void remove_segment(const std::string& identifier);
    [[nodiscard]] const PathSegment& segment(const std::string& identifier) const;

    [[nodiscard]] double total_distance_m() const noexcept;
    [[nodiscard]] std::size_t total_waypoint_count() const noexcept;

    /** @brief Express a live bridge pose in this mission's local frame. */
    [[nodiscard]] LocalPose vehicle_pose_in_mission_frame(const VehiclePose& pose) const;

  private:
    std::vector<PathSegment>::iterator find_segment(const std::string& identifier);
    std::string next_segment_identifier();

    std::string str_name_;
    const LocalFrame frame_;
    SafetyParams safety_;
    std::optional<LocalCoord> optional_takeoff_;
    std::vector<PathSegment> list_segments_;
    std::size_t segment_counter_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace survey_planner
