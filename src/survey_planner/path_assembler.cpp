#include "survey_planner/path_assembler.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

#include <fmt/format.h>

#include "survey_planner/errors.hpp"
#include "survey_planner/local_frame.hpp"

namespace survey_planner {

namespace {

void require_preconditions(
    const std::vector<LocalCoord>& raster_points,
    const std::optional<LocalCoord>& takeoff,
    const std::optional<LocalOrigin>& origin
) {
    if (!origin.has_value()) {
        throw PlanningError(ErrorKind::MissingPrecondition, "Cannot assemble path: local origin is not set");
    }
    if (!takeoff.has_value()) {
        throw PlanningError(ErrorKind::MissingPrecondition, "Cannot assemble path: takeoff point is not set");
    }
    if (raster_points.empty()) {
        throw PlanningError(ErrorKind::MissingPrecondition, "Cannot assemble path: pattern has no waypoints");
    }
}

Waypoint make_ground_waypoint(const LocalCoord& takeoff, const LocalFrame& frame, const AssemblyOptions& options) {
    const LocalCoord ground{takeoff.x, takeoff.y, 0.0};
    return Waypoint{ground, frame, options.altitude_reference, options.transition_camera_pose};
}

Waypoint make_pattern_waypoint(const LocalCoord& point, const LocalFrame& frame, const AssemblyOptions& options) {
    Waypoint waypoint{point, frame, options.altitude_reference, options.camera_pose};
    if (options.pattern_action.has_value()) {
        waypoint.add_action(options.pattern_action.value());
    }
    return waypoint;
}

PathSegment begin_segment(const LocalCoord& takeoff, const LocalFrame& frame, const AssemblyOptions& options, std::size_t pattern_size) {
    PathSegment segment{};
    segment.identifier = options.identifier;
    segment.type = options.type;
    segment.speed_mps = options.speed_mps;
    segment.waypoints.reserve(pattern_size + 2);
    segment.waypoints.push_back(make_ground_waypoint(takeoff, frame, options));
    return segment;
}

void finish_segment(
    PathSegment& segment,
    const LocalCoord& last_pattern_point,
    const LocalCoord& takeoff,
    const SafetyParams& safety,
    const LocalFrame& frame,
    const AssemblyOptions& options
) {
    if (safety.mission_end_action != MissionEndAction::Rtl && safety.mission_end_action != MissionEndAction::Land) {
        return;
    }
    const LocalCoord landing{takeoff.x, takeoff.y, 0.0};
    if (coincident(last_pattern_point, landing)) {
        return;
    }
    segment.waypoints.push_back(make_ground_waypoint(takeoff, frame, options));
}

}  // namespace

PathSegment assemble(
    const std::vector<LocalCoord>& raster_points,
    const std::optional<LocalCoord>& takeoff,
    const SafetyParams& safety,
    const std::optional<LocalOrigin>& origin,
    const AssemblyOptions& options
) {
    require_preconditions(raster_points, takeoff, origin);
    const LocalFrame frame{origin.value()};

    PathSegment segment = begin_segment(takeoff.value(), frame, options, raster_points.size());
    for (const LocalCoord& point : raster_points) {
        segment.waypoints.push_back(make_pattern_waypoint(point, frame, options));
    }
    finish_segment(segment, raster_points.back(), takeoff.value(), safety, frame, options);
    return segment;
}

PathSegment assemble_in_chunks(
    const std::vector<LocalCoord>& raster_points,
    const std::optional<LocalCoord>& takeoff,
    const SafetyParams& safety,
    const std::optional<LocalOrigin>& origin,
    const AssemblyOptions& options,
    const ChunkOptions& chunk_options
) {
    require_preconditions(raster_points, takeoff, origin);
    const LocalFrame frame{origin.value()};

    ChunkedResult<Waypoint> converted = process_in_chunks(
        raster_points,
        [&frame, &options](const LocalCoord& point) { return make_pattern_waypoint(point, frame, options); },
        chunk_options
    );
    if (converted.status == ChunkStatus::Cancelled) {
        throw PlanningError(
            ErrorKind::Cancelled,
            fmt::format("Path assembly cancelled after {} of {} waypoints", converted.outputs.size(), raster_points.size())
        );
    }

    PathSegment segment = begin_segment(takeoff.value(), frame, options, raster_points.size());
    std::move(converted.outputs.begin(), converted.outputs.end(), std::back_inserter(segment.waypoints));
    finish_segment(segment, raster_points.back(), takeoff.value(), safety, frame, options);
    return segment;
}

bool coincident(const LocalCoord& lhs, const LocalCoord& rhs, double tolerance_m) noexcept {
    return std::abs(lhs.x - rhs.x) <= tolerance_m
        && std::abs(lhs.y - rhs.y) <= tolerance_m
        && std::abs(lhs.z - rhs.z) <= tolerance_m;
}

}  // namespace survey_planner
