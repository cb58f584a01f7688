#include "survey_planner/mission_plan.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <fmt/format.h>

#include "survey_planner/errors.hpp"

namespace survey_planner {

MissionPlan::MissionPlan(std::string name, LocalOrigin origin, SafetyParams safety)
    : str_name_(std::move(name)),
      frame_(origin),
      safety_(safety),
      logger_(get_logger()) {
    if (str_name_.empty()) {
        throw PlanningError(ErrorKind::InvalidParameter, "MissionPlan requires a name");
    }
    logger_->info(
        "Mission {} anchored at lat={} lon={} alt_m={}",
        str_name_,
        origin.latitude_deg,
        origin.longitude_deg,
        origin.altitude_m
    );
}

const std::string& MissionPlan::name() const noexcept {
    return str_name_;
}

const LocalOrigin& MissionPlan::origin() const noexcept {
    return frame_.origin();
}

const LocalFrame& MissionPlan::frame() const noexcept {
    return frame_;
}

const SafetyParams& MissionPlan::safety() const noexcept {
    return safety_;
}

const std::optional<LocalCoord>& MissionPlan::takeoff_point() const noexcept {
    return optional_takeoff_;
}

const std::vector<PathSegment>& MissionPlan::segments() const noexcept {
    return list_segments_;
}

void MissionPlan::set_takeoff_point(std::optional<LocalCoord> takeoff) {
    if (takeoff.has_value()
        && (!std::isfinite(takeoff->x) || !std::isfinite(takeoff->y) || !std::isfinite(takeoff->z))) {
        throw PlanningError(ErrorKind::OutOfRange, "Takeoff point has non-finite components");
    }
    optional_takeoff_ = takeoff;
    if (optional_takeoff_.has_value()) {
        logger_->info(
            "Mission {} takeoff set to x={} y={} z={}",
            str_name_,
            optional_takeoff_->x,
            optional_takeoff_->y,
            optional_takeoff_->z
        );
    } else {
        logger_->info("Mission {} takeoff cleared", str_name_);
    }
}

void MissionPlan::set_safety(SafetyParams safety) noexcept {
    safety_ = safety;
}

const PathSegment& MissionPlan::plan_survey(
    const CoverageParams& params,
    const CameraProfile& camera,
    AssemblyOptions options,
    const ChunkOptions& chunk_options
) {
    if (!optional_takeoff_.has_value()) {
        throw PlanningError(ErrorKind::MissingPrecondition, "Cannot plan survey: takeoff point is not set");
    }

    const LocalCoord& offset = params.start_offset;
    if (!std::isfinite(offset.x) || !std::isfinite(offset.y) || !std::isfinite(offset.z)) {
        throw PlanningError(ErrorKind::OutOfRange, "Raster start offset has non-finite components");
    }

    CoverageParams resolved = params;
    if (resolved.number_of_lines > 1) {
        resolved.line_spacing_m = resolve_line_spacing(params, camera);
    }

    const LocalCoord& takeoff = optional_takeoff_.value();
    const LocalCoord raster_start{takeoff.x + offset.x, takeoff.y + offset.y, takeoff.z + offset.z};
    const std::vector<LocalCoord> list_raster = generate_raster(resolved, raster_start);
    if (options.identifier.empty()) {
        options.identifier = next_segment_identifier();
    }

    PathSegment segment = assemble_in_chunks(list_raster, optional_takeoff_, safety_, frame_.origin(), options, chunk_options);

    logger_->info(
        "Mission {} planned segment {}: lines={} spacing_m={} waypoints={} distance_m={:.1f}",
        str_name_,
        segment.identifier,
        resolved.number_of_lines,
        resolved.line_spacing_m.value_or(0.0),
        segment.waypoints.size(),
        path_distance_m(segment)
    );

    list_segments_.push_back(std::move(segment));
    return list_segments_.back();
}

const std::string& MissionPlan::add_segment(PathSegment segment) {
    if (segment.identifier.empty()) {
        segment.identifier = next_segment_identifier();
    }
    const bool duplicate = std::any_of(list_segments_.begin(), list_segments_.end(), [&segment](const PathSegment& existing) {
        return existing.identifier == segment.identifier;
    });
    if (duplicate) {
        throw PlanningError(
            ErrorKind::InvalidParameter,
            fmt::format("Mission {} already has a segment named {}", str_name_, segment.identifier)
        );
    }
    list_segments_.push_back(std::move(segment));
    logger_->debug("Mission {} added segment {}", str_name_, list_segments_.back().identifier);
    return list_segments_.back().identifier;
}

void MissionPlan::replace_segment(const std::string& identifier, PathSegment segment) {
    auto iterator_segment = find_segment(identifier);
    segment.identifier = identifier;
    *iterator_segment = std::move(segment);
    logger_->info("Mission {} replaced segment {}", str_name_, identifier);
}

void MissionPlan::remove_segment(const std::string& identifier) {
    list_segments_.erase(find_segment(identifier));
    logger_->info("Mission {} removed segment {}", str_name_, identifier);
}

const PathSegment& MissionPlan::segment(const std::string& identifier) const {
    const auto iterator_segment = std::find_if(list_segments_.begin(), list_segments_.end(), [&identifier](const PathSegment& existing) {
        return existing.identifier == identifier;
    });
    if (iterator_segment == list_segments_.end()) {
        throw PlanningError(
            ErrorKind::MissingPrecondition,
            fmt::format("Mission {} has no segment named {}", str_name_, identifier)
        );
    }
    return *iterator_segment;
}

double MissionPlan::total_distance_m() const noexcept {
    double total_m = 0.0;
    for (const PathSegment& segment : list_segments_) {
        total_m += path_distance_m(segment);
    }
    return total_m;
}

std::size_t MissionPlan::total_waypoint_count() const noexcept {
    std::size_t count = 0;
    for (const PathSegment& segment : list_segments_) {
        count += segment.waypoints.size();
    }
    return count;
}

LocalPose MissionPlan::vehicle_pose_in_mission_frame(const VehiclePose& pose) const {
    LocalPose local_pose{};
    local_pose.position = frame_.geodetic_to_local(pose.position);
    local_pose.heading_deg = pose.heading_deg;
    local_pose.pitch_deg = pose.pitch_deg;
    local_pose.roll_deg = pose.roll_deg;
    return local_pose;
}

std::vector<PathSegment>::iterator MissionPlan::find_segment(const std::string& identifier) {
    auto iterator_segment = std::find_if(list_segments_.begin(), list_segments_.end(), [&identifier](const PathSegment& existing) {
        return existing.identifier == identifier;
    });
    if (iterator_segment == list_segments_.end()) {
        throw PlanningError(
            ErrorKind::MissingPrecondition,
            fmt::format("Mission {} has no segment named {}", str_name_, identifier)
        );
    }
    return iterator_segment;
}

std::string MissionPlan::next_segment_identifier() {
    ++segment_counter_;
    return fmt::format("{}-segment-{}", str_name_, segment_counter_);
}

}  // namespace survey_planner
