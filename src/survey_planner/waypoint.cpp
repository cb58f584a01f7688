#include "survey_planner/waypoint.hpp"

#include <cmath>
#include <utility>

#include "survey_planner/errors.hpp"

namespace survey_planner {

namespace {

void require_non_negative(const std::optional<double>& value, const char* message) {
    if (value.has_value() && (!(value.value() >= 0.0) || !std::isfinite(value.value()))) {
        throw PlanningError(ErrorKind::InvalidParameter, message);
    }
}

}  // namespace

Waypoint::Waypoint(const LocalCoord& local, const LocalFrame& frame, AltitudeReference altitude_reference, CameraPose camera_pose)
    : geodetic_(frame.local_to_geodetic(local)),
      local_(local),
      altitude_reference_(altitude_reference),
      camera_pose_(camera_pose) {}

Waypoint::Waypoint(const GeodeticCoordinate& geodetic, const LocalFrame& frame, AltitudeReference altitude_reference, CameraPose camera_pose)
    : geodetic_(geodetic),
      local_(frame.geodetic_to_local(geodetic)),
      altitude_reference_(altitude_reference),
      camera_pose_(camera_pose) {}

const GeodeticCoordinate& Waypoint::geodetic() const noexcept {
    return geodetic_;
}

const LocalCoord& Waypoint::local() const noexcept {
    return local_;
}

AltitudeReference Waypoint::altitude_reference() const noexcept {
    return altitude_reference_;
}

const CameraPose& Waypoint::camera_pose() const noexcept {
    return camera_pose_;
}

std::optional<double> Waypoint::speed_mps() const noexcept {
    return optional_speed_mps_;
}

std::optional<double> Waypoint::hold_seconds() const noexcept {
    return optional_hold_seconds_;
}

const std::vector<MissionAction>& Waypoint::actions() const noexcept {
    return list_actions_;
}

void Waypoint::set_local(const LocalCoord& local, const LocalFrame& frame) {
    const GeodeticCoordinate geodetic = frame.local_to_geodetic(local);
    local_ = local;
    geodetic_ = geodetic;
}

void Waypoint::set_geodetic(const GeodeticCoordinate& geodetic, const LocalFrame& frame) {
    const LocalCoord local = frame.geodetic_to_local(geodetic);
    geodetic_ = geodetic;
    local_ = local;
}

void Waypoint::set_camera_pose(CameraPose camera_pose) noexcept {
    camera_pose_ = camera_pose;
}

void Waypoint::set_speed_mps(std::optional<double> speed_mps) {
    require_non_negative(speed_mps, "Waypoint speed must be non-negative");
    optional_speed_mps_ = speed_mps;
}

void Waypoint::set_hold_seconds(std::optional<double> hold_seconds) {
    require_non_negative(hold_seconds, "Waypoint hold time must be non-negative");
    optional_hold_seconds_ = hold_seconds;
}

void Waypoint::add_action(MissionAction action) {
    list_actions_.push_back(std::move(action));
}

double path_distance_m(const PathSegment& segment) noexcept {
    double total_m = 0.0;
    for (std::size_t index = 1; index < segment.waypoints.size(); ++index) {
        total_m += local_distance_m(segment.waypoints[index - 1].local(), segment.waypoints[index].local());
    }
    return total_m;
}

}  // namespace survey_planner
