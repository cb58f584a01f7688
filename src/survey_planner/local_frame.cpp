#include "survey_planner/local_frame.hpp"

#include <cmath>
#include <numbers>

#include "survey_planner/errors.hpp"
#include "survey_planner/geodetic_transform.hpp"

namespace survey_planner {

namespace {

RotationMatrix make_enu_rotation(const LocalOrigin& origin) {
    const double lat = origin.latitude_deg * std::numbers::pi / 180.0;
    const double lon = origin.longitude_deg * std::numbers::pi / 180.0;
    const double sin_lat = std::sin(lat);
    const double cos_lat = std::cos(lat);
    const double sin_lon = std::sin(lon);
    const double cos_lon = std::cos(lon);

    return RotationMatrix{{
        {-sin_lon, cos_lon, 0.0},
        {-sin_lat * cos_lon, -sin_lat * sin_lon, cos_lat},
        {cos_lat * cos_lon, cos_lat * sin_lon, sin_lat},
    }};
}

}  // namespace

LocalFrame::LocalFrame(const LocalOrigin& origin)
    : origin_(origin),
      origin_ecef_(survey_planner::to_ecef(origin)),
      rotation_(make_enu_rotation(origin)) {}

const LocalOrigin& LocalFrame::origin() const noexcept {
    return origin_;
}

const EcefVector& LocalFrame::origin_ecef() const noexcept {
    return origin_ecef_;
}

const RotationMatrix& LocalFrame::rotation() const noexcept {
    return rotation_;
}

LocalCoord LocalFrame::to_local(const EcefVector& point) const {
    if (!std::isfinite(point.x) || !std::isfinite(point.y) || !std::isfinite(point.z)) {
        throw PlanningError(ErrorKind::OutOfRange, "ECEF vector has non-finite components");
    }
    const double dx = point.x - origin_ecef_.x;
    const double dy = point.y - origin_ecef_.y;
    const double dz = point.z - origin_ecef_.z;
    const auto& r = rotation_;
    return LocalCoord{
        r[0][0] * dx + r[0][1] * dy + r[0][2] * dz,
        r[1][0] * dx + r[1][1] * dy + r[1][2] * dz,
        r[2][0] * dx + r[2][1] * dy + r[2][2] * dz
    };
}

EcefVector LocalFrame::to_ecef(const LocalCoord& local) const {
    if (!std::isfinite(local.x) || !std::isfinite(local.y) || !std::isfinite(local.z)) {
        throw PlanningError(ErrorKind::OutOfRange, "Local coordinate has non-finite components");
    }
    const auto& r = rotation_;
    return EcefVector{
        origin_ecef_.x + r[0][0] * local.x + r[1][0] * local.y + r[2][0] * local.z,
        origin_ecef_.y + r[0][1] * local.x + r[1][1] * local.y + r[2][1] * local.z,
        origin_ecef_.z + r[0][2] * local.x + r[1][2] * local.y + r[2][2] * local.z
    };
}

LocalCoord LocalFrame::geodetic_to_local(const GeodeticCoordinate& coordinate) const {
    return to_local(survey_planner::to_ecef(coordinate));
}

GeodeticCoordinate LocalFrame::local_to_geodetic(const LocalCoord& local) const {
    return to_geodetic(to_ecef(local));
}

LocalCoord to_local(const EcefVector& point, const LocalOrigin& origin) {
    return LocalFrame{origin}.to_local(point);
}

EcefVector to_ecef(const LocalCoord& local, const LocalOrigin& origin) {
    return LocalFrame{origin}.to_ecef(local);
}

LocalCoord geodetic_to_local(const GeodeticCoordinate& coordinate, const LocalOrigin& origin) {
    return LocalFrame{origin}.geodetic_to_local(coordinate);
}

GeodeticCoordinate local_to_geodetic(const LocalCoord& local, const LocalOrigin& origin) {
    return LocalFrame{origin}.local_to_geodetic(local);
}

double local_distance_m(const LocalCoord& from, const LocalCoord& to) noexcept {
    const double dx = to.x - from.x;
    const double dy = to.y - from.y;
    const double dz = to.z - from.z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

}  // namespace survey_planner
