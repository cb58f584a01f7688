#include "survey_planner/geodetic_transform.hpp"

#include <cmath>
#include <numbers>

#include <fmt/format.h>

#include "survey_planner/errors.hpp"

namespace survey_planner {

namespace {

constexpr int k_max_bowring_iterations{8};
constexpr double k_latitude_convergence_rad{1e-12};
constexpr double k_polar_axis_threshold_m{1e-9};  /**< Distance from the spin axis treated as on-axis. */

constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

constexpr double radians_to_degrees(double radians) {
    return radians * 180.0 / std::numbers::pi;
}

double prime_vertical_radius(double sin_lat) {
    return wgs84::k_semi_major_axis_m / std::sqrt(1.0 - wgs84::k_first_eccentricity_sq * sin_lat * sin_lat);
}

}  // namespace

void validate_geodetic(const GeodeticCoordinate& coordinate) {
    if (!std::isfinite(coordinate.latitude_deg) || !std::isfinite(coordinate.longitude_deg)
        || !std::isfinite(coordinate.altitude_m)) {
        throw PlanningError(ErrorKind::OutOfRange, "Geodetic coordinate has non-finite components");
    }
    if (coordinate.latitude_deg < -90.0 || coordinate.latitude_deg > 90.0) {
        throw PlanningError(
            ErrorKind::OutOfRange,
            fmt::format("Latitude {} outside [-90, 90]", coordinate.latitude_deg)
        );
    }
    if (coordinate.longitude_deg < -180.0 || coordinate.longitude_deg > 180.0) {
        throw PlanningError(
            ErrorKind::OutOfRange,
            fmt::format("Longitude {} outside [-180, 180]", coordinate.longitude_deg)
        );
    }
}

EcefVector to_ecef(const GeodeticCoordinate& coordinate) {
    validate_geodetic(coordinate);

    const double lat = degrees_to_radians(coordinate.latitude_deg);
    const double lon = degrees_to_radians(coordinate.longitude_deg);
    const double sin_lat = std::sin(lat);
    const double cos_lat = std::cos(lat);
    const double n = prime_vertical_radius(sin_lat);
    const double h = coordinate.altitude_m;

    return EcefVector{
        (n + h) * cos_lat * std::cos(lon),
        (n + h) * cos_lat * std::sin(lon),
        (n * (1.0 - wgs84::k_first_eccentricity_sq) + h) * sin_lat
    };
}

GeodeticCoordinate to_geodetic(const EcefVector& ecef) {
    if (!std::isfinite(ecef.x) || !std::isfinite(ecef.y) || !std::isfinite(ecef.z)) {
        throw PlanningError(ErrorKind::OutOfRange, "ECEF vector has non-finite components");
    }

    constexpr double a = wgs84::k_semi_major_axis_m;
    constexpr double b = wgs84::k_semi_minor_axis_m;
    constexpr double e2 = wgs84::k_first_eccentricity_sq;
    constexpr double ep2 = wgs84::k_second_eccentricity_sq;

    const double p = std::hypot(ecef.x, ecef.y);
    const double lon = p < k_polar_axis_threshold_m ? 0.0 : std::atan2(ecef.y, ecef.x);

    if (p < k_polar_axis_threshold_m) {
        const double lat = ecef.z >= 0.0 ? std::numbers::pi / 2.0 : -std::numbers::pi / 2.0;
        return GeodeticCoordinate{radians_to_degrees(lat), radians_to_degrees(lon), std::abs(ecef.z) - b, AltitudeReference::Ellipsoid};
    }

    // Bowring's initial parametric latitude, then refine.
    double beta = std::atan2(a * ecef.z, b * p);
    double lat = std::atan2(
        ecef.z + ep2 * b * std::pow(std::sin(beta), 3),
        p - e2 * a * std::pow(std::cos(beta), 3)
    );
    for (int iteration = 0; iteration < k_max_bowring_iterations; ++iteration) {
        beta = std::atan2((1.0 - wgs84::k_flattening) * std::sin(lat), std::cos(lat));
        const double refined_lat = std::atan2(
            ecef.z + ep2 * b * std::pow(std::sin(beta), 3),
            p - e2 * a * std::pow(std::cos(beta), 3)
        );
        const double delta = std::abs(refined_lat - lat);
        lat = refined_lat;
        if (delta < k_latitude_convergence_rad) {
            break;
        }
    }

    const double sin_lat = std::sin(lat);
    const double cos_lat = std::cos(lat);
    const double n = prime_vertical_radius(sin_lat);

    // Near the poles p / cos(lat) is ill-conditioned; use the z form there.
    const double height = std::abs(cos_lat) > 1e-3
        ? p / cos_lat - n
        : ecef.z / sin_lat - n * (1.0 - e2);

    return GeodeticCoordinate{radians_to_degrees(lat), radians_to_degrees(lon), height, AltitudeReference::Ellipsoid};
}

}  // namespace survey_planner
