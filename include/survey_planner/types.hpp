// === Core Types ==============================================================
//
// Collects the coordinate value types shared by every planner module: geodetic
// positions, Earth-centred vectors, mission-local ENU coordinates and the
// camera/vehicle attitude descriptors carried by waypoints.

#pragma once

namespace survey_planner {

/**
 * @brief Identifies what an altitude value is measured against.
 */
enum class AltitudeReference {
    Ellipsoid,  /**< Height above the WGS84 ellipsoid. */
    Relative,   /**< Height above the mission takeoff ground level. */
    Terrain     /**< Height above the terrain directly below the point. */
};

/**
 * @brief Represents a latitude/longitude/altitude triplet in degrees/metres.
 */
struct GeodeticCoordinate final {
    double latitude_deg{};                                  /**< Latitude in decimal degrees, [-90, 90]. */
    double longitude_deg{};                                 /**< Longitude in decimal degrees, [-180, 180]. */
    double altitude_m{};                                    /**< Altitude in metres. */
    AltitudeReference reference{AltitudeReference::Ellipsoid}; /**< Datum the altitude is measured against. */
};

/**
 * @brief Earth-Centred Earth-Fixed cartesian position in metres.
 */
struct EcefVector final {
    double x{};
    double y{};
    double z{};
};

/**
 * @brief East-North-Up coordinate relative to a mission's local origin.
 */
struct LocalCoord final {
    double x{};  /**< East in metres. */
    double y{};  /**< North in metres. */
    double z{};  /**< Up in metres. */
};

/**
 * @brief Geodetic anchor of a mission's local tangent frame.
 *
 * Fixed once when the mission is created. Every stored LocalCoord of the
 * mission is relative to it, so it must never change afterwards.
 */
using LocalOrigin = GeodeticCoordinate;

/**
 * @brief Gimbal orientation requested at a waypoint.
 */
struct CameraPose final {
    double heading_deg{};       /**< Clockwise from north. */
    double pitch_deg{-90.0};    /**< -90 points straight down (nadir). */
    double roll_deg{};
};

/**
 * @brief Live vehicle pose as reported by the telemetry bridge.
 */
struct VehiclePose final {
    GeodeticCoordinate position{};
    double heading_deg{};  /**< Clockwise from north. */
    double pitch_deg{};
    double roll_deg{};
};

/**
 * @brief Vehicle pose expressed in a mission's local frame.
 */
struct LocalPose final {
    LocalCoord position{};
    double heading_deg{};
    double pitch_deg{};
    double roll_deg{};
};

}  // namespace survey_planner
