// === Waypoints & Path Segments ===============================================
//
// A Waypoint stores both its geodetic and mission-local position. The two are
// only ever written together through a LocalFrame so they always describe the
// same physical point. PathSegment is the ordered unit handed to renderers,
// mission documents and the flight-controller bridge.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "survey_planner/local_frame.hpp"
#include "survey_planner/types.hpp"

namespace survey_planner {

/**
 * @brief Payload actions that can be triggered on arrival at a waypoint.
 */
enum class ActionType {
    TakePhoto,
    StartVideo,
    StopVideo,
    RotateGimbal,
    Custom
};

struct MissionAction final {
    ActionType type{ActionType::TakePhoto};
    std::string str_parameters{};  /**< Free-form action arguments. */
};

/**
 * @brief Navigational waypoint carrying consistent geodetic and local positions.
 */
class Waypoint final {
  public:
    /**
     * @brief Create a waypoint at @p local, deriving its geodetic position.
     */
    Waypoint(const LocalCoord& local, const LocalFrame& frame, AltitudeReference altitude_reference, CameraPose camera_pose);

    /**
     * @brief Create a waypoint at @p geodetic, deriving its local position.
     */
    Waypoint(const GeodeticCoordinate& geodetic, const LocalFrame& frame, AltitudeReference altitude_reference, CameraPose camera_pose);

    [[nodiscard]] const GeodeticCoordinate& geodetic() const noexcept;
    [[nodiscard]] const LocalCoord& local() const noexcept;
    [[nodiscard]] AltitudeReference altitude_reference() const noexcept;
    [[nodiscard]] const CameraPose& camera_pose() const noexcept;
    [[nodiscard]] std::optional<double> speed_mps() const noexcept;
    [[nodiscard]] std::optional<double> hold_seconds() const noexcept;
    [[nodiscard]] const std::vector<MissionAction>& actions() const noexcept;

    /** @brief Move the waypoint to @p local and recompute its geodetic position. */
    void set_local(const LocalCoord& local, const LocalFrame& frame);
    /** @brief Move the waypoint to @p geodetic and recompute its local position. */
    void set_geodetic(const GeodeticCoordinate& geodetic, const LocalFrame& frame);

    void set_camera_pose(CameraPose camera_pose) noexcept;
    void set_speed_mps(std::optional<double> speed_mps);
    void set_hold_seconds(std::optional<double> hold_seconds);
    void add_action(MissionAction action);

  private:
    GeodeticCoordinate geodetic_;
    LocalCoord local_;
    AltitudeReference altitude_reference_;
    CameraPose camera_pose_;
    std::optional<double> optional_speed_mps_;
    std::optional<double> optional_hold_seconds_;
    std::vector<MissionAction> list_actions_;
};

/**
 * @brief Shape of the path a segment represents.
 */
enum class PathType {
    Straight,
    Grid,
    Custom
};

/**
 * @brief Ordered waypoint sequence flown at a common speed.
 */
struct PathSegment final {
    std::string identifier{};
    PathType type{PathType::Grid};
    std::vector<Waypoint> waypoints{};
    double speed_mps{};
};

/** @brief Sum of 3D local leg lengths along the segment. */
[[nodiscard]] double path_distance_m(const PathSegment& segment) noexcept;

}  // namespace survey_planner
