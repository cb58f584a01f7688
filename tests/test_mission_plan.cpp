#include <atomic>
#include <functional>
#include <limits>
#include <optional>
#include <string>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "survey_planner/errors.hpp"
#include "survey_planner/mission_plan.hpp"

using namespace survey_planner;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    survey_planner::test::ensure_logger_initialized();
    return true;
}();

const LocalOrigin k_origin{32.7473, -117.1661, 30.0};

CameraProfile make_camera() {
    return CameraProfile{36.0, 24.0, 6000.0, 4000.0, 50.0};
}

SafetyParams make_safety_hold() {
    SafetyParams safety{};
    safety.mission_end_action = MissionEndAction::Hold;
    return safety;
}

CoverageParams make_coverage(int number_of_lines) {
    CoverageParams coverage{};
    coverage.altitude_agl_m = 100.0;
    coverage.overlap_fraction = 0.8;
    coverage.pattern_length_m = 150.0;
    coverage.number_of_lines = number_of_lines;
    return coverage;
}

ErrorKind kind_of(const std::function<void()>& action) {
    try {
        action();
    } catch (const PlanningError& error) {
        return error.kind();
    }
    FAIL("expected a PlanningError");
    return ErrorKind::Cancelled;
}

}  // namespace

TEST_CASE("MissionPlan requires a takeoff point before planning") {
    MissionPlan mission{"survey", k_origin, SafetyParams{}};
    CHECK(kind_of([&mission]() { (void)mission.plan_survey(make_coverage(4), make_camera()); })
          == ErrorKind::MissingPrecondition);
    CHECK(mission.segments().empty());
}

TEST_CASE("MissionPlan plans a survey with camera-derived spacing") {
    MissionPlan mission{"survey", k_origin, SafetyParams{}};
    mission.set_takeoff_point(LocalCoord{0.0, 0.0, 0.0});

    const PathSegment& segment = mission.plan_survey(make_coverage(4), make_camera());

    CHECK(segment.identifier == "survey-segment-1");
    REQUIRE(segment.waypoints.size() == 4 * 2 + 2);
    // Footprint width at 100 m is 72 m; 80 percent overlap leaves 14.4 m between lines.
    CHECK(segment.waypoints[3].local().y == Approx(14.4));
    CHECK(segment.waypoints[1].local().z == Approx(100.0));
    CHECK(mission.total_waypoint_count() == 10);
    CHECK(mission.total_distance_m() == Approx(path_distance_m(segment)));
}

TEST_CASE("A single-line survey ignores overlap") {
    MissionPlan mission{"single", k_origin, SafetyParams{}};
    mission.set_takeoff_point(LocalCoord{10.0, 10.0, 0.0});

    CoverageParams coverage = make_coverage(1);
    coverage.overlap_fraction = 0.0;

    const PathSegment& segment = mission.plan_survey(coverage, make_camera());
    REQUIRE(segment.waypoints.size() == 4);
    CHECK(segment.waypoints[2].local().x == Approx(160.0));
}

TEST_CASE("The raster starts at the takeoff point plus the start offset") {
    MissionPlan mission{"offset", k_origin, SafetyParams{}};
    mission.set_takeoff_point(LocalCoord{10.0, 10.0, 0.0});

    CoverageParams coverage = make_coverage(2);
    coverage.start_offset = LocalCoord{40.0, -25.0, 5.0};

    const PathSegment& segment = mission.plan_survey(coverage, make_camera());
    REQUIRE(segment.waypoints.size() == 2 * 2 + 2);

    CHECK(segment.waypoints.front().local().x == Approx(10.0));
    CHECK(segment.waypoints.front().local().y == Approx(10.0));

    const LocalCoord& first_pattern = segment.waypoints[1].local();
    CHECK(first_pattern.x == Approx(50.0));
    CHECK(first_pattern.y == Approx(-15.0));
    CHECK(first_pattern.z == Approx(105.0));
    CHECK(segment.waypoints[2].local().x == Approx(200.0));
    CHECK(segment.waypoints[3].local().y == Approx(-15.0 + 14.4));

    CHECK(segment.waypoints.back().local().x == Approx(10.0));
    CHECK(segment.waypoints.back().local().y == Approx(10.0));
}

TEST_CASE("A non-finite start offset is rejected") {
    MissionPlan mission{"bad-offset", k_origin, SafetyParams{}};
    mission.set_takeoff_point(LocalCoord{});

    CoverageParams coverage = make_coverage(2);
    coverage.start_offset.x = std::numeric_limits<double>::quiet_NaN();

    CHECK(kind_of([&mission, &coverage]() { (void)mission.plan_survey(coverage, make_camera()); })
          == ErrorKind::OutOfRange);
    CHECK(mission.segments().empty());
}

TEST_CASE("Segments can be replaced and removed by identifier") {
    MissionPlan mission{"edit", k_origin, make_safety_hold()};
    mission.set_takeoff_point(LocalCoord{});

    AssemblyOptions options{};
    options.identifier = "north-block";
    (void)mission.plan_survey(make_coverage(2), make_camera(), options);
    (void)mission.plan_survey(make_coverage(3), make_camera());
    REQUIRE(mission.segments().size() == 2);

    PathSegment replacement = mission.segment("edit-segment-1");
    replacement.speed_mps = 9.0;
    mission.replace_segment("north-block", replacement);
    CHECK(mission.segment("north-block").speed_mps == 9.0);
    CHECK(mission.segment("north-block").identifier == "north-block");

    mission.remove_segment("edit-segment-1");
    REQUIRE(mission.segments().size() == 1);
    CHECK(mission.segments().front().identifier == "north-block");
}

TEST_CASE("Unknown or duplicate segment identifiers are rejected") {
    MissionPlan mission{"ids", k_origin, SafetyParams{}};
    mission.set_takeoff_point(LocalCoord{});
    (void)mission.plan_survey(make_coverage(2), make_camera());

    CHECK(kind_of([&mission]() { mission.remove_segment("missing"); }) == ErrorKind::MissingPrecondition);
    CHECK(kind_of([&mission]() { mission.replace_segment("missing", PathSegment{}); }) == ErrorKind::MissingPrecondition);
    CHECK(kind_of([&mission]() { (void)mission.segment("missing"); }) == ErrorKind::MissingPrecondition);

    PathSegment duplicate{};
    duplicate.identifier = "ids-segment-1";
    CHECK(kind_of([&mission, &duplicate]() { (void)mission.add_segment(duplicate); }) == ErrorKind::InvalidParameter);
    CHECK(mission.segments().size() == 1);
}

TEST_CASE("A cancelled survey leaves the mission unchanged") {
    MissionPlan mission{"cancel", k_origin, SafetyParams{}};
    mission.set_takeoff_point(LocalCoord{});

    std::atomic<bool> cancel{true};
    ChunkOptions chunk_options{};
    chunk_options.cancel_flag = &cancel;

    CHECK(kind_of([&mission, &chunk_options]() {
              (void)mission.plan_survey(make_coverage(3), make_camera(), AssemblyOptions{}, chunk_options);
          })
          == ErrorKind::Cancelled);
    CHECK(mission.segments().empty());
}

TEST_CASE("Takeoff point must be finite") {
    MissionPlan mission{"takeoff", k_origin, SafetyParams{}};
    CHECK(kind_of([&mission]() {
              mission.set_takeoff_point(LocalCoord{std::numeric_limits<double>::infinity(), 0.0, 0.0});
          })
          == ErrorKind::OutOfRange);
    CHECK_FALSE(mission.takeoff_point().has_value());
}

TEST_CASE("Vehicle poses are expressed in the mission frame") {
    MissionPlan mission{"pose", k_origin, SafetyParams{}};

    VehiclePose pose{};
    pose.position = mission.frame().local_to_geodetic(LocalCoord{25.0, -40.0, 12.0});
    pose.heading_deg = 135.0;
    pose.pitch_deg = 3.0;

    const LocalPose local_pose = mission.vehicle_pose_in_mission_frame(pose);
    CHECK(local_pose.position.x == Approx(25.0).margin(1e-6));
    CHECK(local_pose.position.y == Approx(-40.0).margin(1e-6));
    CHECK(local_pose.position.z == Approx(12.0).margin(1e-6));
    CHECK(local_pose.heading_deg == 135.0);
    CHECK(local_pose.pitch_deg == 3.0);
}

TEST_CASE("MissionPlan rejects an empty name") {
    CHECK(kind_of([]() { MissionPlan unnamed{"", k_origin, SafetyParams{}}; }) == ErrorKind::InvalidParameter);
}
