#include <cmath>
#include <limits>

#include <catch2/catch.hpp>

#include "survey_planner/camera_footprint.hpp"
#include "survey_planner/errors.hpp"

using namespace survey_planner;

namespace {

CameraProfile make_camera() {
    CameraProfile camera{};
    camera.sensor_width_mm = 36.0;
    camera.sensor_height_mm = 24.0;
    camera.image_width_px = 6000.0;
    camera.image_height_px = 4000.0;
    camera.focal_length_mm = 50.0;
    return camera;
}

ErrorKind footprint_failure(const CameraProfile& camera, double altitude_agl_m) {
    try {
        (void)compute_footprint(camera, altitude_agl_m);
    } catch (const PlanningError& error) {
        return error.kind();
    }
    FAIL("compute_footprint accepted invalid input");
    return ErrorKind::Cancelled;
}

}  // namespace

TEST_CASE("Footprint follows the pinhole model") {
    const Footprint footprint = compute_footprint(make_camera(), 100.0);

    // 36 mm / 6000 px * 100 m / 50 mm = 1.2 cm per pixel.
    CHECK(footprint.gsd_cm_per_px == Approx(1.2));
    CHECK(footprint.width_m == Approx(72.0));
    CHECK(footprint.height_m == Approx(48.0));
}

TEST_CASE("Line spacing for a full-frame body at 80 percent overlap") {
    const Footprint footprint = compute_footprint(make_camera(), 100.0);
    const double expected_width_m = (36.0 * 100.0 / 50.0 / 6000.0) * 6000.0;

    CHECK(compute_line_spacing(footprint.width_m, 0.8) == Approx(expected_width_m * (1.0 - 0.8)));
    CHECK(compute_line_spacing(footprint.width_m, 0.8) == Approx(14.4));
}

TEST_CASE("Footprint scales linearly with altitude") {
    const Footprint low = compute_footprint(make_camera(), 60.0);
    const Footprint high = compute_footprint(make_camera(), 120.0);

    CHECK(high.width_m == Approx(low.width_m * 2.0));
    CHECK(high.height_m == Approx(low.height_m * 2.0));
    CHECK(high.gsd_cm_per_px == Approx(low.gsd_cm_per_px * 2.0));
}

TEST_CASE("Overlap spacing uses image height along track and width across track") {
    const OverlapSpacing spacing = compute_overlap_spacing(make_camera(), 0.75, 0.6, 100.0);

    CHECK(spacing.footprint.width_m == Approx(72.0));
    CHECK(spacing.along_track_spacing_m == Approx(48.0 * 0.25));
    CHECK(spacing.line_spacing_m == Approx(72.0 * 0.4));
}

TEST_CASE("Field of view and altitude-for-GSD helpers") {
    const double expected_fov = 2.0 * std::atan(36.0 / (2.0 * 50.0)) * 180.0 / 3.14159265358979323846;
    CHECK(field_of_view_deg(50.0, 36.0) == Approx(expected_fov));

    CHECK(altitude_for_gsd(make_camera(), 1.2) == Approx(100.0));
    const double altitude = altitude_for_gsd(make_camera(), 2.5);
    CHECK(compute_footprint(make_camera(), altitude).gsd_cm_per_px == Approx(2.5));
}

TEST_CASE("Non-positive camera or altitude inputs are rejected") {
    CameraProfile no_focal = make_camera();
    no_focal.focal_length_mm = 0.0;
    CHECK(footprint_failure(no_focal, 100.0) == ErrorKind::InvalidParameter);

    CameraProfile no_pixels = make_camera();
    no_pixels.image_width_px = 0.0;
    CHECK(footprint_failure(no_pixels, 100.0) == ErrorKind::InvalidParameter);

    CameraProfile negative_sensor = make_camera();
    negative_sensor.sensor_height_mm = -24.0;
    CHECK(footprint_failure(negative_sensor, 100.0) == ErrorKind::InvalidParameter);

    CHECK(footprint_failure(make_camera(), 0.0) == ErrorKind::InvalidParameter);
    CHECK(footprint_failure(make_camera(), -10.0) == ErrorKind::InvalidParameter);
    CHECK(footprint_failure(make_camera(), std::numeric_limits<double>::quiet_NaN()) == ErrorKind::InvalidParameter);
}

TEST_CASE("Overlap must lie strictly between zero and one") {
    REQUIRE_THROWS_AS(compute_line_spacing(72.0, 0.0), PlanningError);
    REQUIRE_THROWS_AS(compute_line_spacing(72.0, 1.0), PlanningError);
    REQUIRE_THROWS_AS(compute_line_spacing(72.0, 1.2), PlanningError);
    REQUIRE_THROWS_AS(compute_line_spacing(72.0, -0.1), PlanningError);
    REQUIRE_THROWS_AS(compute_line_spacing(0.0, 0.5), PlanningError);
    REQUIRE_NOTHROW(compute_line_spacing(72.0, 0.5));
}
