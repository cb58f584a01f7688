#include <cmath>
#include <cstddef>
#include <vector>

#include <catch2/catch.hpp>

#include "survey_planner/coverage_path_generator.hpp"
#include "survey_planner/errors.hpp"

using namespace survey_planner;

namespace {

CoverageParams make_params(int number_of_lines, double spacing_m) {
    CoverageParams params{};
    params.altitude_agl_m = 60.0;
    params.overlap_fraction = 0.7;
    params.orientation = PatternOrientation::Horizontal;
    params.snake = true;
    params.pattern_length_m = 100.0;
    params.number_of_lines = number_of_lines;
    params.line_spacing_m = spacing_m;
    return params;
}

CameraProfile make_camera() {
    return CameraProfile{36.0, 24.0, 6000.0, 4000.0, 50.0};
}

ErrorKind raster_failure(const CoverageParams& params) {
    try {
        (void)generate_raster(params, LocalCoord{});
    } catch (const PlanningError& error) {
        return error.kind();
    }
    FAIL("generate_raster accepted invalid parameters");
    return ErrorKind::Cancelled;
}

}  // namespace

TEST_CASE("Raster emits two points per line at the flight altitude") {
    const LocalCoord origin{5.0, -3.0, 2.0};
    CoverageParams params = make_params(5, 12.0);
    params.snake = false;

    const std::vector<LocalCoord> list_points = generate_raster(params, origin);
    REQUIRE(list_points.size() == 5 * k_points_per_line);

    for (std::size_t line = 0; line < 5; ++line) {
        const LocalCoord& start = list_points[line * 2];
        const LocalCoord& end = list_points[line * 2 + 1];
        CHECK(start.x == Approx(origin.x));
        CHECK(end.x == Approx(origin.x + 100.0));
        CHECK(start.y == Approx(origin.y + 12.0 * static_cast<double>(line)));
        CHECK(end.y == Approx(start.y));
        CHECK(start.z == Approx(origin.z + 60.0));
        CHECK(end.z == Approx(origin.z + 60.0));
    }
}

TEST_CASE("Adjacent lines are separated by exactly the line spacing") {
    const std::vector<LocalCoord> list_points = generate_raster(make_params(6, 14.4), LocalCoord{});
    for (std::size_t line = 1; line < 6; ++line) {
        CHECK(list_points[line * 2].y - list_points[(line - 1) * 2].y == Approx(14.4));
    }
}

TEST_CASE("Snake ordering alternates line direction") {
    const std::vector<LocalCoord> list_points = generate_raster(make_params(4, 10.0), LocalCoord{});
    REQUIRE(list_points.size() == 8);

    CHECK(list_points[0].x == Approx(0.0));
    CHECK(list_points[1].x == Approx(100.0));
    CHECK(list_points[2].x == Approx(100.0));
    CHECK(list_points[3].x == Approx(0.0));
    CHECK(list_points[4].x == Approx(0.0));
    CHECK(list_points[5].x == Approx(100.0));
    CHECK(list_points[6].x == Approx(100.0));
    CHECK(list_points[7].x == Approx(0.0));
}

TEST_CASE("Vertical orientation runs lines north and steps east") {
    CoverageParams params = make_params(3, 20.0);
    params.orientation = PatternOrientation::Vertical;

    const std::vector<LocalCoord> list_points = generate_raster(params, LocalCoord{});
    REQUIRE(list_points.size() == 6);
    CHECK(list_points[0].y == Approx(0.0));
    CHECK(list_points[1].y == Approx(100.0));
    CHECK(list_points[2].x == Approx(20.0));
    CHECK(list_points[2].y == Approx(100.0));
    CHECK(list_points[5].x == Approx(40.0));
    CHECK(list_points[5].y == Approx(100.0));
}

TEST_CASE("A single line needs no spacing") {
    CoverageParams params = make_params(1, 0.0);
    params.line_spacing_m.reset();

    const std::vector<LocalCoord> list_points = generate_raster(params, LocalCoord{});
    REQUIRE(list_points.size() == 2);
    CHECK(list_points[1].x == Approx(100.0));
}

TEST_CASE("An explicit spacing is validated even for a single line") {
    CHECK(raster_failure(make_params(1, 0.0)) == ErrorKind::InvalidParameter);
    CHECK(raster_failure(make_params(1, -3.0)) == ErrorKind::InvalidParameter);
    REQUIRE_NOTHROW(generate_raster(make_params(1, 5.0), LocalCoord{}));
}

TEST_CASE("Invalid raster parameters are rejected") {
    CHECK(raster_failure(make_params(0, 10.0)) == ErrorKind::InvalidParameter);
    CHECK(raster_failure(make_params(3, 0.0)) == ErrorKind::InvalidParameter);
    CHECK(raster_failure(make_params(3, -5.0)) == ErrorKind::InvalidParameter);

    CoverageParams no_length = make_params(2, 10.0);
    no_length.pattern_length_m = 0.0;
    CHECK(raster_failure(no_length) == ErrorKind::InvalidParameter);

    CoverageParams unresolved = make_params(2, 10.0);
    unresolved.line_spacing_m.reset();
    CHECK(raster_failure(unresolved) == ErrorKind::InvalidParameter);
}

TEST_CASE("Line spacing resolves from the camera unless overridden") {
    CoverageParams params = make_params(4, 0.0);
    params.line_spacing_m.reset();
    params.altitude_agl_m = 100.0;
    params.overlap_fraction = 0.8;
    CHECK(resolve_line_spacing(params, make_camera()) == Approx(14.4));

    params.line_spacing_m = 25.0;
    CHECK(resolve_line_spacing(params, make_camera()) == Approx(25.0));

    params.line_spacing_m.reset();
    params.overlap_fraction = 1.0;
    REQUIRE_THROWS_AS(resolve_line_spacing(params, make_camera()), PlanningError);
}

TEST_CASE("Overlap grid covers the region with snake rows") {
    OverlapGridParams params{};
    params.start = LocalCoord{10.0, 20.0, 100.0};
    params.region_width_m = 130.0;
    params.region_height_m = 120.0;
    params.camera = make_camera();
    params.along_track_overlap = 0.5;
    params.cross_track_overlap = 0.5;

    // Footprint at 100 m is 72 m wide and 48 m tall; spacing is 24 m along track, 36 m across.
    const std::vector<LocalCoord> list_points = generate_overlap_grid(params);
    REQUIRE(list_points.size() == 15);

    CHECK(list_points[0].x == Approx(10.0));
    CHECK(list_points[4].x == Approx(10.0 + 4.0 * 24.0));
    CHECK(list_points[5].x == Approx(10.0 + 4.0 * 24.0));
    CHECK(list_points[5].y == Approx(20.0 + 36.0));
    CHECK(list_points[9].x == Approx(10.0));
    CHECK(list_points[14].y == Approx(20.0 + 72.0));
    for (const LocalCoord& point : list_points) {
        CHECK(point.z == Approx(100.0));
    }
}

TEST_CASE("Overlap grid smaller than one footprint yields one image") {
    OverlapGridParams params{};
    params.start = LocalCoord{0.0, 0.0, 100.0};
    params.region_width_m = 10.0;
    params.region_height_m = 10.0;
    params.camera = make_camera();
    params.along_track_overlap = 0.7;
    params.cross_track_overlap = 0.7;
    params.snake = false;

    REQUIRE(generate_overlap_grid(params).size() == 1);
}
