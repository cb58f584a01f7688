#include <catch2/catch.hpp>

#include "survey_planner/render_frame.hpp"

using namespace survey_planner;

TEST_CASE("Render frame swaps north and up") {
    const RenderCoord render = to_render_frame(LocalCoord{1.0, 2.0, 3.0});
    CHECK(render.x == 1.0);
    CHECK(render.y == 3.0);
    CHECK(render.z == 2.0);

    const LocalCoord local = from_render_frame(render);
    CHECK(local.x == 1.0);
    CHECK(local.y == 2.0);
    CHECK(local.z == 3.0);
}

TEST_CASE("Render frame conversion is usable at compile time") {
    constexpr RenderCoord render = to_render_frame(LocalCoord{4.0, 5.0, 6.0});
    static_assert(render.y == 6.0, "render up axis carries local up");
    static_assert(render.z == 5.0, "render depth axis carries local north");
    SUCCEED();
}

TEST_CASE("NED mapping flips the vertical axis") {
    const NedCoord ned = to_ned(LocalCoord{10.0, 20.0, 30.0});
    CHECK(ned.north == 20.0);
    CHECK(ned.east == 10.0);
    CHECK(ned.down == -30.0);

    const LocalCoord local = from_ned(ned);
    CHECK(local.x == 10.0);
    CHECK(local.y == 20.0);
    CHECK(local.z == 30.0);
}

TEST_CASE("Compass headings map onto render yaw") {
    CHECK(heading_to_render_yaw(0.0) == Approx(90.0));
    CHECK(heading_to_render_yaw(90.0) == Approx(0.0).margin(1e-12));
    CHECK(heading_to_render_yaw(180.0) == Approx(270.0));
    CHECK(heading_to_render_yaw(270.0) == Approx(180.0));
    CHECK(heading_to_render_yaw(-30.0) == Approx(120.0));
    CHECK(heading_to_render_yaw(450.0) == Approx(0.0).margin(1e-12));
}

TEST_CASE("Render yaw converts back to the original heading") {
    for (double heading = 0.0; heading < 360.0; heading += 22.5) {
        const double yaw = heading_to_render_yaw(heading);
        CHECK(yaw >= 0.0);
        CHECK(yaw < 360.0);
        CHECK(render_yaw_to_heading(yaw) == Approx(heading).margin(1e-9));
    }
}
