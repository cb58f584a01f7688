#include <cstddef>
#include <cstdlib>
#include <iostream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "survey_planner/configuration.hpp"
#include "survey_planner/errors.hpp"
#include "survey_planner/logging.hpp"
#include "survey_planner/mission_plan.hpp"
#include "survey_planner/render_frame.hpp"
#include "survey_planner/version.hpp"

namespace {

void print_segment(const survey_planner::PathSegment& segment) {
    using namespace survey_planner;

    std::cout << fmt::format("# segment {} ({} waypoints, {:.1f} m at {:.1f} m/s)\n",
                             segment.identifier,
                             segment.waypoints.size(),
                             path_distance_m(segment),
                             segment.speed_mps);
    std::cout << "index,east_m,north_m,up_m,latitude_deg,longitude_deg,ellipsoid_height_m,render_x,render_y,render_z\n";
    for (std::size_t index = 0; index < segment.waypoints.size(); ++index) {
        const Waypoint& waypoint = segment.waypoints[index];
        const LocalCoord& local = waypoint.local();
        const GeodeticCoordinate& geodetic = waypoint.geodetic();
        const RenderCoord render = to_render_frame(local);
        std::cout << fmt::format("{},{:.3f},{:.3f},{:.3f},{:.9f},{:.9f},{:.3f},{:.3f},{:.3f},{:.3f}\n",
                                 index,
                                 local.x,
                                 local.y,
                                 local.z,
                                 geodetic.latitude_deg,
                                 geodetic.longitude_deg,
                                 geodetic.altitude_m,
                                 render.x,
                                 render.y,
                                 render.z);
    }
}

}  // namespace

int main() {
    using namespace survey_planner;

    try {
        const Configuration configuration = ConfigurationLoader::load();
        if (!configuration.log_level.empty()) {
            set_log_level(configuration.log_level);
        }

        auto logger = get_logger();
        logger->info("survey_planner {} starting", k_version);

        MissionPlan mission{configuration.mission_name, configuration.origin, configuration.safety};
        mission.set_takeoff_point(configuration.takeoff);

        const Footprint footprint = compute_footprint(configuration.camera, configuration.coverage.altitude_agl_m);
        logger->info("Footprint at {} m AGL: {:.2f} x {:.2f} m, GSD {:.3f} cm/px",
                     configuration.coverage.altitude_agl_m,
                     footprint.width_m,
                     footprint.height_m,
                     footprint.gsd_cm_per_px);

        AssemblyOptions options{};
        options.speed_mps = configuration.speed_mps;
        options.pattern_action = MissionAction{ActionType::TakePhoto, ""};

        ChunkOptions chunk_options{};
        chunk_options.on_progress = [&logger](double progress) {
            logger->debug("Waypoint conversion {:.0f}% complete", progress * 100.0);
        };

        const PathSegment& segment = mission.plan_survey(configuration.coverage, configuration.camera, options, chunk_options);
        print_segment(segment);
    } catch (const PlanningError& exc) {
        try {
            auto logger = get_logger();
            logger->error("Planning failed ({}): {}", to_string(exc.kind()), exc.what());
        } catch (const std::exception&) {
            std::cerr << "Planning failed: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
