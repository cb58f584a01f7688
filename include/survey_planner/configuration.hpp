// === Configuration ===========================================================
//
// Exposes the strongly-typed mission request consumed by the planner CLI.
// `ConfigurationLoader` translates environment variables into this structure
// so downstream modules never touch `std::getenv` directly.

#pragma once

#include <string>

#include "survey_planner/camera_footprint.hpp"
#include "survey_planner/coverage_path_generator.hpp"
#include "survey_planner/path_assembler.hpp"
#include "survey_planner/types.hpp"

namespace survey_planner {

/**
 * @brief Bundle of runtime knobs describing one survey request.
 *
 * Every field is populated by ConfigurationLoader. Values are only parsed
 * here; range checks happen in the planner core when they are used.
 */
struct Configuration final {
    std::string log_directory{};     /**< Destination directory for structured logs. */
    std::string log_level{};         /**< Empty keeps the logger default. */
    std::string mission_name{};
    LocalOrigin origin{};            /**< Geodetic anchor of the mission frame. */
    LocalCoord takeoff{};            /**< Takeoff point in the mission frame. */
    CameraProfile camera{};
    CoverageParams coverage{};
    SafetyParams safety{};
    double speed_mps{};              /**< Segment cruise speed. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();

  private:
    static CameraProfile load_camera();
    static CoverageParams load_coverage();
    static SafetyParams load_safety();
};

}  // namespace survey_planner
