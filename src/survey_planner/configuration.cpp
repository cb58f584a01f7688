// === Configuration Loader ====================================================
//
// Centralizes parsing of environment-driven settings that describe a survey
// request. This implementation provides a narrow interface
// (`ConfigurationLoader`) that transforms raw environment variables into the
// strongly-typed `Configuration` structure consumed by the CLI.
//
// Responsibilities
// - Enforce defaults for every knob so an empty environment still plans a
//   sensible demonstration survey.
// - Reject values that are set but cannot be parsed (or are non-positive
//   where a positive quantity is required) with a PlanningError; a set value
//   never falls back to the default.
// - Shield the rest of the codebase from `std::getenv` lookups by returning a
//   fully-populated configuration object.
//
// Note: range validation (overlap in (0,1), valid latitude, ...) is left to
// the planner core.

#include "survey_planner/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "survey_planner/errors.hpp"
#include "survey_planner/logging.hpp"

namespace survey_planner {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_mission_name{"survey"};
constexpr GeodeticCoordinate k_default_origin{32.7473, -117.1661, 30.0, AltitudeReference::Ellipsoid};
constexpr double k_default_altitude_agl_m{60.0};
constexpr double k_default_overlap{0.75};
constexpr double k_default_pattern_length_m{200.0};
constexpr int k_default_number_of_lines{6};
constexpr double k_default_speed_mps{5.0};
constexpr double k_default_rtl_altitude_m{50.0};
constexpr double k_default_climb_speed_mps{2.5};
constexpr CameraProfile k_default_camera{36.0, 24.0, 6000.0, 4000.0, 35.0}; /**< Full-frame 24 MP body, 35 mm prime. */

std::string lower_case(std::string_view raw_value) {
    std::string value{raw_value};
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });
    return value;
}

const char* read_environment(const char* name) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return nullptr;
    }
    return raw_value;
}

[[noreturn]] void reject(const char* name, std::string_view raw_value, std::string_view expected) {
    auto logger = get_logger();
    logger->error("{}={} is not {}", name, raw_value, expected);
    throw PlanningError(ErrorKind::InvalidParameter, fmt::format("{}={} is not {}", name, raw_value, expected));
}

double parse_double(const char* name, double fallback) {
    const char* raw_value = read_environment(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    std::size_t consumed = 0;
    double parsed_value = 0.0;
    try {
        parsed_value = std::stod(raw_value, &consumed);
    } catch (const std::exception&) {
        reject(name, raw_value, "a number");
    }
    if (consumed != std::string_view{raw_value}.size()) {
        reject(name, raw_value, "a number");
    }
    return parsed_value;
}

double parse_positive_double(const char* name, double fallback) {
    const double parsed_value = parse_double(name, fallback);
    if (!(parsed_value > 0.0)) {
        reject(name, fmt::format("{}", parsed_value), "a positive number");
    }
    return parsed_value;
}

int parse_int(const char* name, int fallback) {
    const char* raw_value = read_environment(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    std::size_t consumed = 0;
    int parsed_value = 0;
    try {
        parsed_value = std::stoi(raw_value, &consumed);
    } catch (const std::exception&) {
        reject(name, raw_value, "an integer");
    }
    if (consumed != std::string_view{raw_value}.size()) {
        reject(name, raw_value, "an integer");
    }
    if (parsed_value <= 0) {
        reject(name, raw_value, "a positive integer");
    }
    return parsed_value;
}

bool parse_bool(const char* name, bool fallback) {
    const char* raw_value = read_environment(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    const std::string value = lower_case(raw_value);
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    reject(name, raw_value, "a boolean");
}

std::string parse_string(const char* name, std::string_view fallback) {
    const char* raw_value = read_environment(name);
    return raw_value == nullptr ? std::string{fallback} : std::string{raw_value};
}

PatternOrientation parse_orientation() {
    const std::string value = lower_case(parse_string("SURVEY_PLANNER_ORIENTATION", "horizontal"));
    if (value == "vertical") {
        return PatternOrientation::Vertical;
    }
    if (value != "horizontal") {
        reject("SURVEY_PLANNER_ORIENTATION", value, "horizontal or vertical");
    }
    return PatternOrientation::Horizontal;
}

MissionEndAction parse_end_action() {
    const std::string value = lower_case(parse_string("SURVEY_PLANNER_END_ACTION", "rtl"));
    if (value == "land") {
        return MissionEndAction::Land;
    }
    if (value == "hold") {
        return MissionEndAction::Hold;
    }
    if (value != "rtl") {
        reject("SURVEY_PLANNER_END_ACTION", value, "rtl, land or hold");
    }
    return MissionEndAction::Rtl;
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("SURVEY_PLANNER_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = parse_string("SURVEY_PLANNER_LOG_LEVEL", "");
    config.mission_name = parse_string("SURVEY_PLANNER_MISSION_NAME", k_default_mission_name);

    config.origin.latitude_deg = parse_double("SURVEY_PLANNER_ORIGIN_LAT", k_default_origin.latitude_deg);
    config.origin.longitude_deg = parse_double("SURVEY_PLANNER_ORIGIN_LON", k_default_origin.longitude_deg);
    config.origin.altitude_m = parse_double("SURVEY_PLANNER_ORIGIN_ALT_M", k_default_origin.altitude_m);
    config.origin.reference = AltitudeReference::Ellipsoid;

    config.takeoff.x = parse_double("SURVEY_PLANNER_TAKEOFF_X_M", 0.0);
    config.takeoff.y = parse_double("SURVEY_PLANNER_TAKEOFF_Y_M", 0.0);
    config.takeoff.z = 0.0;

    config.camera = load_camera();
    config.coverage = load_coverage();
    config.safety = load_safety();
    config.speed_mps = parse_positive_double("SURVEY_PLANNER_SPEED_MPS", k_default_speed_mps);

    logger->info("Configuration loaded: mission={} origin=({}, {}) agl_m={} overlap={} lines={} length_m={}",
                 config.mission_name,
                 config.origin.latitude_deg,
                 config.origin.longitude_deg,
                 config.coverage.altitude_agl_m,
                 config.coverage.overlap_fraction,
                 config.coverage.number_of_lines,
                 config.coverage.pattern_length_m);

    return config;
}

CameraProfile ConfigurationLoader::load_camera() {
    CameraProfile camera{};
    camera.sensor_width_mm = parse_positive_double("SURVEY_PLANNER_SENSOR_WIDTH_MM", k_default_camera.sensor_width_mm);
    camera.sensor_height_mm = parse_positive_double("SURVEY_PLANNER_SENSOR_HEIGHT_MM", k_default_camera.sensor_height_mm);
    camera.image_width_px = parse_positive_double("SURVEY_PLANNER_IMAGE_WIDTH_PX", k_default_camera.image_width_px);
    camera.image_height_px = parse_positive_double("SURVEY_PLANNER_IMAGE_HEIGHT_PX", k_default_camera.image_height_px);
    camera.focal_length_mm = parse_positive_double("SURVEY_PLANNER_FOCAL_LENGTH_MM", k_default_camera.focal_length_mm);
    return camera;
}

CoverageParams ConfigurationLoader::load_coverage() {
    CoverageParams coverage{};
    coverage.altitude_agl_m = parse_positive_double("SURVEY_PLANNER_ALTITUDE_AGL_M", k_default_altitude_agl_m);
    coverage.overlap_fraction = parse_double("SURVEY_PLANNER_OVERLAP", k_default_overlap);
    coverage.orientation = parse_orientation();
    coverage.snake = parse_bool("SURVEY_PLANNER_SNAKE", true);
    coverage.pattern_length_m = parse_positive_double("SURVEY_PLANNER_PATTERN_LENGTH_M", k_default_pattern_length_m);
    coverage.number_of_lines = parse_int("SURVEY_PLANNER_LINES", k_default_number_of_lines);

    coverage.start_offset.x = parse_double("SURVEY_PLANNER_START_OFFSET_X_M", 0.0);
    coverage.start_offset.y = parse_double("SURVEY_PLANNER_START_OFFSET_Y_M", 0.0);
    coverage.start_offset.z = parse_double("SURVEY_PLANNER_START_OFFSET_Z_M", 0.0);

    // An explicit spacing is passed through as given; the generator validates it.
    if (read_environment("SURVEY_PLANNER_LINE_SPACING_M") != nullptr) {
        coverage.line_spacing_m = parse_double("SURVEY_PLANNER_LINE_SPACING_M", 0.0);
    }
    return coverage;
}

SafetyParams ConfigurationLoader::load_safety() {
    SafetyParams safety{};
    safety.mission_end_action = parse_end_action();
    safety.rtl_altitude_m = parse_positive_double("SURVEY_PLANNER_RTL_ALTITUDE_M", k_default_rtl_altitude_m);
    safety.climb_speed_mps = parse_positive_double("SURVEY_PLANNER_CLIMB_SPEED_MPS", k_default_climb_speed_mps);
    return safety;
}

}  // namespace survey_planner
