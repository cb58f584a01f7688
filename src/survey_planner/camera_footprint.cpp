#include "survey_planner/camera_footprint.hpp"

#include <cmath>
#include <numbers>
#include <string_view>

#include <fmt/format.h>

#include "survey_planner/errors.hpp"

namespace survey_planner {

namespace {

constexpr double k_cm_per_m{100.0};

/**
 * @brief Reject values that are not strictly positive, NaN included.
 */
void require_positive(double value, std::string_view name) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw PlanningError(ErrorKind::InvalidParameter, fmt::format("{} must be positive, got {}", name, value));
    }
}

void require_overlap(double overlap_fraction, std::string_view name) {
    if (!(overlap_fraction > 0.0 && overlap_fraction < 1.0)) {
        throw PlanningError(
            ErrorKind::InvalidParameter,
            fmt::format("{} must lie in (0, 1), got {}", name, overlap_fraction)
        );
    }
}

void validate_camera(const CameraProfile& camera) {
    require_positive(camera.focal_length_mm, "focal length");
    require_positive(camera.sensor_width_mm, "sensor width");
    require_positive(camera.sensor_height_mm, "sensor height");
    require_positive(camera.image_width_px, "image width");
    require_positive(camera.image_height_px, "image height");
}

}  // namespace

Footprint compute_footprint(const CameraProfile& camera, double altitude_agl_m) {
    validate_camera(camera);
    require_positive(altitude_agl_m, "altitude AGL");

    const double gsd_width_cm = (camera.sensor_width_mm / camera.image_width_px) * altitude_agl_m * k_cm_per_m
        / camera.focal_length_mm;
    const double gsd_height_cm = (camera.sensor_height_mm / camera.image_height_px) * altitude_agl_m * k_cm_per_m
        / camera.focal_length_mm;

    Footprint footprint{};
    footprint.gsd_cm_per_px = gsd_width_cm;
    footprint.width_m = gsd_width_cm * camera.image_width_px / k_cm_per_m;
    footprint.height_m = gsd_height_cm * camera.image_height_px / k_cm_per_m;
    return footprint;
}

double compute_line_spacing(double dimension_m, double overlap_fraction) {
    require_positive(dimension_m, "footprint dimension");
    require_overlap(overlap_fraction, "overlap fraction");
    return dimension_m * (1.0 - overlap_fraction);
}

OverlapSpacing compute_overlap_spacing(
    const CameraProfile& camera,
    double along_track_overlap,
    double cross_track_overlap,
    double altitude_agl_m
) {
    OverlapSpacing spacing{};
    spacing.footprint = compute_footprint(camera, altitude_agl_m);
    spacing.along_track_spacing_m = compute_line_spacing(spacing.footprint.height_m, along_track_overlap);
    spacing.line_spacing_m = compute_line_spacing(spacing.footprint.width_m, cross_track_overlap);
    return spacing;
}

double field_of_view_deg(double focal_length_mm, double sensor_dimension_mm) {
    require_positive(focal_length_mm, "focal length");
    require_positive(sensor_dimension_mm, "sensor dimension");
    return 2.0 * std::atan(sensor_dimension_mm / (2.0 * focal_length_mm)) * 180.0 / std::numbers::pi;
}

double altitude_for_gsd(const CameraProfile& camera, double target_gsd_cm_per_px) {
    validate_camera(camera);
    require_positive(target_gsd_cm_per_px, "target GSD");
    return target_gsd_cm_per_px * camera.focal_length_mm * camera.image_width_px
        / (camera.sensor_width_mm * k_cm_per_m);
}

}  // namespace survey_planner
