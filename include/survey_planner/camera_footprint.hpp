// === Camera Footprint ========================================================
//
// Ground-sampling geometry for a nadir camera: GSD, ground footprint and the
// spacing between exposures/flight lines needed to hit a target overlap.
// Assumes flat ground, straight-down pointing and no lens distortion.

#pragma once

#include "survey_planner/types.hpp"

namespace survey_planner {

/**
 * @brief Sensor and lens description of a survey camera.
 */
struct CameraProfile final {
    double sensor_width_mm{};
    double sensor_height_mm{};
    double image_width_px{};
    double image_height_px{};
    double focal_length_mm{};
};

/**
 * @brief Ground coverage of a single image at a given altitude.
 */
struct Footprint final {
    double width_m{};          /**< Ground extent along the image width. */
    double height_m{};         /**< Ground extent along the image height. */
    double gsd_cm_per_px{};    /**< Ground sample distance along the image width. */
};

/**
 * @brief Exposure and line spacing derived from along/cross-track overlap.
 *
 * The image width lies across track (between flight lines) and the image
 * height along track.
 */
struct OverlapSpacing final {
    double along_track_spacing_m{};  /**< Distance between exposures on a line. */
    double line_spacing_m{};         /**< Distance between adjacent flight lines. */
    Footprint footprint{};
};

/**
 * @brief Compute GSD and ground footprint at @p altitude_agl_m.
 *
 * @throws PlanningError (InvalidParameter) for non-positive focal length,
 *         altitude, sensor or image dimensions.
 */
[[nodiscard]] Footprint compute_footprint(const CameraProfile& camera, double altitude_agl_m);

/**
 * @brief Spacing between adjacent images of size @p dimension_m that overlap
 *        by @p overlap_fraction.
 *
 * @throws PlanningError (InvalidParameter) when the dimension is not positive
 *         or the overlap lies outside (0, 1).
 */
[[nodiscard]] double compute_line_spacing(double dimension_m, double overlap_fraction);

[[nodiscard]] OverlapSpacing compute_overlap_spacing(
    const CameraProfile& camera,
    double along_track_overlap,
    double cross_track_overlap,
    double altitude_agl_m
);

/** @brief Full angular field of view in degrees for one sensor dimension. */
[[nodiscard]] double field_of_view_deg(double focal_length_mm, double sensor_dimension_mm);

/** @brief Altitude AGL at which the camera reaches @p target_gsd_cm_per_px. */
[[nodiscard]] double altitude_for_gsd(const CameraProfile& camera, double target_gsd_cm_per_px);

}  // namespace survey_planner
