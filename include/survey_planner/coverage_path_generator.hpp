// === Coverage Path Generator =================================================
//
// Builds lawn-mower raster patterns and overlap grids in the mission's local
// ENU frame. The order of the returned points is the flight order; consumers
// must not re-sort them.

#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "survey_planner/camera_footprint.hpp"
#include "survey_planner/types.hpp"

namespace survey_planner {

/**
 * @brief Primary axis the raster lines run along.
 */
enum class PatternOrientation {
    Horizontal,  /**< Lines run east, stepping north between lines. */
    Vertical     /**< Lines run north, stepping east between lines. */
};

/**
 * @brief Parameters describing a raster scan.
 *
 * When `line_spacing_m` is empty the spacing is derived from the camera
 * footprint and `overlap_fraction` by resolve_line_spacing().
 */
struct CoverageParams final {
    double altitude_agl_m{};
    double overlap_fraction{};
    PatternOrientation orientation{PatternOrientation::Horizontal};
    bool snake{true};
    double pattern_length_m{};
    std::optional<double> line_spacing_m{};
    int number_of_lines{1};
    LocalCoord start_offset{};  /**< Start of the first line relative to the takeoff point. */
};

/**
 * @brief Region-coverage request for an image-centre grid.
 */
struct OverlapGridParams final {
    LocalCoord start{};           /**< Centre of the first image; z is the flight altitude AGL. */
    double region_width_m{};      /**< Extent along east. */
    double region_height_m{};     /**< Extent along north. */
    CameraProfile camera{};
    double along_track_overlap{};
    double cross_track_overlap{};
    bool snake{true};
};

/**
 * @brief Return the explicit spacing override or derive it from the camera
 *        footprint width at the pattern altitude.
 */
[[nodiscard]] double resolve_line_spacing(const CoverageParams& params, const CameraProfile& camera);

/**
 * @brief Generate a raster of `number_of_lines` lines, two endpoints each.
 *
 * Points sit at origin_local.z + altitude_agl_m. With `snake` every odd line
 * is flown in reverse so consecutive lines join end to end; without it every
 * line starts on the same side.
 *
 * @throws PlanningError (InvalidParameter) for a non-positive length or
 *         altitude, fewer than one line, a missing spacing with more than one
 *         line, or a non-positive spacing whenever one is given.
 */
[[nodiscard]] std::vector<LocalCoord> generate_raster(const CoverageParams& params, const LocalCoord& origin_local);

/** @brief Number of endpoints generate_raster emits per line. */
inline constexpr std::size_t k_points_per_line{2};

/**
 * @brief Generate image-centre waypoints covering a rectangular region.
 *
 * Rows step north by the cross-track spacing, columns step east by the
 * along-track spacing.
 */
[[nodiscard]] std::vector<LocalCoord> generate_overlap_grid(const OverlapGridParams& params);

}  // namespace survey_planner
