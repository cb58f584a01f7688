#include "survey_planner/coverage_path_generator.hpp"

#include <cmath>

#include <fmt/format.h>

#include "survey_planner/errors.hpp"

namespace survey_planner {

namespace {

void require_positive(double value, const char* name) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw PlanningError(ErrorKind::InvalidParameter, fmt::format("{} must be positive, got {}", name, value));
    }
}

/**
 * @brief Number of images needed to span @p extent_m when each covers
 *        @p footprint_m and successive images advance by @p spacing_m.
 */
std::size_t images_to_span(double extent_m, double footprint_m, double spacing_m) {
    if (extent_m <= footprint_m) {
        return 1;
    }
    return static_cast<std::size_t>(std::ceil((extent_m - footprint_m) / spacing_m)) + 1;
}

}  // namespace

double resolve_line_spacing(const CoverageParams& params, const CameraProfile& camera) {
    if (params.line_spacing_m.has_value()) {
        require_positive(params.line_spacing_m.value(), "line spacing");
        return params.line_spacing_m.value();
    }
    const Footprint footprint = compute_footprint(camera, params.altitude_agl_m);
    return compute_line_spacing(footprint.width_m, params.overlap_fraction);
}

std::vector<LocalCoord> generate_raster(const CoverageParams& params, const LocalCoord& origin_local) {
    if (params.number_of_lines < 1) {
        throw PlanningError(
            ErrorKind::InvalidParameter,
            fmt::format("number of lines must be at least 1, got {}", params.number_of_lines)
        );
    }
    require_positive(params.pattern_length_m, "pattern length");
    require_positive(params.altitude_agl_m, "altitude AGL");

    if (params.line_spacing_m.has_value()) {
        require_positive(params.line_spacing_m.value(), "line spacing");
    }
    if (params.number_of_lines > 1 && !params.line_spacing_m.has_value()) {
        throw PlanningError(ErrorKind::InvalidParameter, "line spacing must be resolved before generating a raster");
    }
    const double spacing_m = params.line_spacing_m.value_or(0.0);

    const double altitude = origin_local.z + params.altitude_agl_m;
    const bool horizontal = params.orientation == PatternOrientation::Horizontal;

    std::vector<LocalCoord> list_points;
    list_points.reserve(static_cast<std::size_t>(params.number_of_lines) * k_points_per_line);

    for (int line_index = 0; line_index < params.number_of_lines; ++line_index) {
        const double offset = static_cast<double>(line_index) * spacing_m;
        LocalCoord line_start{};
        LocalCoord line_end{};
        if (horizontal) {
            line_start = LocalCoord{origin_local.x, origin_local.y + offset, altitude};
            line_end = LocalCoord{origin_local.x + params.pattern_length_m, origin_local.y + offset, altitude};
        } else {
            line_start = LocalCoord{origin_local.x + offset, origin_local.y, altitude};
            line_end = LocalCoord{origin_local.x + offset, origin_local.y + params.pattern_length_m, altitude};
        }

        const bool reversed = params.snake && (line_index % 2 != 0);
        if (reversed) {
            list_points.push_back(line_end);
            list_points.push_back(line_start);
        } else {
            list_points.push_back(line_start);
            list_points.push_back(line_end);
        }
    }
    return list_points;
}

std::vector<LocalCoord> generate_overlap_grid(const OverlapGridParams& params) {
    require_positive(params.region_width_m, "region width");
    require_positive(params.region_height_m, "region height");

    const OverlapSpacing spacing = compute_overlap_spacing(
        params.camera,
        params.along_track_overlap,
        params.cross_track_overlap,
        params.start.z
    );

    const std::size_t column_count = images_to_span(
        params.region_width_m, spacing.footprint.height_m, spacing.along_track_spacing_m);
    const std::size_t row_count = images_to_span(
        params.region_height_m, spacing.footprint.width_m, spacing.line_spacing_m);

    std::vector<LocalCoord> list_points;
    list_points.reserve(column_count * row_count);
    for (std::size_t row = 0; row < row_count; ++row) {
        const double y = params.start.y + static_cast<double>(row) * spacing.line_spacing_m;
        const bool reversed = params.snake && (row % 2 != 0);
        for (std::size_t step = 0; step < column_count; ++step) {
            const std::size_t column = reversed ? column_count - 1 - step : step;
            const double x = params.start.x + static_cast<double>(column) * spacing.along_track_spacing_m;
            list_points.push_back(LocalCoord{x, y, params.start.z});
        }
    }
    return list_points;
}

}  // namespace survey_planner
