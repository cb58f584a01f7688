// === Geodetic Transform ======================================================
//
// Converts between WGS84 geodetic coordinates and Earth-Centred Earth-Fixed
// cartesian vectors. Forward conversion is closed-form; the inverse uses
// Bowring's method refined until the latitude stops moving.

#pragma once

#include "survey_planner/types.hpp"

namespace survey_planner {

namespace wgs84 {
inline constexpr double k_semi_major_axis_m{6'378'137.0};
inline constexpr double k_flattening{1.0 / 298.257223563};
inline constexpr double k_semi_minor_axis_m{k_semi_major_axis_m * (1.0 - k_flattening)};
inline constexpr double k_first_eccentricity_sq{k_flattening * (2.0 - k_flattening)};
inline constexpr double k_second_eccentricity_sq{
    k_first_eccentricity_sq / ((1.0 - k_flattening) * (1.0 - k_flattening))};
}  // namespace wgs84

/**
 * @brief Throw OutOfRange unless @p coordinate has finite components and a
 *        latitude/longitude inside [-90,90] x [-180,180].
 */
void validate_geodetic(const GeodeticCoordinate& coordinate);

/**
 * @brief Convert a geodetic coordinate to ECEF.
 *
 * The altitude is interpreted as height above the ellipsoid regardless of the
 * coordinate's reference tag.
 *
 * @throws PlanningError (OutOfRange) for invalid latitude/longitude.
 */
[[nodiscard]] EcefVector to_ecef(const GeodeticCoordinate& coordinate);

/**
 * @brief Convert an ECEF vector back to geodetic latitude/longitude/height.
 *
 * The result is tagged AltitudeReference::Ellipsoid. Accuracy is well below a
 * millimetre for heights in atmospheric flight range.
 *
 * @throws PlanningError (OutOfRange) for non-finite input.
 */
[[nodiscard]] GeodeticCoordinate to_geodetic(const EcefVector& ecef);

}  // namespace survey_planner
