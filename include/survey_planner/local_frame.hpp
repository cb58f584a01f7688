// === Local Tangent Frame =====================================================
//
// East-North-Up frame anchored at a mission's geodetic origin. `LocalFrame`
// caches the origin's ECEF position and ECEF->ENU rotation so bulk waypoint
// conversion does not repeat the trigonometry; the free functions are
// one-shot conveniences that build a frame per call.

#pragma once

#include <array>

#include "survey_planner/types.hpp"

namespace survey_planner {

/** @brief Row-major 3x3 rotation matrix. */
using RotationMatrix = std::array<std::array<double, 3>, 3>;

/**
 * @brief Immutable ENU frame bound to a single LocalOrigin.
 */
class LocalFrame final {
  public:
    /**
     * @brief Build the frame for @p origin.
     *
     * @throws PlanningError (OutOfRange) when the origin is not a valid
     *         geodetic coordinate.
     */
    explicit LocalFrame(const LocalOrigin& origin);

    [[nodiscard]] const LocalOrigin& origin() const noexcept;
    [[nodiscard]] const EcefVector& origin_ecef() const noexcept;
    /** @brief Rows are the East, North and Up unit vectors in ECEF. */
    [[nodiscard]] const RotationMatrix& rotation() const noexcept;

    /** @brief R * (point - origin). Rejects non-finite input with OutOfRange. */
    [[nodiscard]] LocalCoord to_local(const EcefVector& point) const;
    /** @brief R^T * local + origin. Rejects non-finite input with OutOfRange. */
    [[nodiscard]] EcefVector to_ecef(const LocalCoord& local) const;

    [[nodiscard]] LocalCoord geodetic_to_local(const GeodeticCoordinate& coordinate) const;
    [[nodiscard]] GeodeticCoordinate local_to_geodetic(const LocalCoord& local) const;

  private:
    LocalOrigin origin_;
    EcefVector origin_ecef_;
    RotationMatrix rotation_;
};

[[nodiscard]] LocalCoord to_local(const EcefVector& point, const LocalOrigin& origin);
[[nodiscard]] EcefVector to_ecef(const LocalCoord& local, const LocalOrigin& origin);
[[nodiscard]] LocalCoord geodetic_to_local(const GeodeticCoordinate& coordinate, const LocalOrigin& origin);
[[nodiscard]] GeodeticCoordinate local_to_geodetic(const LocalCoord& local, const LocalOrigin& origin);

/** @brief Euclidean distance between two local coordinates. */
[[nodiscard]] double local_distance_m(const LocalCoord& from, const LocalCoord& to) noexcept;

}  // namespace survey_planner
