// === Planning Errors =========================================================
//
// Single exception type raised by the planner core. The ErrorKind tells
// callers which class of failure occurred without parsing the message.

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace survey_planner {

/**
 * @brief Categories of failure surfaced by the planner core.
 */
enum class ErrorKind {
    OutOfRange,           /**< Geodetic component outside its valid domain. */
    InvalidParameter,     /**< Non-positive dimension, overlap outside (0,1), zero line count. */
    MissingPrecondition,  /**< Absent origin/takeoff, empty pattern, unknown segment. */
    Cancelled             /**< Cooperative cancellation of a chunked operation. */
};

/** @brief Stable lower-case name of @p kind for logs. */
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/**
 * @brief Exception carrying an ErrorKind alongside the diagnostic message.
 */
class PlanningError final : public std::runtime_error {
  public:
    PlanningError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept;

  private:
    ErrorKind kind_;
};

}  // namespace survey_planner
