#include "survey_planner/errors.hpp"

namespace survey_planner {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::OutOfRange:
            return "out_of_range";
        case ErrorKind::InvalidParameter:
            return "invalid_parameter";
        case ErrorKind::MissingPrecondition:
            return "missing_precondition";
        case ErrorKind::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

PlanningError::PlanningError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message),
      kind_(kind) {}

ErrorKind PlanningError::kind() const noexcept {
    return kind_;
}

}  // namespace survey_planner
