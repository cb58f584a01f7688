#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/formatter.h>
#include <spdlog/logger.h>

namespace survey_planner {

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

/** @brief Escape @p text for use inside a JSON string literal. */
std::string json_escape(std::string_view text);

/**
 * @brief Formatter for the rotating file sink: one JSON object per line with
 *        the message escaped into the `msg` field.
 */
std::unique_ptr<spdlog::formatter> make_json_line_formatter();

}  // namespace survey_planner
