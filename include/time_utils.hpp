#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Get the current local wall clock as HH:MM:SS.mmm for console lines.
 */
std::string clock_time();

/**
 * @brief Format a duration as a short string like 1h2m3s or 250ms.
 *
 * Durations under one second are printed in milliseconds.
 */
std::string format_duration_short(std::chrono::milliseconds dur);

#endif // TIME_UTILS_HPP
