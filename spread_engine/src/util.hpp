#pragma once

#include <chrono>
#include <optional>
#include <string>

// Format a time_point as a calendar date (YYYY-MM-DD, UTC)
std::string format_date(const std::chrono::system_clock::time_point& tp);

// Parse "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS[.fff][Z]" as UTC
std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& iso_string);

// Whole days from `from` to `to`, rounded up (negative once `to` has passed)
int days_until(const std::chrono::system_clock::time_point& to,
               const std::chrono::system_clock::time_point& from);

// Guards for ratios that feed a score
bool is_finite_positive(double value);
double safe_ratio(double numerator, double denominator, double fallback = 0.0);
