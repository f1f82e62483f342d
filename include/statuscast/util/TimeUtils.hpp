#pragma once

#include <chrono>
#include <string>

namespace SC {

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.123Z.
auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string;

// from + delay, clamped to time_point::max() instead of overflowing.
auto saturating_deadline(std::chrono::steady_clock::time_point from, std::chrono::milliseconds delay)
    -> std::chrono::steady_clock::time_point;

} // namespace SC
