#include <statuscast/util/TimeUtils.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace SC {

namespace {

bool gmtime_utc(std::time_t value, std::tm& out) {
#if defined(_WIN32)
    return gmtime_s(&out, &value) == 0;
#else
    return gmtime_r(&value, &out) != nullptr;
#endif
}

} // namespace

auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
    auto seconds_part = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis       = std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds_part);
    std::time_t raw   = std::chrono::system_clock::to_time_t(seconds_part);
    std::tm tm{};
    if (!gmtime_utc(raw, tm)) {
        return "1970-01-01T00:00:00.000Z";
    }

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setw(3) << std::setfill('0') << millis.count();
    oss << 'Z';
    return oss.str();
}

auto saturating_deadline(std::chrono::steady_clock::time_point from, std::chrono::milliseconds delay)
    -> std::chrono::steady_clock::time_point {
    using time_point = std::chrono::steady_clock::time_point;
    if (delay.count() <= 0) {
        return from + delay;
    }
    auto const headroom = std::chrono::duration_cast<std::chrono::milliseconds>(time_point::max() - from);
    if (delay >= headroom) {
        return time_point::max();
    }
    return from + delay;
}

} // namespace SC
