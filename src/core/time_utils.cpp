#include "time_utils.hpp"
#include <fmt/format.h>
#include <chrono>

std::string format_duration(int64_t seconds) {
    if (seconds < 0) seconds = 0;
    int64_t hours = seconds / 3600;
    int64_t mins = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_age(const std::optional<TimePoint>& then, TimePoint now) {
    if (!then) return "-";
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(now - *then).count();
    return format_duration(secs);
}
