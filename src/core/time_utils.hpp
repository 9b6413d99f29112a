#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "types.hpp"

// Format a span of seconds as "2h35m", "14m22s", "8s". Negative spans
// are clamped to zero.
std::string format_duration(int64_t seconds);

// How long ago `then` was, relative to `now`. "-" when unset.
std::string format_age(const std::optional<TimePoint>& then, TimePoint now = Clock::now());
