#pragma once

#include <string>
#include <vector>
#include <ctime>
#include "types.hpp"

// Name of the local user ($USER, then $LOGNAME). Returns "" if neither is set.
std::string local_username();

// ISO 8601 UTC timestamp (YYYY-MM-DDTHH:MM:SSZ) for a time point.
std::string format_utc_iso(TimePoint tp);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

std::string to_lower(std::string s);

// Split on newlines, trimming each line and dropping blank ones.
std::vector<std::string> split_lines(const std::string& text);

// Split on runs of whitespace.
std::vector<std::string> split_words(const std::string& text);
