#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

std::string local_username() {
    for (const char* var : {"USER", "LOGNAME"}) {
        const char* value = std::getenv(var);
        if (value && *value) return value;
    }
    return "";
}

std::string format_utc_iso(TimePoint tp) {
    auto t = Clock::to_time_t(tp);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return std::string(buf);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream in(text);
    std::string word;
    while (in >> word) words.push_back(word);
    return words;
}
