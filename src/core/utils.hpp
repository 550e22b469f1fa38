#pragma once

#include <string>
#include <optional>
#include <ctime>

// struct tm (UTC fields) to time_t, the inverse of gmtime.
std::time_t utc_mktime(struct tm* tm);

// Format a UTC time as "YYYY-MM-DD HH:MM:SS UTC".
std::string format_utc(std::time_t t);

// Strict decimal parse: the whole string (after trimming) must be an int.
std::optional<int> parse_int(const std::string& s);

// ASCII lower-case copy.
std::string to_lower(std::string s);

// Case-insensitive ASCII comparison.
bool iequals(const std::string& a, const std::string& b);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
