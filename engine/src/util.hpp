#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);

// Lower-case, drop '.', punctuation to spaces, drop club tokens (fc, afc, cf, sc), collapse whitespace
std::string normalize_team_name(const std::string& name);

// Time utilities
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string);
std::string format_utc_date(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point utc_day_start(const std::chrono::system_clock::time_point& tp);

// Random utilities
std::string generate_uuid();

} // namespace util
