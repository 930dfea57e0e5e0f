#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string to_upper(std::string str);

// Time utilities, all UTC
std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string);
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);
std::string current_iso8601();

// Days since the epoch for the UTC calendar date of tp
std::int64_t utc_day_index(const std::chrono::system_clock::time_point& tp);

// Minutes elapsed since UTC midnight
int minutes_of_day(const std::chrono::system_clock::time_point& tp);

std::int64_t to_epoch_ms(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms);

} // namespace util
