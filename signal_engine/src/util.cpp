#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace util {

namespace {
    constexpr std::int64_t kMsPerDay = 24LL * 60 * 60 * 1000;

    std::int64_t floor_div(std::int64_t a, std::int64_t b) {
        std::int64_t q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) {
            --q;
        }
        return q;
    }
}

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string) {
    std::tm tm = {};
    std::istringstream ss(iso_string);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

    if (ss.fail()) {
        throw std::runtime_error("Failed to parse ISO8601 timestamp: " + iso_string);
    }

    // Optional fractional seconds
    long long millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        int digits = 0;
        while (std::isdigit(ss.peek())) {
            char c = static_cast<char>(ss.get());
            if (digits < 3) {
                millis = millis * 10 + (c - '0');
            }
            ++digits;
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }

    std::string rest;
    ss >> rest;
    if (!rest.empty() && rest != "Z" && rest != "+00:00") {
        throw std::runtime_error("Only UTC timestamps are accepted: " + iso_string);
    }

    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
    return tp + std::chrono::milliseconds(millis);
}

std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch() % std::chrono::seconds(1)).count();

    std::tm tm = {};
    gmtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';

    return ss.str();
}

std::string current_iso8601() {
    return format_timestamp(std::chrono::system_clock::now());
}

std::int64_t utc_day_index(const std::chrono::system_clock::time_point& tp) {
    return floor_div(to_epoch_ms(tp), kMsPerDay);
}

int minutes_of_day(const std::chrono::system_clock::time_point& tp) {
    std::int64_t ms = to_epoch_ms(tp) - utc_day_index(tp) * kMsPerDay;
    return static_cast<int>(ms / 60000);
}

std::int64_t to_epoch_ms(const std::chrono::system_clock::time_point& tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace util
