#include "core/time_util.hpp"
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace sdb {

std::string to_iso8601(Timestamp t) {
    auto time = Clock::to_time_t(t);
    std::tm tm_utc{};
#ifdef _WIN32
    gmtime_s(&tm_utc, &time);
#else
    gmtime_r(&time, &tm_utc);
#endif
    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

Timestamp from_iso8601(const std::string& text) {
    std::tm tm_utc{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("Malformed ISO-8601 timestamp: " + text);
    }

#ifdef _WIN32
    std::time_t time = _mkgmtime(&tm_utc);
#else
    std::time_t time = timegm(&tm_utc);
#endif
    return Clock::from_time_t(time);
}

long days_between(Timestamp from, Timestamp to) {
    auto hours = std::chrono::duration_cast<std::chrono::hours>(to - from).count();
    return static_cast<long>(hours / 24);
}

std::string random_hex(size_t length) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char digits[] = "0123456789abcdef";

    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        out += digits[dist(rng)];
    }
    return out;
}

} // namespace sdb
