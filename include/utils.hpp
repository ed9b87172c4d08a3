#pragma once
#include <array>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>

// Wall-clock nanoseconds since the epoch; event timestamps use this.
inline int64_t get_time_now_nano() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * @brief Formats a nanosecond epoch timestamp as "YYYY-MM-DD HH:MM:SS.uuuuuu" (UTC).
 */
inline std::string convert_nanoseconds_to_timestamp(int64_t timestamp) {
    auto time_t = static_cast<std::time_t>(timestamp / 1'000'000'000);
    auto us = (timestamp % 1'000'000'000) / 1000;
    std::tm tm_utc{};
    gmtime_r(&time_t, &tm_utc);
    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(6) << us;
    return ss.str();
}

/**
 * @brief Shortest round-trip decimal representation of a double ("0.5", "42000", "1e-08").
 */
inline std::string format_decimal(double value) {
    std::array<char, 64> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    if (ec != std::errc{}) {
        std::ostringstream ss;
        ss << std::setprecision(17) << value;
        return ss.str();
    }
    return std::string(buf.data(), ptr);
}
