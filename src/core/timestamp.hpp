#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace quid {

/**
 * Timestamp - Milliseconds since the Unix epoch, the resolution embedded
 * in the leading 48 bits of a version 7 UUID.
 */
class Timestamp {
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, std::chrono::milliseconds>;

    constexpr Timestamp() noexcept = default;
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    // Wall clock, truncated (not rounded) to the millisecond.
    [[nodiscard]] static Timestamp now() {
        const auto tp = std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
        return Timestamp(tp.time_since_epoch().count());
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(std::chrono::milliseconds(millis_));
    }

    // UTC, e.g. 2024-05-01T12:30:00.123Z
    [[nodiscard]] std::string to_iso_string() const {
        const auto seconds = std::chrono::floor<std::chrono::seconds>(to_time_point());
        const auto fraction = (to_time_point() - seconds).count();
        const std::time_t whole = Clock::to_time_t(seconds);

        std::tm utc{};
        gmtime_r(&whole, &utc);

        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << fraction << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;

private:
    int64_t millis_{0};
};

} // namespace quid
