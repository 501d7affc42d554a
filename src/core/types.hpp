#pragma once

#include <string>
#include <chrono>
#include <array>
#include <cstdint>
#include <compare>
#include <optional>
#include <sstream>
#include <iomanip>

namespace vellum {

/**
 * UUID - 128-bit identifier used for note ids.
 *
 * Notes carry their id as a string so ids minted by other clients need not
 * be UUIDs; locally created notes get a random version 4 UUID.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}

    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Random (version 4) UUID.
     */
    [[nodiscard]] static Uuid generate();

    /**
     * xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase.
     */
    [[nodiscard]] std::string to_string() const {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (size_t i = 0; i < BYTE_SIZE; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                oss << '-';
            }
            oss << std::setw(2) << static_cast<int>(bytes_[i]);
        }
        return oss.str();
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

/**
 * Timestamp - milliseconds since the Unix epoch.
 *
 * Travels in plaintext on envelopes and is the primary merge key, so it
 * must round-trip exactly through SQLite, JSON and the wire format.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    explicit Timestamp(TimePoint tp) noexcept
        : millis_(std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(Duration(millis_));
    }

    /**
     * ISO 8601, UTC, millisecond precision.
     */
    [[nodiscard]] std::string to_iso_string() const {
        auto time_t = Clock::to_time_t(to_time_point());
        std::tm tm{};
        gmtime_r(&time_t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        auto ms = millis_ % 1000;
        oss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const {
        return Timestamp(millis_ + d.count());
    }

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

/**
 * The integer a JSON number holds, if it is integral and fits in int64.
 */
[[nodiscard]] inline std::optional<int64_t> exact_int64(double value) noexcept {
    // 2^63 is exact as a double; the comparison also rejects NaN.
    constexpr double limit = 9223372036854775808.0;
    if (!(value >= -limit && value < limit)) {
        return std::nullopt;
    }
    const auto i = static_cast<int64_t>(value);
    if (static_cast<double>(i) != value) {
        return std::nullopt;
    }
    return i;
}

} // namespace vellum
