#pragma once

#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cstdint>

namespace omnitrack::domain {

/**
 * @brief Момент времени с точностью до миллисекунд
 *
 * В БД хранится как Unix millis (BIGINT), в JSON выводится
 * как ISO 8601 UTC с миллисекундами: "2025-03-01T10:15:30.250Z".
 */
struct Timestamp {
    using Clock = std::chrono::system_clock;

    Clock::time_point value;

    Timestamp() : value(Clock::now()) {}

    explicit Timestamp(Clock::time_point tp) : value(tp) {}

    static Timestamp now() { return Timestamp(); }

    static Timestamp fromUnixMillis(int64_t millis) {
        return Timestamp(Clock::time_point(std::chrono::milliseconds(millis)));
    }

    static Timestamp fromUnixSeconds(int64_t seconds) {
        return fromUnixMillis(seconds * 1000);
    }

    int64_t toUnixMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
    }

    std::string toString() const {
        int64_t millis = toUnixMillis();
        std::time_t seconds = static_cast<std::time_t>(millis / 1000);
        std::tm utc = *std::gmtime(&seconds);

        std::ostringstream out;
        out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setw(3) << std::setfill('0') << (millis % 1000) << 'Z';
        return out.str();
    }

    Timestamp addHours(int64_t hours) const {
        return Timestamp(value + std::chrono::hours(hours));
    }

    Timestamp addDays(int64_t days) const {
        return addHours(24 * days);
    }

    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
};

} // namespace omnitrack::domain
