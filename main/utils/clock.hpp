#ifndef CLOCK_HPP
#define CLOCK_HPP

#include <cstddef>
#include <ctime>

// Wall-clock source for capture timestamps
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::time_t now() const = 0;
};

// time(), kept in UTC by SNTP on the device
class SystemClock : public Clock {
public:
    std::time_t now() const override;
};

namespace TimeFormat {
    // "YYYY-MM-DDTHH:MM:SSZ" (20 chars, UTC, second precision).
    // Returns false if out_size is too small; out is always null-terminated
    // when out_size > 0.
    static constexpr std::size_t ISO8601_LENGTH = 20;
    bool formatIso8601(std::time_t t, char* out, std::size_t out_size);
}

#endif // CLOCK_HPP
