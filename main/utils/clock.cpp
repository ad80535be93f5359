#include <main/utils/clock.hpp>
#include <time.h>

std::time_t SystemClock::now() const {
    return std::time(nullptr);
}

namespace TimeFormat {
    bool formatIso8601(std::time_t t, char* out, std::size_t out_size) {
        if (out_size == 0) {
            return false;
        }
        out[0] = '\0';
        if (out_size < ISO8601_LENGTH + 1) {
            return false;
        }
        struct tm tm_utc;
        if (gmtime_r(&t, &tm_utc) == nullptr) {
            return false;
        }
        return strftime(out, out_size, "%Y-%m-%dT%H:%M:%SZ", &tm_utc) == ISO8601_LENGTH;
    }
}
