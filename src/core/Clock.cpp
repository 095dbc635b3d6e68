#include "bastion/core/Clock.hpp"

#include <ctime>
#include <cstdio>

namespace bastion {

std::string toIso8601(WallTime t) {
    const uint64_t ms = to_ms(t);
    const std::time_t secs = static_cast<std::time_t>(ms / 1000);

    std::tm utc{};
    gmtime_r(&secs, &utc);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec,
                  static_cast<unsigned>(ms % 1000));
    return std::string(buf);
}

} // namespace bastion
