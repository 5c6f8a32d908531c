//===----------------------------------------------------------------------===//
//                         PeerSync
//
// common.cpp
//
//===----------------------------------------------------------------------===//

#include "common.hpp"
#include <ctime>

namespace peersync {

std::string FormatIso8601(WallClock::time_point tp) {
    std::time_t t = WallClock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

} // namespace peersync
