#ifndef MALLCAD_MALL_UTIL_H
#define MALLCAD_MALL_UTIL_H

#include <chrono>
#include <cstdint>

namespace mall {

// Wall-clock milliseconds since the Unix epoch, used for project timestamps.
inline std::int64_t nowEpochMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace mall

#endif // MALLCAD_MALL_UTIL_H
