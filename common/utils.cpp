#include "utils.H"

#include <ctime>

namespace kestrel {

    uint64_t nanotime() {
        struct timespec ts;
        clock_gettime(CLOCK_MONOTONIC_RAW, &ts);
        return static_cast<uint64_t>(ts.tv_sec) * 1000000000ULL + ts.tv_nsec;
    }

    uint64_t epoch_nanos() {
        struct timespec ts;
        clock_gettime(CLOCK_REALTIME, &ts);
        return static_cast<uint64_t>(ts.tv_sec) * 1000000000ULL + ts.tv_nsec;
    }

    uint64_t epoch_millis() {
        return epoch_nanos() / 1000000ULL;
    }

} // namespace kestrel
