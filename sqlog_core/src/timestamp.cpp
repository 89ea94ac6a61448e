#include "sqlog/timestamp.hpp"
#include "sqlog/platform.hpp"
#include <cstdio>
#include <ctime>
#include <time.h>

namespace sqlog {

uint64_t wall_clock_now_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL
         + static_cast<uint64_t>(ts.tv_nsec);
}

static void decompose_wall_ns(uint64_t wall_ns, struct tm& tm_out, uint32_t& us_out) {
    time_t sec = static_cast<time_t>(wall_ns / 1'000'000'000ULL);
    us_out = static_cast<uint32_t>((wall_ns % 1'000'000'000ULL) / 1'000ULL);
    localtime_r(&sec, &tm_out);
}

size_t format_iso_timestamp(uint64_t wall_ns, char* buf, size_t buf_size) {
    if (buf_size == 0) return 0;
    struct tm tm_val{};
    uint32_t us;
    decompose_wall_ns(wall_ns, tm_val, us);
    int n = snprintf(buf, buf_size, "%04d-%02d-%02dT%02d:%02d:%02d.%06u",
                     tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                     tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec, us);
    return (n > 0 && static_cast<size_t>(n) < buf_size)
         ? static_cast<size_t>(n) : (buf_size - 1);
}

std::string iso_timestamp(uint64_t wall_ns) {
    char buf[64];
    size_t len = format_iso_timestamp(wall_ns, buf, sizeof(buf));
    return std::string(buf, len);
}

} // namespace sqlog
