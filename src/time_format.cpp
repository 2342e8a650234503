#include "blobgate/core/time_format.hpp"

#include <cstdio>
#include <ctime>

namespace blobgate {

std::string format_iso8601(TimePoint tp) {
    auto ms = to_epoch_ms(tp);
    time_t secs = static_cast<time_t>(ms / 1000);
    struct tm tm_val;
    gmtime_r(&secs, &tm_val);

    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_val);
    char out[48];
    snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms % 1000));
    return out;
}

std::string format_http_date(TimePoint tp) {
    time_t secs = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_val;
    gmtime_r(&secs, &tm_val);

    char buf[64];
    strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm_val);
    return buf;
}

int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch())
        .count();
}

TimePoint from_epoch_ms(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds(ms)));
}

}  // namespace blobgate
