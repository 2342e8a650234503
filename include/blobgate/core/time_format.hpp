#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace blobgate {

using TimePoint = std::chrono::system_clock::time_point;

/// "2024-05-01T12:30:00.123Z" (listing envelopes, JSON documents).
std::string format_iso8601(TimePoint tp);

/// "Wed, 01 May 2024 12:30:00 GMT" (Last-Modified and Date headers).
std::string format_http_date(TimePoint tp);

int64_t to_epoch_ms(TimePoint tp);
TimePoint from_epoch_ms(int64_t ms);

}  // namespace blobgate
