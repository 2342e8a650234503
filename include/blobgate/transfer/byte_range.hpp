#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace blobgate::transfer {

// Inclusive byte window [start, end]
struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;

    uint64_t length() const { return end - start + 1; }
};

enum class RangeStatus {
    Absent,          // No Range header: serve the whole object
    Satisfiable,     // Serve range (206)
    Unsatisfiable,   // Start outside the object (416)
    Malformed        // Syntax error, a > b or multiple ranges (400)
};

struct RangeRequest {
    RangeStatus status = RangeStatus::Absent;
    ByteRange range;
    std::string error_message;
};

/// Resolve a Range header value against an object of `size` bytes.
///
/// Accepts "bytes=a-b", "bytes=a-" and the suffix form "bytes=-n". An end
/// past the object is clamped to size-1. Multi-range requests are Malformed.
RangeRequest resolve_range(const std::string& header, uint64_t size);

// "bytes start-end/total"
std::string format_content_range(const ByteRange& range, uint64_t total);

// "bytes */total" (416 responses)
std::string format_unsatisfied_range(uint64_t total);

// Request header values: "bytes=start-" and "bytes=start-end"
std::string open_range_header(uint64_t start);
std::string closed_range_header(uint64_t start, uint64_t end);

struct ContentRange {
    ByteRange range;
    std::optional<uint64_t> total;  // nullopt for "/*"
};

/// Parse a Content-Range response header ("bytes a-b/total").
std::optional<ContentRange> parse_content_range(const std::string& header);

}  // namespace blobgate::transfer
