#include "blobgate/transfer/byte_range.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string_view>

namespace blobgate::transfer {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// Parse an unsigned decimal occupying the whole view
std::optional<uint64_t> parse_u64(std::string_view s) {
    if (s.empty()) return std::nullopt;
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

RangeRequest malformed(std::string message) {
    RangeRequest req;
    req.status = RangeStatus::Malformed;
    req.error_message = std::move(message);
    return req;
}

RangeRequest unsatisfiable(uint64_t size) {
    RangeRequest req;
    req.status = RangeStatus::Unsatisfiable;
    req.error_message = "range not satisfiable for object of " + std::to_string(size) + " bytes";
    return req;
}

}  // namespace

RangeRequest resolve_range(const std::string& header, uint64_t size) {
    std::string_view value = trim(header);
    if (value.empty()) return {};

    constexpr std::string_view unit = "bytes=";
    if (value.size() < unit.size()) return malformed("range unit must be bytes");
    for (size_t i = 0; i < unit.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(value[i])) != unit[i]) {
            return malformed("range unit must be bytes");
        }
    }
    value = trim(value.substr(unit.size()));
    if (value.find(',') != std::string_view::npos) {
        return malformed("multiple ranges are not supported");
    }

    auto dash = value.find('-');
    if (dash == std::string_view::npos) return malformed("invalid range");

    auto first = trim(value.substr(0, dash));
    auto last = trim(value.substr(dash + 1));

    RangeRequest req;
    if (first.empty()) {
        // Suffix form: last n bytes
        auto n = parse_u64(last);
        if (!n) return malformed("invalid suffix range");
        if (*n == 0 || size == 0) return unsatisfiable(size);
        req.range.start = *n >= size ? 0 : size - *n;
        req.range.end = size - 1;
        req.status = RangeStatus::Satisfiable;
        return req;
    }

    auto start = parse_u64(first);
    if (!start) return malformed("invalid range start");

    std::optional<uint64_t> end;
    if (!last.empty()) {
        end = parse_u64(last);
        if (!end) return malformed("invalid range end");
        if (*end < *start) return malformed("range start exceeds range end");
    }

    if (*start >= size) return unsatisfiable(size);
    // An explicit window must lie inside the object; only the open form runs to the end
    if (end && *end >= size) return unsatisfiable(size);

    req.range.start = *start;
    req.range.end = end ? *end : size - 1;
    req.status = RangeStatus::Satisfiable;
    return req;
}

std::string format_content_range(const ByteRange& range, uint64_t total) {
    return "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end) + "/" +
           std::to_string(total);
}

std::string format_unsatisfied_range(uint64_t total) {
    return "bytes */" + std::to_string(total);
}

std::string open_range_header(uint64_t start) {
    return "bytes=" + std::to_string(start) + "-";
}

std::string closed_range_header(uint64_t start, uint64_t end) {
    return "bytes=" + std::to_string(start) + "-" + std::to_string(end);
}

std::optional<ContentRange> parse_content_range(const std::string& header) {
    std::string_view value = trim(header);
    constexpr std::string_view unit = "bytes ";
    if (!value.starts_with(unit)) return std::nullopt;
    value = trim(value.substr(unit.size()));

    auto dash = value.find('-');
    auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || slash < dash) {
        return std::nullopt;
    }

    auto start = parse_u64(trim(value.substr(0, dash)));
    auto end = parse_u64(trim(value.substr(dash + 1, slash - dash - 1)));
    if (!start || !end || *end < *start) return std::nullopt;

    ContentRange result;
    result.range = {*start, *end};
    auto total = trim(value.substr(slash + 1));
    if (total != "*") {
        result.total = parse_u64(total);
        if (!result.total) return std::nullopt;
    }
    return result;
}

}  // namespace blobgate::transfer
