#pragma once

#include "blobgate/net/http.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace blobgate::facade {

/// Transport-neutral form of one HTTP request, as the server decoded it.
struct WireRequest {
    std::string method;                         // Upper-case verb
    std::string path;                           // Percent-decoded
    std::map<std::string, std::string> query;   // Percent-decoded
    net::HttpHeaders headers;
    std::vector<uint8_t> body;

    // Split "path?query" and decode both parts
    static WireRequest from_target(const std::string& method, const std::string& target);

    std::optional<std::string> query_value(const std::string& name) const;
    bool has_query(const std::string& name) const;
};

struct WireResponse {
    int status = 200;
    net::HttpHeaders headers;
    std::vector<uint8_t> body;

    // HEAD answer: no body is sent, Content-Length describes the object
    bool head_only = false;

    // Protocol family label for metrics ("s3", "azure", ...)
    std::string protocol;

    void set_text(const std::string& text, const std::string& content_type);
};

}  // namespace blobgate::facade
