#include "blobgate/facade/wire.hpp"

namespace blobgate::facade {

WireRequest WireRequest::from_target(const std::string& method, const std::string& target) {
    WireRequest req;
    req.method = method;

    auto qpos = target.find('?');
    req.path = net::url_decode(target.substr(0, qpos));
    if (req.path.empty()) req.path = "/";

    if (qpos != std::string::npos) {
        std::string query = target.substr(qpos + 1);
        size_t start = 0;
        while (start <= query.size()) {
            size_t amp = query.find('&', start);
            if (amp == std::string::npos) amp = query.size();
            std::string pair = query.substr(start, amp - start);
            if (!pair.empty()) {
                auto eq = pair.find('=');
                std::string name = net::url_decode(pair.substr(0, eq), true);
                std::string value =
                    eq == std::string::npos ? "" : net::url_decode(pair.substr(eq + 1), true);
                req.query[name] = value;
            }
            start = amp + 1;
        }
    }
    return req;
}

std::optional<std::string> WireRequest::query_value(const std::string& name) const {
    auto it = query.find(name);
    if (it == query.end()) return std::nullopt;
    return it->second;
}

bool WireRequest::has_query(const std::string& name) const {
    return query.count(name) > 0;
}

void WireResponse::set_text(const std::string& text, const std::string& content_type) {
    body.assign(text.begin(), text.end());
    headers.set("Content-Type", content_type);
}

}  // namespace blobgate::facade
