#include "blobgate/facade/protocol_facade.hpp"
#include "blobgate/facade/compression.hpp"
#include "blobgate/core/constants.hpp"
#include "blobgate/core/log.hpp"
#include "blobgate/core/time_format.hpp"
#include "blobgate/transfer/byte_range.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <chrono>

namespace blobgate::facade {

using json = nlohmann::json;

namespace {

constexpr const char* CORS_METHODS = "GET, PUT, POST, DELETE, HEAD, OPTIONS, PROPFIND, MKCOL";
constexpr const char* CORS_HEADERS =
    "Content-Type, Authorization, Range, Depth, x-amz-date, x-amz-content-sha256, x-ms-range";
constexpr const char* CORS_EXPOSE = "ETag, Content-Length, Content-Range, Accept-Ranges";
constexpr const char* DAV_ALLOW = "OPTIONS, GET, HEAD, PUT, DELETE, PROPFIND, MKCOL";

std::string resource_of(const Route& route) {
    std::string resource = "/" + route.bucket;
    if (!route.key.empty()) resource += "/" + route.key;
    return resource;
}

std::optional<uint32_t> parse_count(const std::string& value) {
    uint32_t n = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
    if (ec != std::errc() || ptr != value.data() + value.size()) return std::nullopt;
    return n;
}

void set_object_headers(WireResponse& res, Protocol protocol, const ObjectMetadata& meta) {
    res.headers.set("Content-Type", meta.content_type);
    res.headers.set("ETag", quoted_etag(meta.fingerprint));
    res.headers.set("Last-Modified", format_http_date(meta.last_modified));
    res.headers.set("Accept-Ranges", "bytes");
    if (protocol == Protocol::Azure) {
        res.headers.set("x-ms-blob-type", "BlockBlob");
        res.headers.set("x-ms-creation-time", format_http_date(meta.created));
    } else if (protocol == Protocol::Gcs) {
        res.headers.set("x-goog-stored-content-length", std::to_string(meta.size));
    }
}

WireResponse empty_response(int status) {
    WireResponse res;
    res.status = status;
    return res;
}

}  // namespace

void apply_cors_headers(net::HttpHeaders& headers) {
    headers.set("Access-Control-Allow-Origin", "*");
    headers.set("Access-Control-Allow-Methods", CORS_METHODS);
    headers.set("Access-Control-Allow-Headers", CORS_HEADERS);
    headers.set("Access-Control-Expose-Headers", CORS_EXPOSE);
}

ProtocolFacade::ProtocolFacade(ContentStore& store, FacadeOptions options)
    : store_(store), options_(std::move(options)) {}

Route ProtocolFacade::route(const WireRequest& request) const {
    return resolve_route(request.method, request.path);
}

WireResponse ProtocolFacade::handle(const WireRequest& request) const {
    Route r = route(request);

    WireResponse res;
    try {
        res = dispatch(r, request);
    } catch (const std::exception& e) {
        log_error("%s %s failed: %s", request.method.c_str(), operation_name(r.operation),
                  e.what());
        res = error(r, ErrorCode::StorageIO, false, "internal error");
    }

    res.protocol = protocol_name(r.protocol);
    apply_cors_headers(res.headers);
    if (request.method == "HEAD") {
        res.head_only = true;
    }
    return res;
}

WireResponse ProtocolFacade::dispatch(const Route& route, const WireRequest& request) const {
    switch (route.operation) {
        case Operation::ListBuckets: return list_buckets(route);
        case Operation::CreateBucket: return create_bucket(route, request);
        case Operation::DeleteBucket: return delete_bucket(route);
        case Operation::HeadBucket: return head_bucket(route);
        case Operation::GetBucket: return get_bucket(route);
        case Operation::ListObjects: return list_objects(route, request);
        case Operation::GetObject: return get_object(route, request);
        case Operation::HeadObject: return head_object(route);
        case Operation::PutObject: return put_object(route, request, route.key);
        case Operation::DeleteObject: return delete_object(route);
        case Operation::UploadMedia: {
            auto upload_type = request.query_value("uploadType");
            if (upload_type && *upload_type != "media") {
                return error(route, ErrorCode::BadRequest, false,
                             "only uploadType=media is supported");
            }
            auto name = request.query_value("name");
            if (!name || name->empty()) {
                return error(route, ErrorCode::BadRequest, false, "missing object name");
            }
            return put_object(route, request, *name);
        }
        case Operation::Propfind: return propfind(route, request);
        case Operation::Mkcol: return mkcol(route);
        case Operation::DavOptions: return dav_options();
        case Operation::Preflight: return empty_response(200);
        case Operation::Health: return health();
        case Operation::NotAllowed:
            return error(route, 405, "MethodNotAllowed",
                         request.method + " is not allowed on this resource");
        case Operation::NotRouted:
            return error(route, 404, "NotFound", "no such resource");
    }
    return error(route, 404, "NotFound", "no such resource");
}

// ============================================================================
// Buckets
// ============================================================================

WireResponse ProtocolFacade::list_buckets(const Route& route) const {
    auto result = store_.list_buckets();
    if (!result.success) {
        return error(route, result.error, true, result.error_message);
    }
    const auto& encoder = encoder_for(route.protocol);
    WireResponse res;
    res.set_text(encoder.encode_buckets(result.buckets), encoder.content_type());
    return res;
}

WireResponse ProtocolFacade::create_bucket(const Route& route, const WireRequest& request) const {
    std::string bucket = route.bucket;
    if (route.protocol == Protocol::Gcs) {
        auto doc = json::parse(request.body.begin(), request.body.end(), nullptr, false);
        if (doc.is_discarded() || !doc.is_object() || !doc.contains("name") ||
            !doc["name"].is_string()) {
            return error(route, ErrorCode::BadRequest, true, "bucket resource needs a name");
        }
        bucket = doc["name"].get<std::string>();
    }

    auto result = store_.create_bucket(bucket);
    if (!result.success) {
        return error(route, result.error, true, result.error_message);
    }
    log_debug("Bucket %s %s", bucket.c_str(), result.created ? "created" : "already exists");

    if (route.protocol == Protocol::Gcs) {
        const auto& encoder = encoder_for(route.protocol);
        WireResponse res;
        res.set_text(encoder.encode_bucket(result.bucket), encoder.content_type());
        return res;
    }
    return empty_response(204);
}

WireResponse ProtocolFacade::delete_bucket(const Route& route) const {
    auto result = store_.delete_bucket(route.bucket);
    if (!result.success) {
        return error(route, result.error, true, result.error_message);
    }
    if (result.removed) {
        log_info("Deleted bucket %s", route.bucket.c_str());
    }
    auto res = empty_response(204);
    res.headers.set("x-blobgate-removed", result.removed ? "true" : "false");
    return res;
}

WireResponse ProtocolFacade::head_bucket(const Route& route) const {
    if (!store_.bucket_info(route.bucket)) {
        return error(route, ErrorCode::NotFound, true, "bucket not found");
    }
    return empty_response(200);
}

WireResponse ProtocolFacade::get_bucket(const Route& route) const {
    auto info = store_.bucket_info(route.bucket);
    if (!info) {
        return error(route, ErrorCode::NotFound, true, "bucket not found");
    }
    const auto& encoder = encoder_for(route.protocol);
    WireResponse res;
    res.set_text(encoder.encode_bucket(*info), encoder.content_type());
    return res;
}

WireResponse ProtocolFacade::list_objects(const Route& route, const WireRequest& request) const {
    const char* max_name = "max-keys";
    const char* marker_name = "marker";
    if (route.protocol == Protocol::Azure) {
        max_name = "maxresults";
    } else if (route.protocol == Protocol::Gcs) {
        max_name = "maxResults";
        marker_name = "pageToken";
    }

    ListingContext ctx;
    ctx.bucket = route.bucket;
    ctx.options.prefix = request.query_value("prefix").value_or("");
    ctx.options.delimiter = request.query_value("delimiter").value_or("");
    ctx.options.start_after = request.query_value(marker_name)
                                  .value_or(request.query_value("start-after").value_or(""));
    ctx.options.max_keys = constants::DEFAULT_MAX_KEYS;
    if (auto max = request.query_value(max_name)) {
        auto n = parse_count(*max);
        if (!n) {
            return error(route, ErrorCode::BadRequest, true, std::string("invalid ") + max_name);
        }
        if (*n > 0 && *n < constants::DEFAULT_MAX_KEYS) ctx.options.max_keys = *n;
    }

    auto result = store_.list(route.bucket, ctx.options);
    if (!result.success) {
        return error(route, result.error, true, result.error_message);
    }

    const auto& encoder = encoder_for(route.protocol);
    WireResponse res;
    res.set_text(encoder.encode_listing(ctx, result), encoder.content_type());
    return res;
}

// ============================================================================
// Objects
// ============================================================================

WireResponse ProtocolFacade::get_object(const Route& route, const WireRequest& request) const {
    // GCS answers the metadata resource unless the media is asked for
    if (route.protocol == Protocol::Gcs && request.query_value("alt").value_or("json") != "media") {
        auto head = store_.head(route.bucket, route.key);
        if (!head.success) {
            return error(route, head.error, false, head.error_message);
        }
        const auto& encoder = encoder_for(route.protocol);
        WireResponse res;
        res.set_text(encoder.encode_object(head.metadata), encoder.content_type());
        return res;
    }

    auto opened = store_.open(route.bucket, route.key);
    if (!opened.success) {
        return error(route, opened.error, false, opened.error_message);
    }
    const auto& meta = opened.reader->metadata();

    std::optional<std::string> range_header;
    if (route.protocol == Protocol::Azure) {
        range_header = request.headers.get("x-ms-range");
    }
    if (!range_header) {
        range_header = request.headers.get("Range");
    }

    WireResponse res;
    set_object_headers(res, route.protocol, meta);

    if (range_header) {
        auto range = transfer::resolve_range(*range_header, meta.size);
        switch (range.status) {
            case transfer::RangeStatus::Malformed:
                return error(route, ErrorCode::BadRequest, false, range.error_message);
            case transfer::RangeStatus::Unsatisfiable: {
                auto err = error(route, ErrorCode::RangeNotSatisfiable, false, range.error_message);
                err.headers.set("Content-Range", transfer::format_unsatisfied_range(meta.size));
                return err;
            }
            case transfer::RangeStatus::Satisfiable:
                if (!opened.reader->read(range.range.start, range.range.length(), res.body)) {
                    return error(route, ErrorCode::StorageIO, false, "object body unavailable");
                }
                res.status = 206;
                res.headers.set("Content-Range",
                                transfer::format_content_range(range.range, meta.size));
                return res;
            case transfer::RangeStatus::Absent:
                break;
        }
    }

    if (!opened.reader->read(0, meta.size, res.body)) {
        return error(route, ErrorCode::StorageIO, false, "object body unavailable");
    }
    res.status = 200;

    // Transport-only compression; ETag still names the stored bytes
    if (options_.enable_compression && res.body.size() >= options_.compression_min_bytes &&
        accepts_gzip(request.headers.get("Accept-Encoding").value_or(""))) {
        auto compressed = gzip_compress(res.body);
        if (compressed.size() < res.body.size()) {
            res.body = std::move(compressed);
            res.headers.set("Content-Encoding", "gzip");
        }
        res.headers.set("Vary", "Accept-Encoding");
    }
    return res;
}

WireResponse ProtocolFacade::head_object(const Route& route) const {
    auto head = store_.head(route.bucket, route.key);
    if (!head.success) {
        return error(route, head.error, false, head.error_message);
    }
    WireResponse res;
    set_object_headers(res, route.protocol, head.metadata);
    res.headers.set("Content-Length", std::to_string(head.metadata.size));
    res.head_only = true;
    return res;
}

WireResponse ProtocolFacade::put_object(const Route& route, const WireRequest& request,
                                        const std::string& key) const {
    std::string content_type = request.headers.content_type().value_or("");
    if (route.protocol == Protocol::Azure) {
        content_type = request.headers.get("x-ms-blob-content-type").value_or(content_type);
    }

    PutResult result;
    auto encoding = request.headers.get("Content-Encoding");
    if (encoding && *encoding == "gzip") {
        auto plain = gzip_decompress(request.body);
        if (!plain) {
            return error(route, ErrorCode::BadRequest, false, "request body is not valid gzip");
        }
        result = store_.put(route.bucket, key, *plain, content_type);
    } else {
        result = store_.put(route.bucket, key, request.body, content_type);
    }
    if (!result.success) {
        return error(route, result.error, false, result.error_message);
    }

    WireResponse res;
    res.headers.set("ETag", quoted_etag(result.metadata.fingerprint));
    res.headers.set("Last-Modified", format_http_date(result.metadata.last_modified));
    switch (route.protocol) {
        case Protocol::Gcs: {
            const auto& encoder = encoder_for(route.protocol);
            res.set_text(encoder.encode_object(result.metadata), encoder.content_type());
            break;
        }
        case Protocol::Azure:
        case Protocol::WebDav:
            res.status = 201;
            break;
        default:
            res.status = 200;
            break;
    }
    return res;
}

WireResponse ProtocolFacade::delete_object(const Route& route) const {
    auto result = store_.remove(route.bucket, route.key);
    if (!result.success) {
        return error(route, result.error, false, result.error_message);
    }

    // S3 deletes are idempotent on the wire; the other families report absence
    if (!result.removed && route.protocol != Protocol::S3) {
        return error(route, ErrorCode::NotFound, false, "object not found");
    }
    auto res = empty_response(204);
    res.headers.set("x-blobgate-removed", result.removed ? "true" : "false");
    return res;
}

// ============================================================================
// WebDAV
// ============================================================================

WireResponse ProtocolFacade::propfind(const Route& route, const WireRequest& request) const {
    std::string depth = request.headers.get("Depth").value_or("1");
    if (depth != "0" && depth != "1" && depth != "infinity") {
        return error(route, ErrorCode::BadRequest, false, "invalid Depth header");
    }
    bool shallow = depth == "0";

    const auto& encoder = encoder_for(route.protocol);
    WireResponse res;
    res.status = 207;

    if (route.bucket.empty()) {
        std::vector<BucketInfo> buckets;
        if (!shallow) {
            auto listed = store_.list_buckets();
            if (!listed.success) {
                return error(route, listed.error, true, listed.error_message);
            }
            buckets = std::move(listed.buckets);
        }
        res.set_text(encoder.encode_buckets(buckets), encoder.content_type());
        return res;
    }

    auto info = store_.bucket_info(route.bucket);
    if (!info) {
        return error(route, ErrorCode::NotFound, true, "collection not found");
    }

    ListingContext ctx;
    ctx.bucket = route.bucket;
    ctx.options.delimiter = "/";

    if (route.key.empty()) {
        if (shallow) {
            res.set_text(encoder.encode_bucket(*info), encoder.content_type());
            return res;
        }
    } else {
        std::string dir = route.key;
        if (dir.back() != '/') {
            auto head = store_.head(route.bucket, route.key);
            if (head.success) {
                res.set_text(encoder.encode_object(head.metadata), encoder.content_type());
                return res;
            }
            if (head.error != ErrorCode::NotFound) {
                return error(route, head.error, false, head.error_message);
            }
            dir += '/';
        }
        ctx.options.prefix = dir;
    }

    auto listed = store_.list(route.bucket, ctx.options);
    if (!listed.success) {
        return error(route, listed.error, true, listed.error_message);
    }
    if (!route.key.empty() && listed.entries.empty() && listed.common_prefixes.empty()) {
        return error(route, ErrorCode::NotFound, false, "resource not found");
    }
    if (shallow) {
        listed.entries.clear();
        listed.common_prefixes.clear();
    }
    res.set_text(encoder.encode_listing(ctx, listed), encoder.content_type());
    return res;
}

WireResponse ProtocolFacade::mkcol(const Route& route) const {
    if (route.bucket.empty()) {
        return error(route, 405, "MethodNotAllowed", "the root collection already exists");
    }
    if (!route.key.empty()) {
        return error(route, ErrorCode::BadRequest, false, "nested collections are not supported");
    }

    auto result = store_.create_bucket(route.bucket);
    if (!result.success) {
        return error(route, result.error, true, result.error_message);
    }
    if (!result.created) {
        return error(route, 405, "MethodNotAllowed", "collection already exists");
    }
    return empty_response(201);
}

WireResponse ProtocolFacade::dav_options() const {
    auto res = empty_response(200);
    res.headers.set("DAV", "1");
    res.headers.set("Allow", DAV_ALLOW);
    res.headers.set("MS-Author-Via", "DAV");
    return res;
}

// ============================================================================
// Health and errors
// ============================================================================

WireResponse ProtocolFacade::health() const {
    bool healthy = store_.is_healthy();
    auto stats = store_.stats();

    json doc = {
        {"status", healthy ? "healthy" : "unhealthy"},
        {"service", options_.service_name},
        {"timestamp", format_iso8601(std::chrono::system_clock::now())},
        {"protocols", {"S3", "Azure Blob", "Google Cloud Storage", "WebDAV"}},
        {"buckets", stats.buckets},
        {"objects", stats.objects},
        {"bytes", stats.bytes},
    };

    WireResponse res;
    res.status = healthy ? 200 : 503;
    res.set_text(doc.dump(), "application/json");
    return res;
}

WireResponse ProtocolFacade::error(const Route& route, ErrorCode code, bool bucket_scope,
                                   const std::string& message) const {
    const auto& encoder = encoder_for(route.protocol);
    return error(route, http_status_for(code), encoder.error_name(code, bucket_scope), message);
}

WireResponse ProtocolFacade::error(const Route& route, int status, const std::string& name,
                                   const std::string& message) const {
    const auto& encoder = encoder_for(route.protocol);
    WireResponse res;
    res.status = status;
    res.set_text(encoder.encode_error(status, name, message, resource_of(route)),
                 encoder.content_type());
    return res;
}

}  // namespace blobgate::facade
