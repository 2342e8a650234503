#include "blobgate/facade/route_table.hpp"

#include <array>

namespace blobgate::facade {

namespace {

using enum Operation;

constexpr std::array<RouteEntry, 42> ROUTES = {{
    // S3 path-style
    {Protocol::S3, "GET", PathShape::Root, ListBuckets},
    {Protocol::S3, "GET", PathShape::Bucket, ListObjects},
    {Protocol::S3, "PUT", PathShape::Bucket, CreateBucket},
    {Protocol::S3, "DELETE", PathShape::Bucket, DeleteBucket},
    {Protocol::S3, "HEAD", PathShape::Bucket, HeadBucket},
    {Protocol::S3, "GET", PathShape::Object, GetObject},
    {Protocol::S3, "HEAD", PathShape::Object, HeadObject},
    {Protocol::S3, "PUT", PathShape::Object, PutObject},
    {Protocol::S3, "DELETE", PathShape::Object, DeleteObject},
    {Protocol::S3, "OPTIONS", PathShape::Any, Preflight},

    // Azure Blob
    {Protocol::Azure, "GET", PathShape::Root, ListBuckets},
    {Protocol::Azure, "GET", PathShape::Bucket, ListObjects},
    {Protocol::Azure, "PUT", PathShape::Bucket, CreateBucket},
    {Protocol::Azure, "DELETE", PathShape::Bucket, DeleteBucket},
    {Protocol::Azure, "HEAD", PathShape::Bucket, HeadBucket},
    {Protocol::Azure, "GET", PathShape::Object, GetObject},
    {Protocol::Azure, "HEAD", PathShape::Object, HeadObject},
    {Protocol::Azure, "PUT", PathShape::Object, PutObject},
    {Protocol::Azure, "DELETE", PathShape::Object, DeleteObject},
    {Protocol::Azure, "OPTIONS", PathShape::Any, Preflight},

    // Google Cloud Storage JSON API
    {Protocol::Gcs, "GET", PathShape::GcsBuckets, ListBuckets},
    {Protocol::Gcs, "POST", PathShape::GcsBuckets, CreateBucket},
    {Protocol::Gcs, "GET", PathShape::GcsBucket, GetBucket},
    {Protocol::Gcs, "DELETE", PathShape::GcsBucket, DeleteBucket},
    {Protocol::Gcs, "GET", PathShape::GcsObjects, ListObjects},
    {Protocol::Gcs, "GET", PathShape::GcsObject, GetObject},
    {Protocol::Gcs, "HEAD", PathShape::GcsObject, HeadObject},
    {Protocol::Gcs, "PUT", PathShape::GcsObject, PutObject},
    {Protocol::Gcs, "DELETE", PathShape::GcsObject, DeleteObject},
    {Protocol::Gcs, "POST", PathShape::GcsUpload, UploadMedia},
    {Protocol::Gcs, "OPTIONS", PathShape::Any, Preflight},

    // WebDAV
    {Protocol::WebDav, "OPTIONS", PathShape::Any, DavOptions},
    {Protocol::WebDav, "PROPFIND", PathShape::Any, Propfind},
    {Protocol::WebDav, "MKCOL", PathShape::Any, Mkcol},
    {Protocol::WebDav, "DELETE", PathShape::Bucket, DeleteBucket},
    {Protocol::WebDav, "GET", PathShape::Object, GetObject},
    {Protocol::WebDav, "HEAD", PathShape::Object, HeadObject},
    {Protocol::WebDav, "PUT", PathShape::Object, PutObject},
    {Protocol::WebDav, "DELETE", PathShape::Object, DeleteObject},

    // Health
    {Protocol::Health, "GET", PathShape::Root, Health},
    {Protocol::Health, "HEAD", PathShape::Root, Health},
    {Protocol::Health, "OPTIONS", PathShape::Any, Preflight},
}};

// Split "a/b/c" at the first slash into (bucket, key)
void split_bucket_key(std::string_view rest, Route& route) {
    while (!rest.empty() && rest.front() == '/') rest.remove_prefix(1);
    if (rest.empty()) {
        route.shape = PathShape::Root;
        return;
    }
    auto slash = rest.find('/');
    route.bucket = std::string(rest.substr(0, slash));
    std::string_view key = slash == std::string_view::npos ? std::string_view() : rest.substr(slash + 1);
    if (key.empty()) {
        route.shape = PathShape::Bucket;
    } else {
        route.shape = PathShape::Object;
        route.key = std::string(key);
    }
}

// Strip a leading "/segment" when it is exactly that segment
bool strip_segment(std::string_view& path, std::string_view segment) {
    if (!path.starts_with(segment)) return false;
    auto rest = path.substr(segment.size());
    if (!rest.empty() && rest.front() != '/') return false;
    path = rest;
    return true;
}

void classify_gcs(std::string_view rest, Route& route) {
    bool upload = strip_segment(rest, "/upload");
    if (!strip_segment(rest, "/storage") || !strip_segment(rest, "/v1") ||
        !strip_segment(rest, "/b")) {
        route.shape = PathShape::Invalid;
        return;
    }

    if (rest.empty() || rest == "/") {
        route.shape = upload ? PathShape::Invalid : PathShape::GcsBuckets;
        return;
    }
    rest.remove_prefix(1);

    auto slash = rest.find('/');
    route.bucket = std::string(rest.substr(0, slash));
    if (route.bucket.empty()) {
        route.shape = PathShape::Invalid;
        return;
    }
    if (slash == std::string_view::npos) {
        route.shape = upload ? PathShape::Invalid : PathShape::GcsBucket;
        return;
    }

    rest = rest.substr(slash);
    if (!strip_segment(rest, "/o")) {
        route.shape = PathShape::Invalid;
        return;
    }
    if (rest.empty() || rest == "/") {
        route.shape = upload ? PathShape::GcsUpload : PathShape::GcsObjects;
        return;
    }
    if (upload) {
        route.shape = PathShape::Invalid;
        return;
    }
    route.key = std::string(rest.substr(1));
    route.shape = PathShape::GcsObject;
}

}  // namespace

const char* protocol_name(Protocol protocol) {
    switch (protocol) {
        case Protocol::S3: return "s3";
        case Protocol::Azure: return "azure";
        case Protocol::Gcs: return "gcs";
        case Protocol::WebDav: return "webdav";
        case Protocol::Health: return "health";
    }
    return "unknown";
}

const char* operation_name(Operation op) {
    switch (op) {
        case ListBuckets: return "list_buckets";
        case CreateBucket: return "create_bucket";
        case DeleteBucket: return "delete_bucket";
        case HeadBucket: return "head_bucket";
        case GetBucket: return "get_bucket";
        case ListObjects: return "list_objects";
        case GetObject: return "get_object";
        case HeadObject: return "head_object";
        case PutObject: return "put_object";
        case DeleteObject: return "delete_object";
        case UploadMedia: return "upload_media";
        case Propfind: return "propfind";
        case Mkcol: return "mkcol";
        case DavOptions: return "dav_options";
        case Preflight: return "preflight";
        case Health: return "health";
        case NotAllowed: return "not_allowed";
        case NotRouted: return "not_routed";
    }
    return "unknown";
}

std::span<const RouteEntry> route_table() {
    return ROUTES;
}

Route resolve_route(const std::string& method, const std::string& path) {
    Route route;
    std::string_view rest = path;

    if (strip_segment(rest, "/health")) {
        route.protocol = Protocol::Health;
        route.shape = (rest.empty() || rest == "/") ? PathShape::Root : PathShape::Invalid;
    } else if (strip_segment(rest, "/azure")) {
        route.protocol = Protocol::Azure;
        split_bucket_key(rest, route);
    } else if (strip_segment(rest, "/gcs")) {
        route.protocol = Protocol::Gcs;
        classify_gcs(rest, route);
    } else if (strip_segment(rest, "/webdav")) {
        route.protocol = Protocol::WebDav;
        split_bucket_key(rest, route);
    } else {
        route.protocol = Protocol::S3;
        split_bucket_key(rest, route);
    }

    if (route.shape == PathShape::Invalid) {
        // OPTIONS is answered on any path of a family
        route.operation = method == "OPTIONS" ? Preflight : NotRouted;
        return route;
    }

    bool shape_known = false;
    for (const auto& entry : ROUTES) {
        if (entry.protocol != route.protocol) continue;
        if (entry.shape != PathShape::Any && entry.shape != route.shape) continue;
        shape_known = true;
        if (entry.method == method) {
            route.operation = entry.operation;
            return route;
        }
    }
    route.operation = shape_known ? NotAllowed : NotRouted;
    return route;
}

}  // namespace blobgate::facade
