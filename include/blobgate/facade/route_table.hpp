#pragma once

#include <span>
#include <string>
#include <string_view>

namespace blobgate::facade {

enum class Protocol {
    S3,
    Azure,
    Gcs,
    WebDav,
    Health
};

const char* protocol_name(Protocol protocol);

// Canonical operation a request resolves to
enum class Operation {
    ListBuckets,
    CreateBucket,
    DeleteBucket,
    HeadBucket,
    GetBucket,      // Bucket resource document (GCS)
    ListObjects,
    GetObject,
    HeadObject,
    PutObject,
    DeleteObject,
    UploadMedia,    // GCS media upload, object name in the query
    Propfind,
    Mkcol,
    DavOptions,
    Preflight,      // CORS OPTIONS
    Health,
    NotAllowed,     // Known path shape, verb not in the table (405)
    NotRouted       // Path does not parse for its protocol (404)
};

const char* operation_name(Operation op);

enum class PathShape {
    Root,           // "/", "/azure", "/webdav", "/health"
    Bucket,         // One segment
    Object,         // Bucket plus key
    GcsBuckets,     // /gcs/storage/v1/b
    GcsBucket,      // /gcs/storage/v1/b/{bucket}
    GcsObjects,     // /gcs/storage/v1/b/{bucket}/o
    GcsObject,      // /gcs/storage/v1/b/{bucket}/o/{name...}
    GcsUpload,      // /gcs/upload/storage/v1/b/{bucket}/o
    Invalid,
    Any             // Table wildcard only
};

// One row of the closed dispatch table
struct RouteEntry {
    Protocol protocol;
    std::string_view method;
    PathShape shape;
    Operation operation;
};

std::span<const RouteEntry> route_table();

struct Route {
    Protocol protocol = Protocol::S3;
    PathShape shape = PathShape::Invalid;
    Operation operation = Operation::NotRouted;
    std::string bucket;
    std::string key;
};

/// Resolve a decoded request path and verb through the route table.
///
/// The first path segment selects the family ("azure", "gcs", "webdav",
/// "health"); anything else is S3 path-style addressing, so those four names
/// cannot be used as S3 bucket names.
Route resolve_route(const std::string& method, const std::string& path);

}  // namespace blobgate::facade
