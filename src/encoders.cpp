#include "blobgate/facade/encoders.hpp"
#include "blobgate/facade/xml.hpp"
#include "blobgate/core/time_format.hpp"
#include "blobgate/net/http.hpp"

#include <nlohmann/json.hpp>

namespace blobgate::facade {

using json = nlohmann::json;

std::string quoted_etag(const std::string& fingerprint) {
    return "\"" + fingerprint + "\"";
}

std::string ResponseEncoder::encode_object(const ObjectMetadata&) const {
    return {};
}

std::string ResponseEncoder::encode_bucket(const BucketInfo&) const {
    return {};
}

// ============================================================================
// S3
// ============================================================================

std::string S3XmlEncoder::content_type() const {
    return "application/xml";
}

std::string S3XmlEncoder::encode_buckets(const std::vector<BucketInfo>& buckets) const {
    xml::Writer w;
    w.open("ListAllMyBucketsResult", "xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\"");
    w.open("Owner").element("ID", "blobgate").element("DisplayName", "blobgate").close();
    w.open("Buckets");
    for (const auto& bucket : buckets) {
        w.open("Bucket")
            .element("Name", bucket.name)
            .element("CreationDate", format_iso8601(bucket.created))
            .close();
    }
    return w.str();
}

std::string S3XmlEncoder::encode_listing(const ListingContext& context,
                                         const ListResult& result) const {
    xml::Writer w;
    w.open("ListBucketResult", "xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\"");
    w.element("Name", context.bucket);
    w.element("Prefix", context.options.prefix);
    if (!context.options.start_after.empty()) {
        w.element("Marker", context.options.start_after);
    }
    if (!context.options.delimiter.empty()) {
        w.element("Delimiter", context.options.delimiter);
    }
    w.element("MaxKeys", std::to_string(context.options.max_keys));
    w.element("IsTruncated", result.truncated ? "true" : "false");
    if (result.truncated) {
        w.element("NextMarker", result.next_start_after);
    }

    for (const auto& entry : result.entries) {
        w.open("Contents")
            .element("Key", entry.key)
            .element("LastModified", format_iso8601(entry.last_modified))
            .element("ETag", quoted_etag(entry.fingerprint))
            .element("Size", std::to_string(entry.size))
            .element("StorageClass", "STANDARD")
            .close();
    }
    for (const auto& prefix : result.common_prefixes) {
        w.open("CommonPrefixes").element("Prefix", prefix).close();
    }
    return w.str();
}

std::string S3XmlEncoder::error_name(ErrorCode code, bool bucket_scope) const {
    switch (code) {
        case ErrorCode::NotFound: return bucket_scope ? "NoSuchBucket" : "NoSuchKey";
        case ErrorCode::RangeNotSatisfiable: return "InvalidRange";
        case ErrorCode::BadRequest: return "InvalidArgument";
        case ErrorCode::TransientIO: return "ServiceUnavailable";
        default: return "InternalError";
    }
}

std::string S3XmlEncoder::encode_error(int, const std::string& name, const std::string& message,
                                       const std::string& resource) const {
    xml::Writer w;
    w.open("Error")
        .element("Code", name)
        .element("Message", message)
        .element("Resource", resource);
    return w.str();
}

// ============================================================================
// Azure Blob
// ============================================================================

std::string AzureXmlEncoder::content_type() const {
    return "application/xml";
}

std::string AzureXmlEncoder::encode_buckets(const std::vector<BucketInfo>& buckets) const {
    xml::Writer w;
    w.open("EnumerationResults", "ServiceEndpoint=\"/azure/\"");
    w.open("Containers");
    for (const auto& bucket : buckets) {
        w.open("Container").element("Name", bucket.name);
        w.open("Properties").element("Last-Modified", format_http_date(bucket.created)).close();
        w.close();
    }
    w.close();
    w.empty("NextMarker");
    return w.str();
}

std::string AzureXmlEncoder::encode_listing(const ListingContext& context,
                                            const ListResult& result) const {
    xml::Writer w;
    w.open("EnumerationResults", "ServiceEndpoint=\"/azure/\" ContainerName=\"" +
                                     xml::escape(context.bucket) + "\"");
    w.element("Prefix", context.options.prefix);
    if (!context.options.delimiter.empty()) {
        w.element("Delimiter", context.options.delimiter);
    }
    w.element("MaxResults", std::to_string(context.options.max_keys));

    w.open("Blobs");
    for (const auto& entry : result.entries) {
        w.open("Blob").element("Name", entry.key);
        w.open("Properties")
            .element("Creation-Time", format_http_date(entry.created))
            .element("Last-Modified", format_http_date(entry.last_modified))
            .element("Etag", quoted_etag(entry.fingerprint))
            .element("Content-Length", std::to_string(entry.size))
            .element("Content-Type", entry.content_type)
            .element("BlobType", "BlockBlob")
            .close();
        w.close();
    }
    for (const auto& prefix : result.common_prefixes) {
        w.open("BlobPrefix").element("Name", prefix).close();
    }
    w.close();

    if (result.truncated) {
        w.element("NextMarker", result.next_start_after);
    } else {
        w.empty("NextMarker");
    }
    return w.str();
}

std::string AzureXmlEncoder::error_name(ErrorCode code, bool bucket_scope) const {
    switch (code) {
        case ErrorCode::NotFound: return bucket_scope ? "ContainerNotFound" : "BlobNotFound";
        case ErrorCode::RangeNotSatisfiable: return "InvalidRange";
        case ErrorCode::BadRequest: return "InvalidInput";
        case ErrorCode::TransientIO: return "ServerBusy";
        default: return "InternalError";
    }
}

std::string AzureXmlEncoder::encode_error(int, const std::string& name,
                                          const std::string& message,
                                          const std::string&) const {
    xml::Writer w;
    w.open("Error").element("Code", name).element("Message", message);
    return w.str();
}

// ============================================================================
// Google Cloud Storage
// ============================================================================

namespace {

json gcs_object(const ObjectMetadata& meta) {
    return {
        {"kind", "storage#object"},
        {"id", meta.bucket + "/" + meta.key},
        {"name", meta.key},
        {"bucket", meta.bucket},
        {"size", std::to_string(meta.size)},
        {"contentType", meta.content_type},
        {"etag", meta.fingerprint},
        {"timeCreated", format_iso8601(meta.created)},
        {"updated", format_iso8601(meta.last_modified)},
    };
}

json gcs_bucket(const BucketInfo& bucket) {
    return {
        {"kind", "storage#bucket"},
        {"id", bucket.name},
        {"name", bucket.name},
        {"timeCreated", format_iso8601(bucket.created)},
    };
}

}  // namespace

std::string GcsJsonEncoder::content_type() const {
    return "application/json; charset=UTF-8";
}

std::string GcsJsonEncoder::encode_buckets(const std::vector<BucketInfo>& buckets) const {
    json items = json::array();
    for (const auto& bucket : buckets) {
        items.push_back(gcs_bucket(bucket));
    }
    return json{{"kind", "storage#buckets"}, {"items", items}}.dump();
}

std::string GcsJsonEncoder::encode_listing(const ListingContext&,
                                           const ListResult& result) const {
    json items = json::array();
    for (const auto& entry : result.entries) {
        items.push_back(gcs_object(entry));
    }

    json doc = {{"kind", "storage#objects"}, {"items", items}};
    if (!result.common_prefixes.empty()) {
        doc["prefixes"] = result.common_prefixes;
    }
    if (result.truncated) {
        doc["nextPageToken"] = result.next_start_after;
    }
    return doc.dump();
}

std::string GcsJsonEncoder::encode_object(const ObjectMetadata& meta) const {
    return gcs_object(meta).dump();
}

std::string GcsJsonEncoder::encode_bucket(const BucketInfo& bucket) const {
    return gcs_bucket(bucket).dump();
}

std::string GcsJsonEncoder::error_name(ErrorCode code, bool) const {
    switch (code) {
        case ErrorCode::NotFound: return "notFound";
        case ErrorCode::RangeNotSatisfiable: return "requestedRangeNotSatisfiable";
        case ErrorCode::BadRequest: return "invalid";
        case ErrorCode::TransientIO: return "backendError";
        default: return "internalError";
    }
}

std::string GcsJsonEncoder::encode_error(int status, const std::string& name,
                                         const std::string& message,
                                         const std::string&) const {
    json doc = {
        {"error", {
            {"code", status},
            {"message", message},
            {"errors", json::array({{{"reason", name}, {"message", message}}})},
        }},
    };
    return doc.dump();
}

// ============================================================================
// WebDAV multistatus
// ============================================================================

namespace {

struct DavResource {
    std::string href;
    std::string display_name;
    bool collection = false;
    const ObjectMetadata* meta = nullptr;
    std::optional<TimePoint> created;
};

void write_resource(xml::Writer& w, const DavResource& res) {
    w.open("D:response");
    w.element("D:href", res.href);
    w.open("D:propstat");
    w.open("D:prop");
    w.element("D:displayname", res.display_name);
    if (res.collection) {
        w.open("D:resourcetype").empty("D:collection").close();
    } else {
        w.empty("D:resourcetype");
    }
    if (res.meta) {
        w.element("D:getcontentlength", std::to_string(res.meta->size));
        w.element("D:getcontenttype", res.meta->content_type);
        w.element("D:getetag", quoted_etag(res.meta->fingerprint));
        w.element("D:getlastmodified", format_http_date(res.meta->last_modified));
        w.element("D:creationdate", format_iso8601(res.meta->created));
    } else if (res.created) {
        w.element("D:creationdate", format_iso8601(*res.created));
    }
    w.close();  // prop
    w.element("D:status", "HTTP/1.1 200 OK");
    w.close();  // propstat
    w.close();  // response
}

std::string dav_href(const std::string& bucket, const std::string& key = "") {
    std::string href = "/webdav/";
    if (bucket.empty()) return href;
    href += net::url_encode(bucket) + "/";
    href += net::url_encode(key, true);
    return href;
}

// Last non-empty segment of a slash-delimited name
std::string last_segment(const std::string& name) {
    std::string trimmed = name;
    while (!trimmed.empty() && trimmed.back() == '/') trimmed.pop_back();
    auto slash = trimmed.rfind('/');
    return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

const char* DAV_NS = "xmlns:D=\"DAV:\"";

}  // namespace

std::string MultistatusEncoder::content_type() const {
    return "application/xml; charset=utf-8";
}

std::string MultistatusEncoder::encode_buckets(const std::vector<BucketInfo>& buckets) const {
    xml::Writer w;
    w.open("D:multistatus", DAV_NS);
    write_resource(w, {dav_href(""), "root", true, nullptr, std::nullopt});
    for (const auto& bucket : buckets) {
        write_resource(w, {dav_href(bucket.name), bucket.name, true, nullptr, bucket.created});
    }
    return w.str();
}

std::string MultistatusEncoder::encode_listing(const ListingContext& context,
                                               const ListResult& result) const {
    const auto& prefix = context.options.prefix;
    xml::Writer w;
    w.open("D:multistatus", DAV_NS);
    write_resource(w, {dav_href(context.bucket, prefix),
                       prefix.empty() ? context.bucket : last_segment(prefix), true, nullptr,
                       std::nullopt});
    for (const auto& dir : result.common_prefixes) {
        write_resource(w, {dav_href(context.bucket, dir), last_segment(dir), true, nullptr,
                           std::nullopt});
    }
    for (const auto& entry : result.entries) {
        // A "directory marker" key equal to the prefix is the collection itself
        if (entry.key == prefix) continue;
        write_resource(w, {dav_href(context.bucket, entry.key), last_segment(entry.key), false,
                           &entry, std::nullopt});
    }
    return w.str();
}

std::string MultistatusEncoder::encode_object(const ObjectMetadata& meta) const {
    xml::Writer w;
    w.open("D:multistatus", DAV_NS);
    write_resource(w, {dav_href(meta.bucket, meta.key), last_segment(meta.key), false, &meta,
                       std::nullopt});
    return w.str();
}

std::string MultistatusEncoder::encode_bucket(const BucketInfo& bucket) const {
    xml::Writer w;
    w.open("D:multistatus", DAV_NS);
    write_resource(w, {dav_href(bucket.name), bucket.name, true, nullptr, bucket.created});
    return w.str();
}

std::string MultistatusEncoder::error_name(ErrorCode code, bool) const {
    return error_code_name(code);
}

std::string MultistatusEncoder::encode_error(int, const std::string& name,
                                             const std::string& message,
                                             const std::string&) const {
    xml::Writer w;
    w.open("D:error", DAV_NS).element("D:responsedescription", name + ": " + message);
    return w.str();
}

// ============================================================================

const ResponseEncoder& encoder_for(Protocol protocol) {
    static const S3XmlEncoder s3;
    static const AzureXmlEncoder azure;
    static const GcsJsonEncoder gcs;
    static const MultistatusEncoder dav;

    switch (protocol) {
        case Protocol::S3: return s3;
        case Protocol::Azure: return azure;
        case Protocol::Gcs: return gcs;
        case Protocol::WebDav: return dav;
        case Protocol::Health: return gcs;
    }
    return s3;
}

}  // namespace blobgate::facade
