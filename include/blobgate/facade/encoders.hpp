#pragma once

#include "blobgate/facade/route_table.hpp"
#include "blobgate/storage/content_store.hpp"

#include <string>
#include <vector>

namespace blobgate::facade {

// What a listing was asked for, echoed back by the envelopes
struct ListingContext {
    std::string bucket;
    ListOptions options;
};

/// One wire representation of the canonical results.
///
/// The facade runs every operation against the content store once and hands
/// the canonical result to the encoder of the request's protocol family.
class ResponseEncoder {
public:
    virtual ~ResponseEncoder() = default;

    virtual std::string content_type() const = 0;

    virtual std::string encode_buckets(const std::vector<BucketInfo>& buckets) const = 0;
    virtual std::string encode_listing(const ListingContext& context,
                                       const ListResult& result) const = 0;

    // Single-resource documents. Families that describe objects and buckets
    // only through headers return an empty body.
    virtual std::string encode_object(const ObjectMetadata& meta) const;
    virtual std::string encode_bucket(const BucketInfo& bucket) const;

    // Family-specific error code name ("NoSuchKey", "BlobNotFound", ...)
    virtual std::string error_name(ErrorCode code, bool bucket_scope) const = 0;

    virtual std::string encode_error(int status,
                                     const std::string& name,
                                     const std::string& message,
                                     const std::string& resource) const = 0;
};

class S3XmlEncoder : public ResponseEncoder {
public:
    std::string content_type() const override;
    std::string encode_buckets(const std::vector<BucketInfo>& buckets) const override;
    std::string encode_listing(const ListingContext& context,
                               const ListResult& result) const override;
    std::string error_name(ErrorCode code, bool bucket_scope) const override;
    std::string encode_error(int status, const std::string& name, const std::string& message,
                             const std::string& resource) const override;
};

class AzureXmlEncoder : public ResponseEncoder {
public:
    std::string content_type() const override;
    std::string encode_buckets(const std::vector<BucketInfo>& buckets) const override;
    std::string encode_listing(const ListingContext& context,
                               const ListResult& result) const override;
    std::string error_name(ErrorCode code, bool bucket_scope) const override;
    std::string encode_error(int status, const std::string& name, const std::string& message,
                             const std::string& resource) const override;
};

class GcsJsonEncoder : public ResponseEncoder {
public:
    std::string content_type() const override;
    std::string encode_buckets(const std::vector<BucketInfo>& buckets) const override;
    std::string encode_listing(const ListingContext& context,
                               const ListResult& result) const override;
    std::string encode_object(const ObjectMetadata& meta) const override;
    std::string encode_bucket(const BucketInfo& bucket) const override;
    std::string error_name(ErrorCode code, bool bucket_scope) const override;
    std::string encode_error(int status, const std::string& name, const std::string& message,
                             const std::string& resource) const override;
};

// WebDAV multistatus (207) documents. Buckets are top-level collections,
// key prefixes ending in '/' are nested collections.
class MultistatusEncoder : public ResponseEncoder {
public:
    std::string content_type() const override;

    // Root collection followed by one collection per bucket
    std::string encode_buckets(const std::vector<BucketInfo>& buckets) const override;

    // The collection named by (bucket, options.prefix) followed by its members
    std::string encode_listing(const ListingContext& context,
                               const ListResult& result) const override;

    std::string encode_object(const ObjectMetadata& meta) const override;
    std::string encode_bucket(const BucketInfo& bucket) const override;
    std::string error_name(ErrorCode code, bool bucket_scope) const override;
    std::string encode_error(int status, const std::string& name, const std::string& message,
                             const std::string& resource) const override;
};

// Shared instance for a protocol family (Health uses the JSON encoder)
const ResponseEncoder& encoder_for(Protocol protocol);

// "\"<fingerprint>\""
std::string quoted_etag(const std::string& fingerprint);

}  // namespace blobgate::facade
