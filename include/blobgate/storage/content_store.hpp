#pragma once

#include "blobgate/core/errors.hpp"
#include "blobgate/core/time_format.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace blobgate {

// Metadata record of a stored object. Derived from the body on every write,
// never authored independently.
struct ObjectMetadata {
    std::string bucket;
    std::string key;
    uint64_t size = 0;
    std::string fingerprint;  // MD5 hex of the stored bytes
    std::string content_type;
    TimePoint created;
    TimePoint last_modified;
};

struct BucketInfo {
    std::string name;
    TimePoint created;
};

// Result of a put operation
struct PutResult {
    bool success = false;
    ObjectMetadata metadata;
    ErrorCode error = ErrorCode::None;
    std::string error_message;
};

// Result of a head operation
struct HeadResult {
    bool success = false;
    ObjectMetadata metadata;
    ErrorCode error = ErrorCode::None;
    std::string error_message;
};

// Result of a get or get_range operation. For a full get, start is 0 and
// end is size-1 (both 0 for an empty object).
struct GetResult {
    bool success = false;
    ObjectMetadata metadata;
    std::vector<uint8_t> data;
    uint64_t range_start = 0;
    uint64_t range_end = 0;
    ErrorCode error = ErrorCode::None;
    std::string error_message;
};

// Result of remove and delete_bucket. removed distinguishes "object removed"
// from "nothing to remove"; both are successes.
struct DeleteResult {
    bool success = false;
    bool removed = false;
    ErrorCode error = ErrorCode::None;
    std::string error_message;
};

struct BucketResult {
    bool success = false;
    BucketInfo bucket;
    bool created = false;  // false if the bucket already existed
    ErrorCode error = ErrorCode::None;
    std::string error_message;
};

struct BucketListResult {
    bool success = false;
    std::vector<BucketInfo> buckets;
    ErrorCode error = ErrorCode::None;
    std::string error_message;
};

// Options for list operations
struct ListOptions {
    std::string prefix;         // Byte-wise prefix match, not a glob
    std::string delimiter;      // Empty = flat listing
    std::string start_after;    // Only keys strictly greater than this
    uint32_t max_keys = 0;      // 0 = unlimited
};

// Result of a list operation. Entries are in ascending key order.
struct ListResult {
    bool success = false;
    std::vector<ObjectMetadata> entries;
    std::vector<std::string> common_prefixes;  // Only with a delimiter
    bool truncated = false;
    std::string next_start_after;
    ErrorCode error = ErrorCode::None;
    std::string error_message;
};

struct StoreStats {
    uint64_t buckets = 0;
    uint64_t objects = 0;
    uint64_t bytes = 0;
};

// Outcome of a reconciliation sweep over the storage medium.
struct ReconcileReport {
    size_t orphaned_bodies_removed = 0;   // Body files without a metadata record
    size_t dangling_records_removed = 0;  // Metadata records without a body file
    size_t stale_staging_removed = 0;
    std::vector<std::string> details;
};

/// Streaming read handle for one object.
///
/// Holds the object's read lock for its whole lifetime, so the body it reads
/// always matches metadata(); a concurrent writer of the same key waits until
/// the reader is destroyed. Must not outlive the store that created it.
class ObjectReader {
public:
    virtual ~ObjectReader() = default;

    virtual const ObjectMetadata& metadata() const = 0;

    /// Read up to length bytes at offset into out (replacing its contents).
    /// Returns false on an I/O error.
    virtual bool read(uint64_t offset, uint64_t length, std::vector<uint8_t>& out) = 0;
};

struct OpenResult {
    bool success = false;
    std::unique_ptr<ObjectReader> reader;
    ErrorCode error = ErrorCode::None;
    std::string error_message;
};

/// Owns all access to the physical blob + metadata store.
///
/// Every protocol adapter goes through this interface, so an object written
/// through one wire protocol is immediately visible through all others.
///
/// Guarantees:
///   - Metadata existence is object existence. A body without a metadata
///     record is invisible; a failed metadata write leaves the prior object.
///   - Writes to the same (bucket, key) are serialized; readers see either
///     the old complete object or the new complete object.
///   - delete_bucket excludes concurrent writes into that bucket.
class ContentStore {
public:
    virtual ~ContentStore() = default;

    // Get the store type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    // --- Buckets ---

    // Create a bucket. Creating an existing bucket succeeds (created=false).
    virtual BucketResult create_bucket(const std::string& bucket) = 0;

    // Delete a bucket and every object in it, all or nothing.
    virtual DeleteResult delete_bucket(const std::string& bucket) = 0;

    virtual BucketListResult list_buckets() const = 0;

    virtual std::optional<BucketInfo> bucket_info(const std::string& bucket) const = 0;

    // --- Objects ---

    // Store an object, creating the bucket implicitly. An empty content_type
    // is replaced by a guess from the key's extension.
    virtual PutResult put(const std::string& bucket,
                          const std::string& key,
                          std::span<const uint8_t> data,
                          const std::string& content_type = "") = 0;

    // Store an object from a local file.
    virtual PutResult put_file(const std::string& bucket,
                               const std::string& key,
                               const std::filesystem::path& source,
                               const std::string& content_type = "") = 0;

    virtual HeadResult head(const std::string& bucket, const std::string& key) const = 0;

    virtual GetResult get(const std::string& bucket, const std::string& key) const = 0;

    // Read bytes [start, end] inclusive. Requires start <= end < size,
    // otherwise fails with RangeNotSatisfiable.
    virtual GetResult get_range(const std::string& bucket,
                                const std::string& key,
                                uint64_t start,
                                uint64_t end) const = 0;

    virtual OpenResult open(const std::string& bucket, const std::string& key) const = 0;

    // Idempotent: removing an absent key succeeds with removed=false.
    virtual DeleteResult remove(const std::string& bucket, const std::string& key) = 0;

    virtual ListResult list(const std::string& bucket,
                            const ListOptions& options = {}) const = 0;

    // --- Maintenance ---

    virtual StoreStats stats() const = 0;

    // Remove orphaned bodies, dangling metadata and stale staging files.
    virtual ReconcileReport reconcile() = 0;

    virtual bool is_healthy() const = 0;
};

// Factory for creating content stores
class ContentStoreFactory {
public:
    // Filesystem bodies + SQLite manifest under data_dir.
    // Throws std::runtime_error if the manifest cannot be opened.
    static std::unique_ptr<ContentStore> create_local(const std::filesystem::path& data_dir);
};

// Name rules shared by the store and the protocol adapters.
bool is_valid_bucket_name(const std::string& bucket);
bool is_valid_key(const std::string& key);

// Content type from the key's extension, or application/octet-stream.
std::string guess_content_type(const std::string& key);

}  // namespace blobgate
