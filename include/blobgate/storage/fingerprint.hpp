#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

struct evp_md_ctx_st;

namespace blobgate {

/// Incremental content fingerprint (MD5, lowercase hex).
///
/// The fingerprint of an object is always the hash of its exact stored bytes;
/// it doubles as the ETag and as the equality test for skip/resume decisions.
class Fingerprinter {
public:
    Fingerprinter();
    ~Fingerprinter();

    Fingerprinter(const Fingerprinter&) = delete;
    Fingerprinter& operator=(const Fingerprinter&) = delete;

    void update(std::span<const uint8_t> data);
    void update(const char* data, size_t size);

    /// Finish and return the hex digest. The object is reset afterwards.
    std::string finish();

    uint64_t bytes_hashed() const { return bytes_; }

private:
    void reset();

    evp_md_ctx_st* ctx_ = nullptr;
    uint64_t bytes_ = 0;
};

/// Fingerprint of an in-memory payload.
std::string fingerprint_bytes(std::span<const uint8_t> data);

/// Fingerprint of a local file, or nullopt if it cannot be read.
std::optional<std::string> fingerprint_file(const std::filesystem::path& path);

/// SHA-256 hex of a string (used to derive on-disk body names).
std::string sha256_hex(const std::string& data);

/// Strip surrounding quotes (and a weak "W/" marker) from an ETag value.
std::string unquote_etag(const std::string& etag);

}  // namespace blobgate
