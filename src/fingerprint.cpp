#include "blobgate/storage/fingerprint.hpp"
#include "blobgate/core/constants.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace blobgate {

namespace {

std::string to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

}  // namespace

Fingerprinter::Fingerprinter() {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    reset();
}

Fingerprinter::~Fingerprinter() {
    if (ctx_) EVP_MD_CTX_free(ctx_);
}

void Fingerprinter::reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex(md5) failed");
    }
    bytes_ = 0;
}

void Fingerprinter::update(std::span<const uint8_t> data) {
    update(reinterpret_cast<const char*>(data.data()), data.size());
}

void Fingerprinter::update(const char* data, size_t size) {
    if (size == 0) return;
    EVP_DigestUpdate(ctx_, data, size);
    bytes_ += size;
}

std::string Fingerprinter::finish() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    EVP_DigestFinal_ex(ctx_, digest, &len);
    auto hex = to_hex(digest, len);
    reset();
    return hex;
}

std::string fingerprint_bytes(std::span<const uint8_t> data) {
    Fingerprinter fp;
    fp.update(data);
    return fp.finish();
}

std::optional<std::string> fingerprint_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;

    Fingerprinter fp;
    std::vector<char> buffer(constants::STORAGE_IO_BUFFER_SIZE);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto n = file.gcount();
        if (n > 0) fp.update(buffer.data(), static_cast<size_t>(n));
    }
    if (file.bad()) return std::nullopt;
    return fp.finish();
}

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string unquote_etag(const std::string& etag) {
    std::string value = etag;
    if (value.starts_with("W/")) value = value.substr(2);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

}  // namespace blobgate
