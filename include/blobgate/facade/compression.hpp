#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace blobgate::facade {

// True when an Accept-Encoding value admits gzip (q=0 excludes it)
bool accepts_gzip(const std::string& accept_encoding);

std::vector<uint8_t> gzip_compress(std::span<const uint8_t> data);

// nullopt if the input is not a valid gzip stream
std::optional<std::vector<uint8_t>> gzip_decompress(std::span<const uint8_t> data);

}  // namespace blobgate::facade
