#include "blobgate/facade/compression.hpp"
#include "blobgate/core/log.hpp"

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace blobgate::facade {

namespace io = boost::iostreams;

bool accepts_gzip(const std::string& accept_encoding) {
    std::string value = accept_encoding;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto semi = item.find(';');
        std::string coding = item.substr(0, semi);
        coding.erase(std::remove_if(coding.begin(), coding.end(),
                                    [](unsigned char c) { return std::isspace(c); }),
                     coding.end());
        if (coding != "gzip" && coding != "*") continue;

        if (semi != std::string::npos) {
            std::string params = item.substr(semi + 1);
            params.erase(std::remove_if(params.begin(), params.end(),
                                        [](unsigned char c) { return std::isspace(c); }),
                         params.end());
            if (params.starts_with("q=")) {
                try {
                    if (std::stod(params.substr(2)) <= 0.0) continue;
                } catch (const std::exception&) {
                    continue;
                }
            }
        }
        return true;
    }
    return false;
}

std::vector<uint8_t> gzip_compress(std::span<const uint8_t> data) {
    std::vector<char> compressed;
    {
        io::filtering_ostream out;
        out.push(io::gzip_compressor());
        out.push(io::back_inserter(compressed));
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        // filtering_ostream flushes the gzip trailer on destruction
    }
    return std::vector<uint8_t>(compressed.begin(), compressed.end());
}

std::optional<std::vector<uint8_t>> gzip_decompress(std::span<const uint8_t> data) {
    std::vector<char> plain;
    try {
        io::filtering_istream in;
        in.push(io::gzip_decompressor());
        in.push(io::array_source(reinterpret_cast<const char*>(data.data()), data.size()));
        io::copy(in, io::back_inserter(plain));
    } catch (const io::gzip_error& e) {
        log_debug("gzip decode failed: %s", e.what());
        return std::nullopt;
    }
    return std::vector<uint8_t>(plain.begin(), plain.end());
}

}  // namespace blobgate::facade
