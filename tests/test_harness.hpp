#pragma once

// Minimal self-contained test harness shared by the blobgate test programs.
// Each program calls its test_* groups from main() and returns
// tests_failed > 0 ? 1 : 0.

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

inline int tests_passed = 0;
inline int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), std::string(msg) + ": " + (s))

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

/// Create a unique temp directory under /tmp.
inline fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
inline void write_file(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
}

/// Read entire file into a string.
inline std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

/// Deterministic pseudo-random payload of the given size.
inline std::string make_payload(size_t size, uint32_t seed = 1) {
    std::string out(size, '\0');
    uint32_t x = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; ++i) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        out[i] = static_cast<char>(x & 0xff);
    }
    return out;
}

inline std::vector<uint8_t> to_bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

inline std::string to_string(const std::vector<uint8_t>& v) {
    return std::string(v.begin(), v.end());
}

/// Wait for a condition with timeout (milliseconds). Returns true if met.
inline bool wait_for(std::function<bool()> cond, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return cond();
}

inline int print_results(const char* suite) {
    std::cout << "\n===================" << std::endl;
    std::cout << suite << ": " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;
    return tests_failed > 0 ? 1 : 0;
}
