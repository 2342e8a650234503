#include "blobgate/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace blobgate {

namespace {

std::atomic<bool> g_verbose{false};
std::mutex g_log_mutex;

void write_line(FILE* out, const char* level, const char* fmt, va_list args) {
    char stamp[32];
    time_t now = time(nullptr);
    struct tm tm_val;
    gmtime_r(&now, &tm_val);
    strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &tm_val);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    fprintf(out, "%s ", stamp);
    if (level) fprintf(out, "%s: ", level);
    vfprintf(out, fmt, args);
    fputc('\n', out);
    fflush(out);
}

}  // namespace

void set_verbose(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool is_verbose() {
    return g_verbose.load(std::memory_order_relaxed);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stdout, nullptr, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stderr, "WARNING", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stderr, "ERROR", fmt, args);
    va_end(args);
}

void log_debug(const char* fmt, ...) {
    if (!is_verbose()) return;
    va_list args;
    va_start(args, fmt);
    write_line(stdout, "DEBUG", fmt, args);
    va_end(args);
}

}  // namespace blobgate
