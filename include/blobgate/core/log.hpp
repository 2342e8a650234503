#pragma once

namespace blobgate {

/// Enable or disable log_debug output (driven by --verbose).
void set_verbose(bool verbose);
bool is_verbose();

// printf-style log helpers. Info and debug go to stdout, warnings and errors
// to stderr. Each call writes one line and flushes.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace blobgate
