#pragma once

#include <cstddef>
#include <cstdint>

namespace blobgate::constants {

// Server defaults
constexpr uint16_t DEFAULT_SERVER_PORT = 8443;
constexpr const char* DEFAULT_LISTEN_ADDRESS = "0.0.0.0";
constexpr const char* DEFAULT_DATA_DIR = "./object-storage";
constexpr const char* SERVICE_NAME = "blobgate";

// Server threading
constexpr size_t DEFAULT_IO_THREADS = 2;
constexpr size_t DEFAULT_WORKER_THREADS = 16;

// Request limits
constexpr uint64_t DEFAULT_MAX_BODY_BYTES = 5ULL * 1024 * 1024 * 1024;  // 5 GB
constexpr int DEFAULT_REQUEST_TIMEOUT_SECONDS = 300;

// Compression
constexpr size_t DEFAULT_COMPRESSION_MIN_BYTES = 1024;                 // 1 KB

// Storage
constexpr size_t STORAGE_IO_BUFFER_SIZE = 1024 * 1024;                 // 1 MB
constexpr size_t MAX_BUCKET_NAME_LENGTH = 255;
constexpr size_t MAX_KEY_LENGTH = 1024;
constexpr const char* DEFAULT_CONTENT_TYPE = "application/octet-stream";
constexpr size_t BUCKET_LOCK_STRIPES = 64;

// Listing
constexpr uint32_t DEFAULT_MAX_KEYS = 1000;

// Client defaults
constexpr const char* DEFAULT_SERVER_URL = "https://localhost:8443";
constexpr int DEFAULT_CONNECT_TIMEOUT_SECONDS = 30;
constexpr int DEFAULT_CLIENT_TIMEOUT_SECONDS = 30;
constexpr int DEFAULT_MAX_ATTEMPTS = 4;                                // 1 try + 3 retries
constexpr int DEFAULT_RETRY_DELAY_MS = 1000;
constexpr int DEFAULT_MAX_RETRY_DELAY_MS = 30000;
constexpr double DEFAULT_BACKOFF_MULTIPLIER = 2.0;
constexpr uint64_t PROGRESS_DISPLAY_THRESHOLD = 1024 * 1024;           // 1 MB

// Metrics
constexpr size_t DEFAULT_METRICS_INTERVAL_SECONDS = 15;

} // namespace blobgate::constants
