#include "blobgate/storage/content_store.hpp"
#include "blobgate/storage/fingerprint.hpp"
#include "blobgate/core/constants.hpp"
#include "blobgate/core/log.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <stdexcept>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <unordered_map>
#include <unordered_set>

namespace blobgate {

namespace fs = std::filesystem;

// ============================================================================
// Name rules and content types
// ============================================================================

bool is_valid_bucket_name(const std::string& bucket) {
    if (bucket.empty() || bucket.size() > constants::MAX_BUCKET_NAME_LENGTH) return false;
    if (bucket == "." || bucket == "..") return false;
    return std::all_of(bucket.begin(), bucket.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '_' || c == '-';
    });
}

bool is_valid_key(const std::string& key) {
    if (key.empty() || key.size() > constants::MAX_KEY_LENGTH) return false;
    if (key.front() == '/') return false;
    if (key.find('\0') != std::string::npos) return false;

    size_t start = 0;
    while (start <= key.size()) {
        size_t slash = key.find('/', start);
        if (slash == std::string::npos) slash = key.size();
        std::string_view segment(key.data() + start, slash - start);
        if (segment == "." || segment == "..") return false;
        start = slash + 1;
    }
    return true;
}

std::string guess_content_type(const std::string& key) {
    static const std::unordered_map<std::string, std::string> types = {
        {"txt", "text/plain"},         {"html", "text/html"},
        {"htm", "text/html"},          {"css", "text/css"},
        {"csv", "text/csv"},           {"xml", "application/xml"},
        {"js", "application/javascript"},
        {"json", "application/json"},  {"pdf", "application/pdf"},
        {"zip", "application/zip"},    {"gz", "application/gzip"},
        {"tar", "application/x-tar"},  {"png", "image/png"},
        {"jpg", "image/jpeg"},         {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},          {"svg", "image/svg+xml"},
        {"webp", "image/webp"},        {"mp3", "audio/mpeg"},
        {"wav", "audio/wav"},          {"mp4", "video/mp4"},
        {"mov", "video/quicktime"},    {"webm", "video/webm"},
    };

    auto slash = key.rfind('/');
    auto dot = key.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return constants::DEFAULT_CONTENT_TYPE;
    }
    std::string ext = key.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    auto it = types.find(ext);
    return it != types.end() ? it->second : constants::DEFAULT_CONTENT_TYPE;
}

namespace {

constexpr const char* MANIFEST_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS buckets (
    name TEXT PRIMARY KEY,
    created_at INTEGER NOT NULL
) WITHOUT ROWID;

CREATE TABLE IF NOT EXISTS objects (
    bucket TEXT NOT NULL,
    key TEXT NOT NULL,
    size INTEGER NOT NULL,
    fingerprint TEXT NOT NULL,
    content_type TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    modified_at INTEGER NOT NULL,
    body_file TEXT NOT NULL,
    PRIMARY KEY (bucket, key)
) WITHOUT ROWID;
)";

constexpr const char* OBJECT_COLUMNS =
    "bucket, key, size, fingerprint, content_type, created_at, modified_at, body_file";

// Get the number of key lock shards - configurable via BLOBGATE_LOCK_SHARDS env var
size_t get_num_shards() {
    static size_t num_shards = []() {
        if (const char* env = std::getenv("BLOBGATE_LOCK_SHARDS")) {
            try {
                size_t val = std::stoul(env);
                if (val >= 1 && val <= 4096) {
                    return val;
                }
            } catch (const std::exception&) {
                log_warn("invalid BLOBGATE_LOCK_SHARDS=%s, using default", env);
            }
        }
        return size_t{256};
    }();
    return num_shards;
}

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

// Resets a prepared statement when the scope ends
struct StmtScope {
    sqlite3_stmt* stmt;
    explicit StmtScope(sqlite3_stmt* s) : stmt(s) {}
    ~StmtScope() {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
};

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* stmt, int idx) {
    auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, idx));
    if (!text) return {};
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, idx)));
}

struct ObjectRecord {
    ObjectMetadata meta;
    std::string body_file;  // Relative to the objects directory
};

ObjectRecord read_record(sqlite3_stmt* stmt) {
    ObjectRecord rec;
    rec.meta.bucket = column_text(stmt, 0);
    rec.meta.key = column_text(stmt, 1);
    rec.meta.size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
    rec.meta.fingerprint = column_text(stmt, 3);
    rec.meta.content_type = column_text(stmt, 4);
    rec.meta.created = from_epoch_ms(sqlite3_column_int64(stmt, 5));
    rec.meta.last_modified = from_epoch_ms(sqlite3_column_int64(stmt, 6));
    rec.body_file = column_text(stmt, 7);
    return rec;
}

bool write_all(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

template <typename Result>
Result fail(ErrorCode code, std::string message) {
    Result result;
    result.success = false;
    result.error = code;
    result.error_message = std::move(message);
    return result;
}

// A body written to the staging area, not yet visible
struct StagedBody {
    fs::path path;
    uint64_t size = 0;
    std::string fingerprint;
};

}  // namespace

// ============================================================================
// LocalObjectReader
// ============================================================================

class LocalObjectReader : public ObjectReader {
public:
    LocalObjectReader(std::shared_lock<std::shared_mutex> bucket_lock,
                      std::shared_lock<std::shared_mutex> key_lock,
                      int fd, ObjectMetadata meta)
        : bucket_lock_(std::move(bucket_lock)),
          key_lock_(std::move(key_lock)),
          fd_(fd),
          meta_(std::move(meta)) {}

    ~LocalObjectReader() override {
        if (fd_ >= 0) ::close(fd_);
    }

    const ObjectMetadata& metadata() const override { return meta_; }

    bool read(uint64_t offset, uint64_t length, std::vector<uint8_t>& out) override {
        out.clear();
        if (offset >= meta_.size) return length == 0 || meta_.size == 0;
        length = std::min(length, meta_.size - offset);
        out.resize(length);

        uint64_t done = 0;
        while (done < length) {
            ssize_t n = ::pread(fd_, out.data() + done, length - done,
                                static_cast<off_t>(offset + done));
            if (n < 0) {
                if (errno == EINTR) continue;
                out.clear();
                return false;
            }
            if (n == 0) break;  // Truncated underneath us
            done += static_cast<uint64_t>(n);
        }
        if (done != length) {
            out.clear();
            return false;
        }
        return true;
    }

private:
    std::shared_lock<std::shared_mutex> bucket_lock_;
    std::shared_lock<std::shared_mutex> key_lock_;
    int fd_ = -1;
    ObjectMetadata meta_;
};

// ============================================================================
// LocalContentStore - bodies on the filesystem, metadata in SQLite
// ============================================================================
//
// Layout under data_dir:
//   manifest.db                                   metadata (source of truth)
//   staging/<generation>.tmp                      bodies being written
//   objects/<bucket>/<xx>/<sha256(key)>.<gen>     committed bodies
//
// Put ordering: body is staged and fsynced, renamed to a new generation path,
// then the metadata row is committed, then the previous generation is
// unlinked. A failed metadata commit removes the new body and reports
// StorageIO; the prior object remains intact and visible.

class LocalContentStore : public ContentStore {
public:
    explicit LocalContentStore(const fs::path& data_dir)
        : root_(fs::absolute(data_dir)),
          objects_dir_(root_ / "objects"),
          staging_dir_(root_ / "staging") {
        fs::create_directories(objects_dir_);
        fs::create_directories(staging_dir_);

        shards_.resize(get_num_shards());
        for (auto& shard : shards_) {
            shard = std::make_unique<Shard>();
        }

        generation_seed_ = static_cast<uint64_t>(
            std::chrono::system_clock::now().time_since_epoch().count());

        init_manifest();
        log_debug("LocalContentStore opened with %zu lock shards", shards_.size());
    }

    ~LocalContentStore() override {
        if (stmt_upsert_) sqlite3_finalize(stmt_upsert_);
        if (stmt_get_) sqlite3_finalize(stmt_get_);
        if (stmt_delete_) sqlite3_finalize(stmt_delete_);
        if (stmt_list_) sqlite3_finalize(stmt_list_);
        if (stmt_list_bucket_all_) sqlite3_finalize(stmt_list_bucket_all_);
        if (stmt_insert_bucket_) sqlite3_finalize(stmt_insert_bucket_);
        if (stmt_get_bucket_) sqlite3_finalize(stmt_get_bucket_);
        if (stmt_list_buckets_) sqlite3_finalize(stmt_list_buckets_);
        if (stmt_stats_) sqlite3_finalize(stmt_stats_);

        if (db_) {
            sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
            sqlite3_close(db_);
        }
    }

    std::string type_name() const override { return "local"; }

    // --- Buckets ---

    BucketResult create_bucket(const std::string& bucket) override {
        if (!is_valid_bucket_name(bucket)) {
            return fail<BucketResult>(ErrorCode::BadRequest, "invalid bucket name: " + bucket);
        }

        std::shared_lock lock(bucket_lock(bucket));

        BucketResult result;
        if (auto existing = find_bucket(bucket)) {
            result.success = true;
            result.bucket = *existing;
            result.created = false;
            return result;
        }

        // Concurrent creators can both get here; only the one whose row landed created it
        std::string err;
        bool inserted = false;
        auto info = ensure_bucket(bucket, err, &inserted);
        if (!info) {
            return fail<BucketResult>(ErrorCode::StorageIO, "failed to create bucket " + bucket);
        }
        result.success = true;
        result.bucket = *info;
        result.created = inserted;
        return result;
    }

    DeleteResult delete_bucket(const std::string& bucket) override {
        if (!is_valid_bucket_name(bucket)) {
            return fail<DeleteResult>(ErrorCode::BadRequest, "invalid bucket name: " + bucket);
        }

        // Exclusive: no write into this bucket can be in flight or start
        std::unique_lock lock(bucket_lock(bucket));

        DeleteResult result;
        if (!find_bucket(bucket)) {
            result.success = true;
            result.removed = false;
            return result;
        }

        {
            std::lock_guard<std::mutex> db_lock(db_mutex_);
            if (!sql_exec(db_, "BEGIN IMMEDIATE")) {
                return fail<DeleteResult>(ErrorCode::StorageIO, "manifest busy");
            }
            bool ok = exec_bucket_delete(bucket);
            if (!ok || !sql_exec(db_, "COMMIT")) {
                sql_exec(db_, "ROLLBACK");
                return fail<DeleteResult>(ErrorCode::StorageIO,
                                          "failed to delete bucket " + bucket);
            }
        }

        // Metadata is gone; leftover body files are invisible and swept by reconcile()
        std::error_code ec;
        fs::remove_all(objects_dir_ / bucket, ec);
        if (ec) {
            log_warn("delete_bucket %s: body cleanup incomplete: %s",
                     bucket.c_str(), ec.message().c_str());
        }

        result.success = true;
        result.removed = true;
        return result;
    }

    BucketListResult list_buckets() const override {
        BucketListResult result;
        std::lock_guard<std::mutex> lock(db_mutex_);
        StmtScope scope(stmt_list_buckets_);

        int rc;
        while ((rc = sql_step_retry(stmt_list_buckets_)) == SQLITE_ROW) {
            BucketInfo info;
            info.name = column_text(stmt_list_buckets_, 0);
            info.created = from_epoch_ms(sqlite3_column_int64(stmt_list_buckets_, 1));
            result.buckets.push_back(std::move(info));
        }
        if (rc != SQLITE_DONE) {
            return fail<BucketListResult>(ErrorCode::StorageIO, "failed to read bucket list");
        }
        result.success = true;
        return result;
    }

    std::optional<BucketInfo> bucket_info(const std::string& bucket) const override {
        if (!is_valid_bucket_name(bucket)) return std::nullopt;
        return find_bucket(bucket);
    }

    // --- Objects ---

    PutResult put(const std::string& bucket,
                  const std::string& key,
                  std::span<const uint8_t> data,
                  const std::string& content_type) override {
        if (auto err = validate(bucket, key); !err.empty()) {
            return fail<PutResult>(ErrorCode::BadRequest, err);
        }

        std::string err;
        auto staged = stage_bytes(data, err);
        if (!staged) return fail<PutResult>(ErrorCode::StorageIO, err);
        return commit(bucket, key, *staged, content_type);
    }

    PutResult put_file(const std::string& bucket,
                       const std::string& key,
                       const fs::path& source,
                       const std::string& content_type) override {
        if (auto err = validate(bucket, key); !err.empty()) {
            return fail<PutResult>(ErrorCode::BadRequest, err);
        }

        std::string err;
        auto staged = stage_file(source, err);
        if (!staged) return fail<PutResult>(ErrorCode::StorageIO, err);
        return commit(bucket, key, *staged, content_type);
    }

    HeadResult head(const std::string& bucket, const std::string& key) const override {
        if (auto err = validate(bucket, key); !err.empty()) {
            return fail<HeadResult>(ErrorCode::BadRequest, err);
        }

        std::shared_lock bl(bucket_lock(bucket));
        std::shared_lock kl(get_shard(bucket, key).mutex);

        auto rec = find_object(bucket, key);
        if (!rec) {
            return fail<HeadResult>(ErrorCode::NotFound, "object not found: " + bucket + "/" + key);
        }
        HeadResult result;
        result.success = true;
        result.metadata = rec->meta;
        return result;
    }

    GetResult get(const std::string& bucket, const std::string& key) const override {
        auto opened = open(bucket, key);
        if (!opened.success) {
            return fail<GetResult>(opened.error, opened.error_message);
        }

        GetResult result;
        result.metadata = opened.reader->metadata();
        if (!opened.reader->read(0, result.metadata.size, result.data)) {
            return fail<GetResult>(ErrorCode::StorageIO, "failed to read object body");
        }
        result.range_start = 0;
        result.range_end = result.metadata.size > 0 ? result.metadata.size - 1 : 0;
        result.success = true;
        return result;
    }

    GetResult get_range(const std::string& bucket,
                        const std::string& key,
                        uint64_t start,
                        uint64_t end) const override {
        auto opened = open(bucket, key);
        if (!opened.success) {
            return fail<GetResult>(opened.error, opened.error_message);
        }

        const auto& meta = opened.reader->metadata();
        if (start > end || end >= meta.size) {
            auto result = fail<GetResult>(
                ErrorCode::RangeNotSatisfiable,
                "range " + std::to_string(start) + "-" + std::to_string(end) +
                    " outside object of " + std::to_string(meta.size) + " bytes");
            result.metadata = meta;
            return result;
        }

        GetResult result;
        result.metadata = meta;
        if (!opened.reader->read(start, end - start + 1, result.data)) {
            return fail<GetResult>(ErrorCode::StorageIO, "failed to read object body");
        }
        result.range_start = start;
        result.range_end = end;
        result.success = true;
        return result;
    }

    OpenResult open(const std::string& bucket, const std::string& key) const override {
        if (auto err = validate(bucket, key); !err.empty()) {
            return fail<OpenResult>(ErrorCode::BadRequest, err);
        }

        std::shared_lock bl(bucket_lock(bucket));
        std::shared_lock kl(get_shard(bucket, key).mutex);

        auto rec = find_object(bucket, key);
        if (!rec) {
            return fail<OpenResult>(ErrorCode::NotFound, "object not found: " + bucket + "/" + key);
        }

        auto body_path = objects_dir_ / rec->body_file;
        int fd = ::open(body_path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            log_error("StorageIO: metadata for %s/%s references missing body %s: %s",
                      bucket.c_str(), key.c_str(), body_path.c_str(), strerror(errno));
            return fail<OpenResult>(ErrorCode::StorageIO, "object body unavailable");
        }

        struct stat st;
        if (::fstat(fd, &st) != 0 || static_cast<uint64_t>(st.st_size) != rec->meta.size) {
            log_error("StorageIO: body size of %s/%s does not match its metadata",
                      bucket.c_str(), key.c_str());
            ::close(fd);
            return fail<OpenResult>(ErrorCode::StorageIO, "object body inconsistent");
        }

        OpenResult result;
        result.success = true;
        result.reader = std::make_unique<LocalObjectReader>(
            std::move(bl), std::move(kl), fd, std::move(rec->meta));
        return result;
    }

    DeleteResult remove(const std::string& bucket, const std::string& key) override {
        if (auto err = validate(bucket, key); !err.empty()) {
            return fail<DeleteResult>(ErrorCode::BadRequest, err);
        }

        std::shared_lock bl(bucket_lock(bucket));
        std::unique_lock kl(get_shard(bucket, key).mutex);

        DeleteResult result;
        auto rec = find_object(bucket, key);
        if (!rec) {
            result.success = true;
            result.removed = false;
            return result;
        }

        // Metadata first: once the row is gone the object no longer exists
        {
            std::lock_guard<std::mutex> lock(db_mutex_);
            StmtScope scope(stmt_delete_);
            bind_text(stmt_delete_, 1, bucket);
            bind_text(stmt_delete_, 2, key);
            if (sql_step_retry(stmt_delete_) != SQLITE_DONE) {
                return fail<DeleteResult>(ErrorCode::StorageIO, "failed to delete metadata");
            }
        }

        std::error_code ec;
        fs::remove(objects_dir_ / rec->body_file, ec);
        if (ec) {
            log_warn("remove %s/%s: orphaned body left for reconcile: %s",
                     bucket.c_str(), key.c_str(), ec.message().c_str());
        }

        result.success = true;
        result.removed = true;
        return result;
    }

    ListResult list(const std::string& bucket, const ListOptions& options) const override {
        if (!is_valid_bucket_name(bucket)) {
            return fail<ListResult>(ErrorCode::BadRequest, "invalid bucket name: " + bucket);
        }
        if (!find_bucket(bucket)) {
            return fail<ListResult>(ErrorCode::NotFound, "bucket not found: " + bucket);
        }

        ListResult result;
        std::string lower_bound = std::max(options.prefix, options.start_after);

        std::lock_guard<std::mutex> lock(db_mutex_);
        StmtScope scope(stmt_list_);
        bind_text(stmt_list_, 1, bucket);
        bind_text(stmt_list_, 2, lower_bound);

        auto limit_reached = [&]() {
            return options.max_keys > 0 &&
                   result.entries.size() + result.common_prefixes.size() >= options.max_keys;
        };

        // A marker that is itself a rolled-up prefix covers every key under it
        bool marker_is_prefix = !options.delimiter.empty() &&
                                options.start_after.size() > options.prefix.size() &&
                                options.start_after.ends_with(options.delimiter);

        int rc;
        std::string last_emitted;
        while ((rc = sql_step_retry(stmt_list_)) == SQLITE_ROW) {
            std::string key = column_text(stmt_list_, 1);
            if (!key.starts_with(options.prefix)) break;  // Past the prefix block
            if (!options.start_after.empty() && key <= options.start_after) continue;
            if (marker_is_prefix && key.starts_with(options.start_after)) continue;

            if (!options.delimiter.empty()) {
                auto pos = key.find(options.delimiter, options.prefix.size());
                if (pos != std::string::npos) {
                    std::string common = key.substr(0, pos + options.delimiter.size());
                    if (common == last_emitted) continue;
                    if (limit_reached()) {
                        result.truncated = true;
                        break;
                    }
                    result.common_prefixes.push_back(common);
                    last_emitted = std::move(common);
                    continue;
                }
            }

            if (limit_reached()) {
                result.truncated = true;
                break;
            }
            result.entries.push_back(read_record(stmt_list_).meta);
            last_emitted = key;
        }
        if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
            return fail<ListResult>(ErrorCode::StorageIO, "failed to read object list");
        }

        // Entries and prefixes come out in key order, so the last one emitted resumes the walk
        if (result.truncated) result.next_start_after = last_emitted;
        result.success = true;
        return result;
    }

    // --- Maintenance ---

    StoreStats stats() const override {
        StoreStats stats;
        std::lock_guard<std::mutex> lock(db_mutex_);
        StmtScope scope(stmt_stats_);
        if (sql_step_retry(stmt_stats_) == SQLITE_ROW) {
            stats.buckets = static_cast<uint64_t>(sqlite3_column_int64(stmt_stats_, 0));
            stats.objects = static_cast<uint64_t>(sqlite3_column_int64(stmt_stats_, 1));
            stats.bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt_stats_, 2));
        }
        return stats;
    }

    ReconcileReport reconcile() override {
        ReconcileReport report;

        // Buckets known to the manifest plus directories found on disk
        std::set<std::string> names;
        auto listed = list_buckets();
        for (const auto& b : listed.buckets) names.insert(b.name);
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(objects_dir_, ec)) {
            if (entry.is_directory()) names.insert(entry.path().filename().string());
        }

        for (const auto& name : names) {
            reconcile_bucket(name, report);
        }

        // Staging files left by a crash mid-write
        auto cutoff = fs::file_time_type::clock::now() - std::chrono::hours(1);
        for (const auto& entry : fs::directory_iterator(staging_dir_, ec)) {
            std::error_code tec;
            if (entry.is_regular_file() && entry.last_write_time(tec) < cutoff && !tec) {
                if (fs::remove(entry.path(), tec)) {
                    ++report.stale_staging_removed;
                }
            }
        }

        if (report.orphaned_bodies_removed || report.dangling_records_removed ||
            report.stale_staging_removed) {
            log_info("Reconcile: removed %zu orphaned bodies, %zu dangling records, "
                     "%zu stale staging files",
                     report.orphaned_bodies_removed, report.dangling_records_removed,
                     report.stale_staging_removed);
        }
        return report;
    }

    bool is_healthy() const override {
        return db_ != nullptr && fs::is_directory(objects_dir_) && fs::is_directory(staging_dir_);
    }

private:
    struct Shard {
        mutable std::shared_mutex mutex;
    };

    // --- Manifest ---

    void init_manifest() {
        auto db_path = root_ / "manifest.db";
        int rc = sqlite3_open_v2(db_path.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            throw std::runtime_error("cannot open manifest: " + msg);
        }

        sqlite3_busy_timeout(db_, 5000);
        sql_exec(db_, "PRAGMA journal_mode=WAL");
        sql_exec(db_, "PRAGMA synchronous=FULL");
        if (!sql_exec(db_, MANIFEST_SCHEMA)) {
            throw std::runtime_error("cannot create manifest schema");
        }

        std::string cols = OBJECT_COLUMNS;
        prepare(stmt_upsert_,
                "INSERT INTO objects (" + cols + ") VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
                "ON CONFLICT(bucket, key) DO UPDATE SET size=excluded.size, "
                "fingerprint=excluded.fingerprint, content_type=excluded.content_type, "
                "modified_at=excluded.modified_at, body_file=excluded.body_file");
        prepare(stmt_get_, "SELECT " + cols + " FROM objects WHERE bucket = ? AND key = ?");
        prepare(stmt_delete_, "DELETE FROM objects WHERE bucket = ? AND key = ?");
        prepare(stmt_list_,
                "SELECT " + cols + " FROM objects WHERE bucket = ? AND key >= ? ORDER BY key");
        prepare(stmt_list_bucket_all_, "SELECT key, body_file FROM objects WHERE bucket = ?");
        prepare(stmt_insert_bucket_,
                "INSERT OR IGNORE INTO buckets (name, created_at) VALUES (?, ?)");
        prepare(stmt_get_bucket_, "SELECT name, created_at FROM buckets WHERE name = ?");
        prepare(stmt_list_buckets_, "SELECT name, created_at FROM buckets ORDER BY name");
        prepare(stmt_stats_,
                "SELECT (SELECT COUNT(*) FROM buckets), COUNT(*), COALESCE(SUM(size), 0) "
                "FROM objects");
    }

    void prepare(sqlite3_stmt*& stmt, const std::string& sql) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("cannot prepare statement: ") +
                                     sqlite3_errmsg(db_));
        }
    }

    std::optional<BucketInfo> find_bucket(const std::string& bucket) const {
        std::lock_guard<std::mutex> lock(db_mutex_);
        StmtScope scope(stmt_get_bucket_);
        bind_text(stmt_get_bucket_, 1, bucket);
        if (sql_step_retry(stmt_get_bucket_) != SQLITE_ROW) return std::nullopt;

        BucketInfo info;
        info.name = column_text(stmt_get_bucket_, 0);
        info.created = from_epoch_ms(sqlite3_column_int64(stmt_get_bucket_, 1));
        return info;
    }

    // Caller holds the bucket lock (shared or exclusive)
    std::optional<BucketInfo> ensure_bucket(const std::string& bucket, std::string& err,
                                            bool* inserted = nullptr) {
        std::error_code ec;
        fs::create_directories(objects_dir_ / bucket, ec);
        if (ec) {
            err = "cannot create bucket directory";
            log_error("create bucket %s: %s", bucket.c_str(), ec.message().c_str());
            return std::nullopt;
        }

        {
            std::lock_guard<std::mutex> lock(db_mutex_);
            StmtScope scope(stmt_insert_bucket_);
            bind_text(stmt_insert_bucket_, 1, bucket);
            sqlite3_bind_int64(stmt_insert_bucket_, 2,
                               to_epoch_ms(std::chrono::system_clock::now()));
            if (sql_step_retry(stmt_insert_bucket_) != SQLITE_DONE) {
                err = "cannot record bucket";
                return std::nullopt;
            }
            if (inserted) *inserted = sqlite3_changes(db_) > 0;
        }
        return find_bucket(bucket);
    }

    // Caller holds db_mutex_ inside an open transaction
    bool exec_bucket_delete(const std::string& bucket) {
        for (const char* sql : {"DELETE FROM objects WHERE bucket = ?",
                                "DELETE FROM buckets WHERE name = ?"}) {
            sqlite3_stmt* stmt = nullptr;
            if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;
            bind_text(stmt, 1, bucket);
            int rc = sql_step_retry(stmt);
            sqlite3_finalize(stmt);
            if (rc != SQLITE_DONE) return false;
        }
        return true;
    }

    std::optional<ObjectRecord> find_object(const std::string& bucket,
                                            const std::string& key) const {
        std::lock_guard<std::mutex> lock(db_mutex_);
        StmtScope scope(stmt_get_);
        bind_text(stmt_get_, 1, bucket);
        bind_text(stmt_get_, 2, key);
        if (sql_step_retry(stmt_get_) != SQLITE_ROW) return std::nullopt;
        return read_record(stmt_get_);
    }

    // --- Locks ---

    // Fixed stripes: lock state never grows with the names clients send
    std::shared_mutex& bucket_lock(const std::string& bucket) const {
        size_t hash = std::hash<std::string>{}(bucket);
        return bucket_stripes_[hash % bucket_stripes_.size()];
    }

    Shard& get_shard(const std::string& bucket, const std::string& key) const {
        size_t hash = std::hash<std::string>{}(bucket + '\n' + key);
        return *shards_[hash % shards_.size()];
    }

    // --- Body staging ---

    std::string next_generation() {
        uint64_t gen = generation_seed_ + generation_.fetch_add(1, std::memory_order_relaxed);
        char buf[24];
        snprintf(buf, sizeof(buf), "%016lx", static_cast<unsigned long>(gen));
        return buf;
    }

    int open_staging(fs::path& path, std::string& err) {
        path = staging_dir_ / (next_generation() + ".tmp");
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd < 0) {
            log_error("cannot create staging file %s: %s", path.c_str(), strerror(errno));
            err = "cannot create staging file";
        }
        return fd;
    }

    // Sync and close a staging descriptor; removes the file on failure
    bool finish_staging(int fd, const fs::path& path, std::string& err) {
        bool ok = ::fsync(fd) == 0;
        ok = (::close(fd) == 0) && ok;
        if (!ok) {
            log_error("cannot sync staging file %s: %s", path.c_str(), strerror(errno));
            err = "cannot persist object body";
            std::error_code ec;
            fs::remove(path, ec);
        }
        return ok;
    }

    std::optional<StagedBody> stage_bytes(std::span<const uint8_t> data, std::string& err) {
        StagedBody staged;
        int fd = open_staging(staged.path, err);
        if (fd < 0) return std::nullopt;

        if (!write_all(fd, reinterpret_cast<const char*>(data.data()), data.size())) {
            log_error("write to staging file failed: %s", strerror(errno));
            err = "cannot write object body";
            ::close(fd);
            std::error_code ec;
            fs::remove(staged.path, ec);
            return std::nullopt;
        }
        if (!finish_staging(fd, staged.path, err)) return std::nullopt;

        staged.size = data.size();
        staged.fingerprint = fingerprint_bytes(data);
        return staged;
    }

    std::optional<StagedBody> stage_file(const fs::path& source, std::string& err) {
        std::ifstream in(source, std::ios::binary);
        if (!in) {
            err = "cannot open source file";
            return std::nullopt;
        }

        StagedBody staged;
        int fd = open_staging(staged.path, err);
        if (fd < 0) return std::nullopt;

        Fingerprinter fp;
        std::vector<char> buffer(constants::STORAGE_IO_BUFFER_SIZE);
        bool ok = true;
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto n = static_cast<size_t>(in.gcount());
            if (n == 0) break;
            fp.update(buffer.data(), n);
            if (!write_all(fd, buffer.data(), n)) {
                ok = false;
                break;
            }
        }
        if (!ok || in.bad()) {
            err = "cannot copy object body";
            ::close(fd);
            std::error_code ec;
            fs::remove(staged.path, ec);
            return std::nullopt;
        }
        if (!finish_staging(fd, staged.path, err)) return std::nullopt;

        staged.size = fp.bytes_hashed();
        staged.fingerprint = fp.finish();
        return staged;
    }

    // Move a staged body into place and commit its metadata.
    PutResult commit(const std::string& bucket, const std::string& key,
                     const StagedBody& staged, const std::string& content_type) {
        auto discard_staged = [&]() {
            std::error_code ec;
            fs::remove(staged.path, ec);
        };

        std::shared_lock bl(bucket_lock(bucket));
        std::unique_lock kl(get_shard(bucket, key).mutex);

        std::string err;
        if (!find_bucket(bucket) && !ensure_bucket(bucket, err)) {
            discard_staged();
            return fail<PutResult>(ErrorCode::StorageIO, err);
        }

        auto key_hash = sha256_hex(key);
        std::string body_file = bucket + "/" + key_hash.substr(0, 2) + "/" + key_hash + "." +
                                next_generation();
        auto body_path = objects_dir_ / body_file;

        std::error_code ec;
        fs::create_directories(body_path.parent_path(), ec);
        if (!ec) fs::rename(staged.path, body_path, ec);
        if (ec) {
            log_error("cannot move body into place for %s/%s: %s",
                      bucket.c_str(), key.c_str(), ec.message().c_str());
            discard_staged();
            return fail<PutResult>(ErrorCode::StorageIO, "cannot store object body");
        }

        auto previous = find_object(bucket, key);
        // Manifest precision, so the returned metadata matches a later head()
        auto now = from_epoch_ms(to_epoch_ms(std::chrono::system_clock::now()));

        ObjectMetadata meta;
        meta.bucket = bucket;
        meta.key = key;
        meta.size = staged.size;
        meta.fingerprint = staged.fingerprint;
        meta.content_type = content_type.empty() ? guess_content_type(key) : content_type;
        meta.created = previous ? previous->meta.created : now;
        meta.last_modified = now;

        bool committed;
        {
            std::lock_guard<std::mutex> lock(db_mutex_);
            StmtScope scope(stmt_upsert_);
            bind_text(stmt_upsert_, 1, meta.bucket);
            bind_text(stmt_upsert_, 2, meta.key);
            sqlite3_bind_int64(stmt_upsert_, 3, static_cast<sqlite3_int64>(meta.size));
            bind_text(stmt_upsert_, 4, meta.fingerprint);
            bind_text(stmt_upsert_, 5, meta.content_type);
            sqlite3_bind_int64(stmt_upsert_, 6, to_epoch_ms(meta.created));
            sqlite3_bind_int64(stmt_upsert_, 7, to_epoch_ms(meta.last_modified));
            bind_text(stmt_upsert_, 8, body_file);
            committed = sql_step_retry(stmt_upsert_) == SQLITE_DONE;
        }

        if (!committed) {
            // Metadata is the source of truth: the new body never became visible
            fs::remove(body_path, ec);
            log_error("StorageIO: metadata write failed for %s/%s; previous object kept",
                      bucket.c_str(), key.c_str());
            return fail<PutResult>(ErrorCode::StorageIO, "metadata write failed");
        }

        if (previous && previous->body_file != body_file) {
            fs::remove(objects_dir_ / previous->body_file, ec);
            if (ec) {
                log_warn("put %s/%s: previous body left for reconcile: %s",
                         bucket.c_str(), key.c_str(), ec.message().c_str());
            }
        }

        log_debug("Stored %s/%s (%lu bytes, %s)", bucket.c_str(), key.c_str(),
                  static_cast<unsigned long>(meta.size), meta.fingerprint.c_str());

        PutResult result;
        result.success = true;
        result.metadata = std::move(meta);
        return result;
    }

    // --- Reconcile ---

    void reconcile_bucket(const std::string& bucket, ReconcileReport& report) {
        std::unique_lock lock(bucket_lock(bucket));

        std::map<std::string, std::string> referenced;  // body_file -> key
        {
            std::lock_guard<std::mutex> db_lock(db_mutex_);
            StmtScope scope(stmt_list_bucket_all_);
            bind_text(stmt_list_bucket_all_, 1, bucket);
            while (sql_step_retry(stmt_list_bucket_all_) == SQLITE_ROW) {
                referenced.emplace(column_text(stmt_list_bucket_all_, 1),
                                   column_text(stmt_list_bucket_all_, 0));
            }
        }

        // Metadata rows whose body is gone
        for (const auto& [body_file, key] : referenced) {
            if (fs::exists(objects_dir_ / body_file)) continue;
            std::lock_guard<std::mutex> db_lock(db_mutex_);
            StmtScope scope(stmt_delete_);
            bind_text(stmt_delete_, 1, bucket);
            bind_text(stmt_delete_, 2, key);
            if (sql_step_retry(stmt_delete_) == SQLITE_DONE) {
                ++report.dangling_records_removed;
                report.details.push_back("dangling record " + bucket + "/" + key);
                log_error("StorageIO: record %s/%s had no body; removed",
                          bucket.c_str(), key.c_str());
            }
        }

        // Body files no record points at
        auto bucket_dir = objects_dir_ / bucket;
        std::error_code ec;
        if (!fs::is_directory(bucket_dir, ec)) return;

        std::vector<fs::path> orphans;
        for (const auto& entry : fs::recursive_directory_iterator(bucket_dir, ec)) {
            if (!entry.is_regular_file()) continue;
            auto rel = fs::relative(entry.path(), objects_dir_, ec).generic_string();
            if (!referenced.count(rel)) orphans.push_back(entry.path());
        }
        for (const auto& path : orphans) {
            std::error_code rec;
            if (fs::remove(path, rec)) {
                ++report.orphaned_bodies_removed;
                report.details.push_back("orphaned body in " + bucket);
            }
        }

        if (!find_bucket(bucket) && referenced.empty()) {
            fs::remove_all(bucket_dir, ec);
        }
    }

    fs::path root_;
    fs::path objects_dir_;
    fs::path staging_dir_;

    // SQLite manifest; db_mutex_ protects the connection and statements
    mutable std::mutex db_mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_upsert_ = nullptr;
    sqlite3_stmt* stmt_get_ = nullptr;
    sqlite3_stmt* stmt_delete_ = nullptr;
    sqlite3_stmt* stmt_list_ = nullptr;
    sqlite3_stmt* stmt_list_bucket_all_ = nullptr;
    sqlite3_stmt* stmt_insert_bucket_ = nullptr;
    sqlite3_stmt* stmt_get_bucket_ = nullptr;
    sqlite3_stmt* stmt_list_buckets_ = nullptr;
    sqlite3_stmt* stmt_stats_ = nullptr;

    // Per-key locks (hashed into shards) and bucket structural locks (hashed into stripes)
    std::vector<std::unique_ptr<Shard>> shards_;
    mutable std::array<std::shared_mutex, constants::BUCKET_LOCK_STRIPES> bucket_stripes_;

    uint64_t generation_seed_ = 0;
    std::atomic<uint64_t> generation_{0};

    static std::string validate(const std::string& bucket, const std::string& key) {
        if (!is_valid_bucket_name(bucket)) return "invalid bucket name: " + bucket;
        if (!is_valid_key(key)) return "invalid object key";
        return {};
    }
};

// ============================================================================
// ContentStoreFactory
// ============================================================================

std::unique_ptr<ContentStore> ContentStoreFactory::create_local(const fs::path& data_dir) {
    return std::make_unique<LocalContentStore>(data_dir);
}

}  // namespace blobgate
