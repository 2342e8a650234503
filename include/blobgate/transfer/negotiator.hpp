#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace blobgate::transfer {

// What a metadata probe (HEAD) reports about the remote object
struct RemoteObject {
    uint64_t size = 0;
    std::string fingerprint;   // Unquoted ETag
    std::string content_type;
};

// Size and fingerprint both have to match; a size match alone proves nothing.
bool same_content(uint64_t local_size, const std::string& local_fingerprint,
                  uint64_t remote_size, const std::string& remote_fingerprint);

struct UploadPlan {
    bool skip = false;
    uint64_t local_size = 0;
    std::string local_fingerprint;  // Always computed for readable files
    std::string reason;
    bool local_readable = true;
};

/// Decide whether an upload can be skipped. `remote` is nullopt when the
/// probe found nothing.
UploadPlan plan_upload(const std::filesystem::path& local,
                       const std::optional<RemoteObject>& remote);

enum class DownloadAction {
    Fresh,    // No usable local data: write from byte 0
    Resume,   // Local file is shorter: append from offset
    Restart,  // Local file is equal-size but different, or longer: truncate
    Skip      // Local file already holds the remote content
};

struct DownloadPlan {
    DownloadAction action = DownloadAction::Fresh;
    uint64_t offset = 0;
    uint64_t local_size = 0;
    std::string reason;
};

/// Decide how to continue a download given the partial local file (if any).
DownloadPlan plan_download(const std::filesystem::path& local, const RemoteObject& remote);

const char* download_action_name(DownloadAction action);

}  // namespace blobgate::transfer
