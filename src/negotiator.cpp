#include "blobgate/transfer/negotiator.hpp"
#include "blobgate/storage/fingerprint.hpp"
#include "blobgate/core/log.hpp"

#include <system_error>

namespace blobgate::transfer {

namespace fs = std::filesystem;

bool same_content(uint64_t local_size, const std::string& local_fingerprint,
                  uint64_t remote_size, const std::string& remote_fingerprint) {
    if (local_size != remote_size) return false;
    if (local_fingerprint.empty() || remote_fingerprint.empty()) return false;
    return local_fingerprint == remote_fingerprint;
}

UploadPlan plan_upload(const fs::path& local, const std::optional<RemoteObject>& remote) {
    UploadPlan plan;

    std::error_code ec;
    auto size = fs::file_size(local, ec);
    auto fingerprint = ec ? std::nullopt : fingerprint_file(local);
    if (ec || !fingerprint) {
        plan.local_readable = false;
        plan.reason = "local file unreadable";
        return plan;
    }
    plan.local_size = size;
    plan.local_fingerprint = *fingerprint;

    if (!remote) {
        plan.reason = "remote object absent";
    } else if (remote->size != size) {
        plan.reason = "size differs";
    } else if (!same_content(size, plan.local_fingerprint, remote->size, remote->fingerprint)) {
        plan.reason = "fingerprint differs";
    } else {
        plan.skip = true;
        plan.reason = "already satisfied";
    }
    return plan;
}

DownloadPlan plan_download(const fs::path& local, const RemoteObject& remote) {
    DownloadPlan plan;

    std::error_code ec;
    if (!fs::is_regular_file(local, ec)) {
        plan.reason = "no local file";
        return plan;
    }
    auto size = fs::file_size(local, ec);
    if (ec || size == 0) {
        plan.reason = "empty local file";
        if (!ec && remote.size == 0) {
            plan.action = DownloadAction::Skip;
            plan.reason = "already satisfied";
        }
        return plan;
    }
    plan.local_size = size;

    if (size < remote.size) {
        plan.action = DownloadAction::Resume;
        plan.offset = size;
        plan.reason = "partial local file";
        return plan;
    }

    if (size > remote.size) {
        plan.action = DownloadAction::Restart;
        plan.reason = "local file larger than remote";
        return plan;
    }

    auto fingerprint = fingerprint_file(local);
    if (fingerprint && same_content(size, *fingerprint, remote.size, remote.fingerprint)) {
        plan.action = DownloadAction::Skip;
        plan.reason = "already satisfied";
    } else {
        plan.action = DownloadAction::Restart;
        plan.reason = "fingerprint differs";
    }
    log_debug("download plan for %s: %s (%s)", local.c_str(),
              download_action_name(plan.action), plan.reason.c_str());
    return plan;
}

const char* download_action_name(DownloadAction action) {
    switch (action) {
        case DownloadAction::Fresh: return "fresh";
        case DownloadAction::Resume: return "resume";
        case DownloadAction::Restart: return "restart";
        case DownloadAction::Skip: return "skip";
    }
    return "unknown";
}

}  // namespace blobgate::transfer
