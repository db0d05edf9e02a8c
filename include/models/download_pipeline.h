#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "models/download_error.h"
#include "models/file_selector.h"
#include "models/metadata_fetcher.h"
#include "models/model_downloader.h"
#include "models/resource_ref.h"
#include "utils/config.h"

namespace airdl {

/// Observation hooks for the presentation layer. Any of them may be empty.
struct PipelineCallbacks {
    std::function<void(const std::string& raw, const std::string& url, const std::optional<std::string>& format)>
        on_resolved;
    std::function<void(const std::string& raw, const std::vector<FileDecision>& decisions)> on_selection;
    std::function<void(const std::string& url)> on_transfer_start;
    std::function<void(const std::string& url, size_t downloaded, size_t total)> on_progress;
    std::function<void(const TransferResult& result)> on_transfer_complete;
    std::function<void(const std::string& url, DownloadErrorCode code, const std::string& message)>
        on_transfer_failed;
    std::function<void(const std::string& raw, DownloadErrorCode code, const std::string& message)>
        on_reference_failed;
};

struct TransferReport {
    std::string url;
    DownloadErrorCode code{DownloadErrorCode::kOk};
    std::string message;
    std::optional<TransferResult> result;
};

struct ReferenceReport {
    std::string raw;
    std::optional<ResourceRef> ref;
    DownloadErrorCode code{DownloadErrorCode::kOk};
    std::string message;
    std::vector<TransferReport> transfers;
    std::vector<FileDecision> decisions;

    bool ok() const { return code == DownloadErrorCode::kOk; }
};

/// Runs resolve -> (metadata) -> select -> transfer for each reference, one at a time.
class DownloadPipeline {
public:
    DownloadPipeline(const DownloadConfig& config,
                     std::optional<std::string> auth_token,
                     std::filesystem::path destination_dir,
                     SelectionConstraints constraints);

    void setCallbacks(PipelineCallbacks callbacks) { callbacks_ = std::move(callbacks); }
    void setCancelFlag(const std::atomic<bool>* cancel) { cancel_ = cancel; }
    /// Restrict references to one grammar (--url or --air); None detects per reference.
    void setReferenceMode(ReferenceMode mode) { mode_ = mode; }

    ReferenceReport processReference(const std::string& raw) const;

    /// Processes references in order. Stops early only when cancelled.
    std::vector<ReferenceReport> processAll(const std::vector<std::string>& raws) const;

    /// processAll + exit status: 0 when every reference succeeded, 1 otherwise.
    int run(const std::vector<std::string>& raws) const;

    /// CLI constraints win; a URL's own size/fp query values fill the gaps.
    SelectionConstraints constraintsFor(const ResourceRef& ref) const;

    /// True when the reference names a format and nothing requires the manifest.
    static bool canSkipMetadata(const ResourceRef& ref, const SelectionConstraints& constraints);

    static int exitCodeFor(const std::vector<ReferenceReport>& reports);

    const RegistryInfo& registry() const { return registry_; }

private:
    bool cancelled() const { return cancel_ != nullptr && cancel_->load(); }

    RegistryInfo registry_;
    MetadataFetcher fetcher_;
    ModelDownloader downloader_;
    std::filesystem::path destination_dir_;
    SelectionConstraints constraints_;
    PipelineCallbacks callbacks_;
    const std::atomic<bool>* cancel_{nullptr};
    ReferenceMode mode_{ReferenceMode::None};
};

}  // namespace airdl
