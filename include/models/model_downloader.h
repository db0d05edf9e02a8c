#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "models/download_error.h"
#include "models/registry_client.h"

namespace airdl {

using ProgressCallback = std::function<void(size_t downloaded, size_t total)>;

inline constexpr size_t kDefaultChunkSize = 16 * 1024 * 1024;
inline constexpr int kDefaultMaxRedirects = 10;

struct DownloadTarget {
    std::string url;
    bool expected_auth{true};
};

struct RedirectHop {
    int status{0};
    std::string url;  // the Location target, resolved to an absolute URL
};

struct TransferResult {
    std::filesystem::path local_path;
    std::string filename;
    std::string final_url;
    uint64_t bytes_written{0};
    std::optional<uint64_t> declared_length;  // Content-Length, if the server sent one
    std::chrono::milliseconds elapsed{0};
    std::vector<RedirectHop> redirects;
};

/// Returns true for text/html and application/xhtml+xml (parameters ignored).
bool isRejectedContentType(const std::string& content_type);

/// Streams one DownloadTarget to disk.
///
/// Redirects are followed hop by hop (at most max_redirects) so each hop can be
/// recorded. The bearer token is only sent to the registry origin and the origin
/// of the original target. The final response is classified by status and
/// content type before anything is written; the body is then written in
/// chunk_size pieces. Partial files from a failed or cancelled stream are kept.
class ModelDownloader {
public:
    ModelDownloader(RegistryInfo registry,
                    std::optional<std::string> auth_token,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000),
                    size_t chunk_size = kDefaultChunkSize,
                    int max_redirects = kDefaultMaxRedirects,
                    std::string user_agent = {});

    DownloadOutcome<TransferResult> transfer(const DownloadTarget& target,
                                             const std::filesystem::path& destination_dir,
                                             ProgressCallback cb = nullptr,
                                             const std::atomic<bool>* cancel = nullptr) const;

    const RegistryInfo& registry() const { return registry_; }
    size_t getChunkSize() const { return chunk_size_; }
    int getMaxRedirects() const { return max_redirects_; }

private:
    bool shouldSendAuth(const HttpUrl& hop, const HttpUrl& origin_target, bool expected_auth) const;

    RegistryInfo registry_;
    std::optional<HttpUrl> registry_url_;
    std::optional<std::string> auth_token_;
    std::chrono::milliseconds timeout_;
    size_t chunk_size_;
    int max_redirects_;
    std::string user_agent_;
};

}  // namespace airdl
