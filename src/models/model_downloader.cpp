#include "models/model_downloader.h"

#include <algorithm>
#include <fstream>
#include <httplib.h>
#include <memory>
#include <spdlog/spdlog.h>

#include "models/filename_resolver.h"
#include "utils/string_utils.h"

namespace fs = std::filesystem;

namespace airdl {

namespace {

enum class HopState {
    Requesting,   // no response seen yet
    Redirect,     // 3xx with (possibly empty) Location
    Rejected,     // final response refused before any byte was written
    Streaming,    // destination open, body being written
    WriteFailed,
    Cancelled,
};

bool isRedirectStatus(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::optional<uint64_t> parseContentLength(const httplib::Response& res) {
    if (!res.has_header("Content-Length")) return std::nullopt;
    const std::string value = trimAscii(res.get_header_value("Content-Length"));
    if (!isAllDigits(value)) return std::nullopt;
    try {
        return static_cast<uint64_t>(std::stoull(value));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

bool isRejectedContentType(const std::string& content_type) {
    std::string media = content_type;
    const auto semi = media.find(';');
    if (semi != std::string::npos) media = media.substr(0, semi);
    media = toLowerAscii(trimAscii(media));
    return media == "text/html" || media == "application/xhtml+xml";
}

ModelDownloader::ModelDownloader(RegistryInfo registry,
                                 std::optional<std::string> auth_token,
                                 std::chrono::milliseconds timeout,
                                 size_t chunk_size,
                                 int max_redirects,
                                 std::string user_agent)
    : registry_(std::move(registry)),
      registry_url_(parseHttpUrl(registry_.base_url)),
      auth_token_(std::move(auth_token)),
      timeout_(timeout),
      chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size),
      max_redirects_(max_redirects < 0 ? 0 : max_redirects),
      user_agent_(user_agent.empty() ? defaultUserAgent() : std::move(user_agent)) {}

bool ModelDownloader::shouldSendAuth(const HttpUrl& hop, const HttpUrl& origin_target, bool expected_auth) const {
    if (!expected_auth || !auth_token_ || auth_token_->empty()) return false;
    if (sameOrigin(hop, origin_target)) return true;
    return registry_url_.has_value() && sameOrigin(hop, *registry_url_);
}

DownloadOutcome<TransferResult> ModelDownloader::transfer(const DownloadTarget& target,
                                                          const fs::path& destination_dir,
                                                          ProgressCallback cb,
                                                          const std::atomic<bool>* cancel) const {
    using Outcome = DownloadOutcome<TransferResult>;
    const auto start_time = std::chrono::steady_clock::now();

    auto original = parseHttpUrl(target.url);
    if (!original) {
        spdlog::warn("ModelDownloader: invalid download URL '{}'", target.url);
        return Outcome::failure(DownloadErrorCode::kInvalidReference, "invalid download URL: " + target.url);
    }

    TransferResult result;
    HttpUrl current = *original;
    std::unique_ptr<httplib::Client> client;
    std::string client_origin;

    while (true) {
        if (cancel && cancel->load()) {
            return Outcome::failure(DownloadErrorCode::kCancelled, "transfer cancelled before request");
        }
        if (!client || client_origin != current.origin()) {
            client = makeClient(current, timeout_);
            if (!client) {
                spdlog::warn("ModelDownloader: failed to create HTTP client for '{}'", current.origin());
                return Outcome::failure(DownloadErrorCode::kNetworkFailure,
                                        "failed to create HTTP client for " + current.origin());
            }
            client_origin = current.origin();
        }

        httplib::Headers headers{{"User-Agent", user_agent_}};
        const bool with_auth = shouldSendAuth(current, *original, target.expected_auth);
        if (with_auth) {
            headers.emplace("Authorization", "Bearer " + *auth_token_);
        }
        spdlog::debug("ModelDownloader: GET {} auth={}", current.toString(), with_auth);

        HopState state = HopState::Requesting;
        int status = 0;
        std::string location;
        DownloadErrorCode reject_code = DownloadErrorCode::kOk;
        std::string reject_message;
        size_t total = 0;
        std::ofstream ofs;
        std::string buffer;

        auto flush = [&](bool report) -> bool {
            if (buffer.empty()) return true;
            ofs.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            if (!ofs) return false;
            result.bytes_written += buffer.size();
            buffer.clear();
            if (report && cb) cb(static_cast<size_t>(result.bytes_written), total);
            return true;
        };

        auto reject = [&](DownloadErrorCode code, std::string message) {
            reject_code = code;
            reject_message = std::move(message);
            state = HopState::Rejected;
            return false;
        };

        auto on_response = [&](const httplib::Response& res) {
            status = res.status;
            if (isRedirectStatus(res.status)) {
                location = res.get_header_value("Location");
                state = HopState::Redirect;
                return false;
            }
            const auto code = classifyTransferStatus(res.status);
            if (code != DownloadErrorCode::kOk) {
                return reject(code, "HTTP " + std::to_string(res.status) + " from " + current.toString());
            }
            const std::string content_type = res.get_header_value("Content-Type");
            if (isRejectedContentType(content_type)) {
                return reject(DownloadErrorCode::kUnexpectedContentType,
                              "received '" + content_type + "' instead of a file; the link may be expired or "
                              "require authentication");
            }

            result.declared_length = parseContentLength(res);
            total = result.declared_length ? static_cast<size_t>(*result.declared_length) : 0;
            result.filename = resolveFilename(res.headers, current.toString());

            std::error_code ec;
            fs::create_directories(destination_dir, ec);
            if (ec) {
                return reject(DownloadErrorCode::kIoFailure,
                              "cannot create " + destination_dir.string() + ": " + ec.message());
            }
            result.local_path = destination_dir / result.filename;
            ofs.open(result.local_path, std::ios::binary | std::ios::trunc);
            if (!ofs.is_open()) {
                return reject(DownloadErrorCode::kIoFailure, "cannot open " + result.local_path.string());
            }
            buffer.reserve(total > 0 ? std::min(chunk_size_, total) : chunk_size_);
            state = HopState::Streaming;
            return true;
        };

        auto on_data = [&](const char* data, size_t data_length) {
            if (cancel && cancel->load()) {
                state = flush(true) ? HopState::Cancelled : HopState::WriteFailed;
                return false;
            }
            size_t offset = 0;
            while (offset < data_length) {
                const size_t take = std::min(data_length - offset, chunk_size_ - buffer.size());
                buffer.append(data + offset, take);
                offset += take;
                if (buffer.size() >= chunk_size_ && !flush(true)) {
                    state = HopState::WriteFailed;
                    return false;
                }
            }
            return true;
        };

        auto res = client->Get(current.pathWithQuery(), headers, on_response, on_data);

        switch (state) {
            case HopState::Redirect: {
                if (location.empty()) {
                    spdlog::warn("ModelDownloader: HTTP {} without Location from {}", status, current.toString());
                    return Outcome::failure(DownloadErrorCode::kTooManyRedirects,
                                            "redirect (HTTP " + std::to_string(status) + ") without Location");
                }
                auto next = resolveLocation(current, location);
                if (!next) {
                    spdlog::warn("ModelDownloader: unusable redirect Location '{}'", location);
                    return Outcome::failure(DownloadErrorCode::kTooManyRedirects,
                                            "invalid redirect Location: " + location);
                }
                result.redirects.push_back(RedirectHop{status, next->toString()});
                spdlog::debug("ModelDownloader: redirect #{} HTTP {} -> {}", result.redirects.size(), status,
                              next->toString());
                if (static_cast<int>(result.redirects.size()) > max_redirects_) {
                    spdlog::warn("ModelDownloader: more than {} redirects for {}", max_redirects_, target.url);
                    return Outcome::failure(DownloadErrorCode::kTooManyRedirects,
                                            "more than " + std::to_string(max_redirects_) + " redirects");
                }
                current = std::move(*next);
                continue;
            }
            case HopState::Rejected:
                spdlog::warn("ModelDownloader: {} url='{}' {}", to_string(reject_code), current.toString(),
                             reject_message);
                return Outcome::failure(reject_code, reject_message);
            case HopState::Requesting: {
                const std::string reason = res ? "empty response" : httplib::to_string(res.error());
                spdlog::warn("ModelDownloader: request failed url='{}' error={}", current.toString(), reason);
                return Outcome::failure(DownloadErrorCode::kNetworkFailure, "request failed: " + reason);
            }
            case HopState::WriteFailed:
                spdlog::warn("ModelDownloader: write failed for {}", result.local_path.string());
                return Outcome::failure(DownloadErrorCode::kIoFailure,
                                        "write failed for " + result.local_path.string());
            case HopState::Cancelled:
                ofs.close();
                spdlog::info("ModelDownloader: cancelled {} after {} bytes", result.local_path.string(),
                             result.bytes_written);
                return Outcome::failure(DownloadErrorCode::kCancelled,
                                        "cancelled after " + std::to_string(result.bytes_written) + " bytes");
            case HopState::Streaming:
                break;
        }

        // Streaming: keep whatever arrived, even if the connection dropped.
        if (!flush(true)) {
            return Outcome::failure(DownloadErrorCode::kIoFailure, "write failed for " + result.local_path.string());
        }
        ofs.close();
        if (ofs.fail()) {
            return Outcome::failure(DownloadErrorCode::kIoFailure, "close failed for " + result.local_path.string());
        }
        if (!res) {
            const std::string reason = httplib::to_string(res.error());
            spdlog::warn("ModelDownloader: stream interrupted url='{}' after {} bytes error={}", current.toString(),
                         result.bytes_written, reason);
            return Outcome::failure(DownloadErrorCode::kNetworkFailure, "stream interrupted: " + reason);
        }

        std::error_code perm_ec;
        fs::permissions(result.local_path,
                        fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                            fs::perms::others_read,
                        fs::perm_options::replace, perm_ec);
        if (perm_ec) {
            spdlog::warn("ModelDownloader: could not set permissions on {}: {}", result.local_path.string(),
                         perm_ec.message());
        }

        if (result.declared_length && *result.declared_length != result.bytes_written) {
            spdlog::warn("ModelDownloader: {} declared {} bytes, wrote {}", result.filename, *result.declared_length,
                         result.bytes_written);
        }
        result.final_url = current.toString();
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                               start_time);
        if (cb) cb(static_cast<size_t>(result.bytes_written), total);
        spdlog::info("ModelDownloader: saved {} bytes={} elapsed_ms={} redirects={}", result.local_path.string(),
                     result.bytes_written, result.elapsed.count(), result.redirects.size());
        return Outcome::success(std::move(result));
    }
}

}  // namespace airdl
