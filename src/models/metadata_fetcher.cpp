#include "models/metadata_fetcher.h"

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace airdl {

MetadataFetcher::MetadataFetcher(RegistryInfo registry,
                                 std::optional<std::string> auth_token,
                                 std::chrono::milliseconds timeout,
                                 std::string user_agent)
    : registry_(std::move(registry)),
      auth_token_(std::move(auth_token)),
      timeout_(timeout),
      user_agent_(user_agent.empty() ? defaultUserAgent() : std::move(user_agent)) {}

FetchResult MetadataFetcher::fetch(const std::string& version_id) const {
    FetchResult result;
    auto fail = [&](FetchErrorKind kind, int status, std::string message) {
        result.error = FetchError{kind, status, std::move(message)};
        return result;
    };

    const std::string url_text = buildVersionMetadataUrl(registry_, version_id);
    auto url = parseHttpUrl(url_text);
    if (!url) {
        spdlog::warn("MetadataFetcher: invalid registry URL '{}'", url_text);
        return fail(FetchErrorKind::kNetwork, 0, "invalid registry URL: " + url_text);
    }

    auto client = makeClient(*url, timeout_);
    if (!client) {
        spdlog::warn("MetadataFetcher: failed to create HTTP client for '{}'", url->origin());
        return fail(FetchErrorKind::kNetwork, 0, "failed to create HTTP client for " + url->origin());
    }
    // The metadata endpoint answers directly; follow redirects only at the client level here.
    client->set_follow_location(true);

    httplib::Headers headers{{"User-Agent", user_agent_}, {"Accept", "application/json"}};
    if (auth_token_ && !auth_token_->empty()) {
        headers.emplace("Authorization", "Bearer " + *auth_token_);
    }

    spdlog::info("MetadataFetcher: resolving model version {} url='{}'", version_id, url_text);
    auto res = client->Get(url->pathWithQuery(), headers);
    if (!res) {
        const std::string reason = httplib::to_string(res.error());
        spdlog::warn("MetadataFetcher: request failed (no response) url='{}' error={}", url_text, reason);
        return fail(FetchErrorKind::kNetwork, 0, "metadata request failed: " + reason);
    }
    if (res->status < 200 || res->status >= 300) {
        spdlog::warn("MetadataFetcher: request failed status={} url='{}'", res->status, url_text);
        return fail(FetchErrorKind::kHttp, res->status,
                    "metadata request failed status=" + std::to_string(res->status));
    }

    std::string error;
    auto metadata = parseVersionMetadata(res->body, &error);
    if (!metadata) {
        spdlog::warn("MetadataFetcher: undecodable metadata for version {}: {}", version_id, error);
        return fail(FetchErrorKind::kDecode, res->status, error);
    }
    if (metadata->version_id.empty()) {
        metadata->version_id = version_id;
    }
    spdlog::debug("MetadataFetcher: version {} name='{}' base_model='{}' files={}", version_id, metadata->name,
                  metadata->base_model, metadata->files.size());
    result.metadata = std::move(metadata);
    return result;
}

}  // namespace airdl
