#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "utils/config.h"

namespace httplib {
class Client;
}

namespace airdl {

/// The remote model registry this build talks to.
struct RegistryInfo {
    std::string name{"civitai"};
    std::string domain{"civitai.com"};
    std::string base_url{"https://civitai.com"};

    static RegistryInfo fromConfig(const DownloadConfig& cfg);
};

struct HttpUrl {
    std::string scheme;
    std::string host;
    int port{0};
    std::string path;   // path only, always starts with '/'
    std::string query;  // without '?'

    bool valid() const { return !scheme.empty() && !host.empty(); }
    std::string origin() const;          // scheme://host:port
    std::string pathWithQuery() const;   // path[?query]
    std::string toString() const;
};

/// Parse an absolute http(s) URL. Fragments are dropped. Returns nullopt when
/// the input has no scheme://host part or an invalid port.
std::optional<HttpUrl> parseHttpUrl(const std::string& url);

/// Resolve a redirect Location against the URL that produced it.
std::optional<HttpUrl> resolveLocation(const HttpUrl& current, const std::string& location);

bool sameOrigin(const HttpUrl& a, const HttpUrl& b);

/// Client for one origin; redirects are not followed by the client.
/// Returns nullptr for unsupported schemes (https without OpenSSL support).
std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url, std::chrono::milliseconds timeout);

std::string defaultUserAgent();

/// {base}/api/v1/model-versions/{versionId}
std::string buildVersionMetadataUrl(const RegistryInfo& registry, const std::string& version_id);

/// {base}/api/download/models/{versionId}[?type=..&format=..&size=..&fp=fp<N>]
std::string buildDownloadUrl(const RegistryInfo& registry,
                             const std::string& version_id,
                             const std::optional<std::string>& type = std::nullopt,
                             const std::optional<std::string>& format = std::nullopt,
                             const std::optional<std::string>& size = std::nullopt,
                             const std::optional<int>& fp = std::nullopt);

}  // namespace airdl
