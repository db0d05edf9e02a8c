#include "models/registry_client.h"

#include <httplib.h>
#include <regex>
#include <vector>

#include "utils/string_utils.h"
#include "utils/url_encode.h"
#include "utils/version.h"

namespace airdl {

namespace {

std::string trimTrailingSlash(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

int defaultPort(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

// Drop "." and ".." segments from an absolute path.
std::string normalizePath(const std::string& path) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= path.size()) {
        size_t pos = path.find('/', start);
        std::string segment = (pos == std::string::npos) ? path.substr(start) : path.substr(start, pos - start);
        if (segment == "..") {
            if (!out.empty()) out.pop_back();
        } else if (segment != "." && !segment.empty()) {
            out.push_back(segment);
        }
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    std::string joined;
    for (const auto& s : out) {
        joined += "/" + s;
    }
    if (joined.empty() || (!path.empty() && path.back() == '/')) {
        joined += "/";
    }
    return joined;
}

}  // namespace

RegistryInfo RegistryInfo::fromConfig(const DownloadConfig& cfg) {
    RegistryInfo info;
    info.name = cfg.registry_name;
    info.domain = cfg.registry_domain;
    info.base_url = trimTrailingSlash(cfg.registry_base_url);
    return info;
}

std::string HttpUrl::origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

std::string HttpUrl::pathWithQuery() const {
    std::string out = path.empty() ? "/" : path;
    if (!query.empty()) {
        out += "?" + query;
    }
    return out;
}

std::string HttpUrl::toString() const {
    std::string out = scheme + "://" + host;
    if (port != defaultPort(scheme)) {
        out += ":" + std::to_string(port);
    }
    return out + pathWithQuery();
}

std::optional<HttpUrl> parseHttpUrl(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/:?#]+)(?::(\d+))?([^?#]*)(?:\?([^#]*))?(?:#.*)?$)");
    std::smatch match;
    if (!std::regex_match(url, match, re)) {
        return std::nullopt;
    }
    HttpUrl parsed;
    parsed.scheme = toLowerAscii(match[1].str());
    parsed.host = match[2].str();
    if (match[3].matched) {
        const auto port_text = match[3].str();
        if (port_text.size() > 5) return std::nullopt;
        parsed.port = std::stoi(port_text);
        if (parsed.port <= 0 || parsed.port > 65535) return std::nullopt;
    } else {
        parsed.port = defaultPort(parsed.scheme);
    }
    parsed.path = match[4].str().empty() ? "/" : match[4].str();
    parsed.query = match[5].matched ? match[5].str() : "";
    return parsed;
}

std::optional<HttpUrl> resolveLocation(const HttpUrl& current, const std::string& location) {
    const std::string loc = trimAscii(location);
    if (loc.empty()) return std::nullopt;

    if (loc.find("://") != std::string::npos) {
        return parseHttpUrl(loc);
    }
    if (startsWith(loc, "//")) {
        return parseHttpUrl(current.scheme + ":" + loc);
    }

    HttpUrl next = current;
    std::string rest = loc;
    auto hash = rest.find('#');
    if (hash != std::string::npos) rest = rest.substr(0, hash);
    std::string path_part = rest;
    next.query.clear();
    auto qpos = rest.find('?');
    if (qpos != std::string::npos) {
        path_part = rest.substr(0, qpos);
        next.query = rest.substr(qpos + 1);
    }
    if (path_part.empty()) {
        // "?query" only: keep the current path
        next.path = current.path;
    } else if (path_part.front() == '/') {
        next.path = normalizePath(path_part);
    } else {
        auto slash = current.path.find_last_of('/');
        std::string dir = slash == std::string::npos ? "/" : current.path.substr(0, slash + 1);
        next.path = normalizePath(dir + path_part);
    }
    return next;
}

bool sameOrigin(const HttpUrl& a, const HttpUrl& b) {
    return a.scheme == b.scheme && toLowerAscii(a.host) == toLowerAscii(b.host) && a.port == b.port;
}

std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url, std::chrono::milliseconds timeout) {
    if (!url.valid()) {
        return nullptr;
    }
    if (url.scheme != "http" && url.scheme != "https") {
        return nullptr;
    }

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        return nullptr;  // HTTPS is not supported in this build
    }
#endif

    const std::string scheme_host_port = url.scheme + "://" + url.host + ":" + std::to_string(url.port);
    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    if (!client || !client->is_valid()) {
        return nullptr;
    }
    const int sec = static_cast<int>(timeout.count() / 1000);
    const int usec = static_cast<int>((timeout.count() % 1000) * 1000);
    client->set_connection_timeout(sec, usec);
    client->set_read_timeout(sec, usec);
    client->set_write_timeout(sec, usec);
    client->set_follow_location(false);
    return client;
}

std::string defaultUserAgent() {
    return std::string("airdl/") + AIRDL_VERSION;
}

std::string buildVersionMetadataUrl(const RegistryInfo& registry, const std::string& version_id) {
    return trimTrailingSlash(registry.base_url) + "/api/v1/model-versions/" + urlEncodePathSegment(version_id);
}

std::string buildDownloadUrl(const RegistryInfo& registry,
                             const std::string& version_id,
                             const std::optional<std::string>& type,
                             const std::optional<std::string>& format,
                             const std::optional<std::string>& size,
                             const std::optional<int>& fp) {
    std::string url = trimTrailingSlash(registry.base_url) + "/api/download/models/" + urlEncodePathSegment(version_id);
    char sep = '?';
    auto append = [&](const char* key, const std::optional<std::string>& value) {
        if (!value || value->empty()) return;
        url += sep;
        url += std::string(key) + "=" + urlEncodeQueryValue(*value);
        sep = '&';
    };
    append("type", type);
    append("format", format);
    append("size", size);
    if (fp) append("fp", "fp" + std::to_string(*fp));
    return url;
}

}  // namespace airdl
