#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "models/registry_client.h"
#include "models/version_metadata.h"

namespace airdl {

enum class FetchErrorKind {
    kHttp,     // non-2xx status
    kDecode,   // body is not a usable manifest
    kNetwork,  // no HTTP response at all
};

struct FetchError {
    FetchErrorKind kind{FetchErrorKind::kNetwork};
    int status{0};
    std::string message;
};

struct FetchResult {
    std::optional<VersionMetadata> metadata;
    std::optional<FetchError> error;

    bool ok() const { return metadata.has_value(); }
};

/// Reads version manifests from the registry API.
class MetadataFetcher {
public:
    /// @param auth_token Bearer token; nullopt sends no Authorization header
    MetadataFetcher(RegistryInfo registry,
                    std::optional<std::string> auth_token,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000),
                    std::string user_agent = {});

    /// GET {base}/api/v1/model-versions/{versionId}. One request, no retries.
    FetchResult fetch(const std::string& version_id) const;

    const RegistryInfo& registry() const { return registry_; }

private:
    RegistryInfo registry_;
    std::optional<std::string> auth_token_;
    std::chrono::milliseconds timeout_;
    std::string user_agent_;
};

}  // namespace airdl
