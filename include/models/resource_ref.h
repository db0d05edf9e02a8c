#pragma once

#include <optional>
#include <string>
#include <variant>

#include "models/download_error.h"
#include "models/registry_client.h"

namespace airdl {

/// Structured resource name: [urn:][air:]ecosystem:kind:source:id[@version][.format]
struct AirRef {
    std::string ecosystem;
    std::string kind;
    std::string source;
    std::string id;
    std::optional<std::string> version;
    std::optional<std::string> format;
};

/// Direct download URL: .../api/download/models/{versionId}[?type=&format=&size=&fp=]
struct UrlRef {
    std::string version_id;
    std::optional<std::string> query_type;
    std::optional<std::string> query_format;
    std::optional<std::string> query_size;
    std::optional<std::string> query_fp;
    std::string raw_url;
};

using ResourceRef = std::variant<AirRef, UrlRef>;

/// How the references were supplied on the command line
enum class ReferenceMode {
    None,  // detect from the input
    Url,   // --url / -u
    Air,   // --air / -a
};

enum class ParseErrorKind {
    kInvalidAir,
    kInvalidUrl,
    kUnsupportedSource,
};

enum class UrlErrorCause {
    kNone,
    kBadDomain,
    kBadPath,
    kNonNumericId,
};

struct ParseError {
    ParseErrorKind kind{ParseErrorKind::kInvalidAir};
    UrlErrorCause cause{UrlErrorCause::kNone};
    std::string message;

    DownloadErrorCode code() const {
        return kind == ParseErrorKind::kUnsupportedSource ? DownloadErrorCode::kUnsupportedSource
                                                          : DownloadErrorCode::kInvalidReference;
    }
};

struct ResolveResult {
    std::optional<ResourceRef> ref;
    std::optional<ParseError> error;

    bool ok() const { return ref.has_value(); }
};

/// Parse a raw reference into an AirRef or UrlRef. Pure, no I/O.
/// With ReferenceMode::None, inputs containing "://" are treated as URLs and
/// everything else as AIR. Url and Air modes accept only their own grammar.
ResolveResult resolveReference(const std::string& raw,
                               const RegistryInfo& registry = RegistryInfo{},
                               ReferenceMode mode = ReferenceMode::None);

/// Parse only the AIR grammar (the source check is not applied).
std::optional<AirRef> parseAir(const std::string& raw);

/// Parse only the download URL grammar.
ResolveResult parseDownloadUrl(const std::string& raw, const RegistryInfo& registry = RegistryInfo{});

/// Version id used for registry calls: the AIR version when present, else the id.
std::string versionIdOf(const ResourceRef& ref);

/// Format named by the reference itself (AIR ".format" or URL "format=").
std::optional<std::string> formatOf(const ResourceRef& ref);

std::string describeReference(const ResourceRef& ref);

std::string urlErrorCauseToString(UrlErrorCause cause);

}  // namespace airdl
