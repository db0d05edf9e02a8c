#include "models/resource_ref.h"

#include <regex>
#include <sstream>

#include "utils/string_utils.h"
#include "utils/url_encode.h"

namespace airdl {

namespace {

constexpr const char* kDownloadPathPrefix = "/api/download/models/";

ParseError makeUrlError(UrlErrorCause cause, std::string message) {
    ParseError err;
    err.kind = ParseErrorKind::kInvalidUrl;
    err.cause = cause;
    err.message = std::move(message);
    return err;
}

// First occurrence wins; blank values count as absent.
std::optional<std::string> queryValue(const std::string& query, const std::string& key) {
    size_t start = 0;
    while (start <= query.size()) {
        size_t amp = query.find('&', start);
        const std::string pair = amp == std::string::npos ? query.substr(start) : query.substr(start, amp - start);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            const std::string k = urlDecode(pair.substr(0, eq), true);
            if (k == key && eq != std::string::npos) {
                std::string v = urlDecode(pair.substr(eq + 1), true);
                if (!v.empty()) return v;
            }
        }
        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    return std::nullopt;
}

}  // namespace

std::optional<AirRef> parseAir(const std::string& raw) {
    static const std::regex re(
        R"(^(?:urn:)?(?:air:)?([^:]+):([^:]+):([^:]+):([^:@.]+)(?:@([^:@.]+))?(?:\.(\w+))?$)");
    std::smatch match;
    if (!std::regex_match(raw, match, re)) {
        return std::nullopt;
    }
    AirRef ref;
    ref.ecosystem = match[1].str();
    ref.kind = match[2].str();
    ref.source = match[3].str();
    ref.id = match[4].str();
    if (match[5].matched) ref.version = match[5].str();
    if (match[6].matched) ref.format = match[6].str();
    return ref;
}

ResolveResult parseDownloadUrl(const std::string& raw, const RegistryInfo& registry) {
    ResolveResult result;
    auto parsed = parseHttpUrl(raw);
    if (!parsed || !startsWith(parsed->scheme, "http") ||
        toLowerAscii(parsed->host).find(toLowerAscii(registry.domain)) == std::string::npos) {
        result.error = makeUrlError(UrlErrorCause::kBadDomain, "Invalid domain in URL: " + raw);
        return result;
    }

    if (!startsWith(parsed->path, kDownloadPathPrefix)) {
        result.error = makeUrlError(UrlErrorCause::kBadPath, "Invalid download path in URL: " + raw);
        return result;
    }

    std::string rest = parsed->path.substr(std::char_traits<char>::length(kDownloadPathPrefix));
    const auto slash = rest.find('/');
    const std::string version_id = slash == std::string::npos ? rest : rest.substr(0, slash);
    if (slash != std::string::npos && rest.find_first_not_of('/', slash) != std::string::npos) {
        result.error = makeUrlError(UrlErrorCause::kBadPath, "Invalid download path in URL: " + raw);
        return result;
    }
    if (!isAllDigits(version_id)) {
        result.error = makeUrlError(UrlErrorCause::kNonNumericId,
                                    "Model version ID is not numeric: '" + version_id + "'");
        return result;
    }

    UrlRef ref;
    ref.version_id = version_id;
    ref.query_type = queryValue(parsed->query, "type");
    ref.query_format = queryValue(parsed->query, "format");
    ref.query_size = queryValue(parsed->query, "size");
    ref.query_fp = queryValue(parsed->query, "fp");
    ref.raw_url = raw;
    result.ref = std::move(ref);
    return result;
}

ResolveResult resolveReference(const std::string& raw, const RegistryInfo& registry, ReferenceMode mode) {
    const std::string input = trimAscii(raw);
    const bool looks_like_url = input.find("://") != std::string::npos;
    if (mode == ReferenceMode::Url && !startsWith(toLowerAscii(input), "http://") &&
        !startsWith(toLowerAscii(input), "https://")) {
        ResolveResult result;
        result.error = makeUrlError(UrlErrorCause::kBadDomain, "Invalid URL: " + input);
        return result;
    }
    if (mode == ReferenceMode::Url || (mode == ReferenceMode::None && looks_like_url)) {
        return parseDownloadUrl(input, registry);
    }

    ResolveResult result;
    std::optional<AirRef> air;
    if (!looks_like_url) air = parseAir(input);
    if (!air) {
        ParseError err;
        err.kind = ParseErrorKind::kInvalidAir;
        err.message = "Invalid AIR format: " + input;
        result.error = std::move(err);
        return result;
    }
    if (air->source != registry.name) {
        ParseError err;
        err.kind = ParseErrorKind::kUnsupportedSource;
        err.message = "Unsupported source for download: " + air->source;
        result.error = std::move(err);
        return result;
    }
    result.ref = std::move(*air);
    return result;
}

std::string versionIdOf(const ResourceRef& ref) {
    if (const auto* air = std::get_if<AirRef>(&ref)) {
        return air->version.value_or(air->id);
    }
    return std::get<UrlRef>(ref).version_id;
}

std::optional<std::string> formatOf(const ResourceRef& ref) {
    if (const auto* air = std::get_if<AirRef>(&ref)) {
        return air->format;
    }
    return std::get<UrlRef>(ref).query_format;
}

std::string describeReference(const ResourceRef& ref) {
    std::ostringstream oss;
    if (const auto* air = std::get_if<AirRef>(&ref)) {
        oss << "AIR{ecosystem=" << air->ecosystem << ", kind=" << air->kind << ", source=" << air->source
            << ", id=" << air->id << ", version=" << air->version.value_or("-")
            << ", format=" << air->format.value_or("-") << "}";
    } else {
        const auto& url = std::get<UrlRef>(ref);
        oss << "URL{version=" << url.version_id << ", type=" << url.query_type.value_or("-")
            << ", format=" << url.query_format.value_or("-") << ", size=" << url.query_size.value_or("-")
            << ", fp=" << url.query_fp.value_or("-") << "}";
    }
    return oss.str();
}

std::string urlErrorCauseToString(UrlErrorCause cause) {
    switch (cause) {
        case UrlErrorCause::kNone:
            return "none";
        case UrlErrorCause::kBadDomain:
            return "bad domain";
        case UrlErrorCause::kBadPath:
            return "bad path";
        case UrlErrorCause::kNonNumericId:
            return "non-numeric id";
    }
    return "unknown";
}

}  // namespace airdl
