#include "models/filename_resolver.h"

#include <chrono>
#include <spdlog/spdlog.h>

#include "utils/string_utils.h"
#include "utils/url_encode.h"

namespace airdl {

namespace {

bool isForbiddenChar(unsigned char c) {
    if (c < 0x20 || c == 0x7f) return true;
    switch (c) {
        case '<':
        case '>':
        case ':':
        case '"':
        case '/':
        case '\\':
        case '|':
        case '?':
        case '*':
            return true;
        default:
            return false;
    }
}

// Value of one parameter, quoted-string aware. Returns nullopt if absent.
std::optional<std::string> dispositionParam(const std::string& header, const std::string& key) {
    const std::string lower = toLowerAscii(header);
    size_t pos = 0;
    while ((pos = lower.find(key, pos)) != std::string::npos) {
        // must start a parameter: beginning, or preceded by ';' / whitespace
        size_t before = pos;
        while (before > 0 && (lower[before - 1] == ' ' || lower[before - 1] == '\t')) --before;
        if (before != 0 && lower[before - 1] != ';') {
            pos += key.size();
            continue;
        }
        size_t i = pos + key.size();
        while (i < header.size() && (header[i] == ' ' || header[i] == '\t')) ++i;
        if (i >= header.size() || header[i] != '=') {
            pos += key.size();
            continue;
        }
        ++i;
        while (i < header.size() && (header[i] == ' ' || header[i] == '\t')) ++i;
        std::string value;
        if (i < header.size() && header[i] == '"') {
            ++i;
            while (i < header.size() && header[i] != '"') {
                if (header[i] == '\\' && i + 1 < header.size()) ++i;
                value.push_back(header[i]);
                ++i;
            }
        } else {
            size_t end = header.find(';', i);
            value = trimAscii(header.substr(i, end == std::string::npos ? std::string::npos : end - i));
        }
        return value;
    }
    return std::nullopt;
}

std::string fallbackName() {
    const auto now = std::chrono::system_clock::now();
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return std::string(kFallbackFilenamePrefix) + std::to_string(secs);
}

}  // namespace

std::optional<std::string> filenameFromContentDisposition(const std::string& header_value) {
    if (auto extended = dispositionParam(header_value, "filename*")) {
        // charset'language'percent-encoded
        const auto first = extended->find('\'');
        const auto second = first == std::string::npos ? std::string::npos : extended->find('\'', first + 1);
        const std::string encoded = second == std::string::npos ? *extended : extended->substr(second + 1);
        auto decoded = urlDecode(encoded);
        if (!decoded.empty()) return decoded;
    }
    if (auto plain = dispositionParam(header_value, "filename")) {
        auto decoded = urlDecode(*plain);
        if (!decoded.empty()) return decoded;
    }
    return std::nullopt;
}

std::string lastPathSegment(const std::string& url) {
    std::string path = url;
    const auto cut = path.find_first_of("?#");
    if (cut != std::string::npos) path = path.substr(0, cut);
    const auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        const auto slash = path.find('/', scheme + 3);
        path = slash == std::string::npos ? std::string() : path.substr(slash);
    }
    while (!path.empty() && path.back() == '/') path.pop_back();
    const auto slash = path.find_last_of('/');
    return urlDecode(slash == std::string::npos ? path : path.substr(slash + 1));
}

std::string sanitizeFilename(const std::string& name) {
    // base component only; both separators count so "..\\x" cannot escape either
    std::string base = name;
    while (!base.empty() && (base.back() == '/' || base.back() == '\\')) base.pop_back();
    const auto sep = base.find_last_of("/\\");
    if (sep != std::string::npos) base = base.substr(sep + 1);

    std::string out;
    out.reserve(base.size());
    for (unsigned char c : base) {
        out.push_back(isForbiddenChar(c) ? '_' : static_cast<char>(c));
    }

    const std::string trimmed = trimAscii(out);
    if (trimmed.empty() || trimmed == "." || trimmed == "..") {
        spdlog::warn("FilenameResolver: sanitization of '{}' produced no usable name, using fallback", name);
        return fallbackName();
    }
    return out;
}

std::string resolveFilename(const httplib::Headers& headers, const std::string& final_url) {
    std::string candidate;
    auto it = headers.find("Content-Disposition");
    if (it != headers.end()) {
        if (auto from_header = filenameFromContentDisposition(it->second)) {
            candidate = *from_header;
        }
    }
    if (candidate.empty()) {
        candidate = lastPathSegment(final_url);
        spdlog::debug("FilenameResolver: no Content-Disposition filename, using URL segment '{}'", candidate);
    }
    return sanitizeFilename(candidate);
}

}  // namespace airdl
