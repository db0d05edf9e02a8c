#pragma once

#include <optional>
#include <string>

#include <httplib.h>

namespace airdl {

/// Prefix of the name used when nothing usable survives sanitization.
inline constexpr const char* kFallbackFilenamePrefix = "civitai_download_";

/// Extract the filename parameter of a Content-Disposition value, percent-decoded.
/// filename*=UTF-8''... is preferred over filename=... when both are present.
std::optional<std::string> filenameFromContentDisposition(const std::string& header_value);

/// Last path segment of a URL (query and fragment ignored), percent-decoded.
std::string lastPathSegment(const std::string& url);

/// Reduce to a base name and replace < > : " / \ | ? * and control characters with '_'.
/// Empty, blank, "." and ".." results become kFallbackFilenamePrefix + unix time.
std::string sanitizeFilename(const std::string& name);

/// Content-Disposition filename, else last segment of final_url; always sanitized.
std::string resolveFilename(const httplib::Headers& headers, const std::string& final_url);

}  // namespace airdl
