#pragma once

#include <optional>
#include <string>

namespace airdl {

/// Failure taxonomy shared by every pipeline stage.
enum class DownloadErrorCode : int {
    kOk = 0,
    kInvalidReference = 1,
    kUnsupportedSource = 2,
    kMetadataFetchFailed = 3,
    kNoMatchingFiles = 4,
    kAccessDenied = 5,
    kNotFound = 6,
    kUpstreamError = 7,
    kUnexpectedContentType = 8,
    kIoFailure = 9,
    kNetworkFailure = 10,
    kUnexpectedStatus = 11,
    kTooManyRedirects = 12,
    kCancelled = 13,
};

inline const char* to_string(DownloadErrorCode code) {
    switch (code) {
        case DownloadErrorCode::kOk:
            return "OK";
        case DownloadErrorCode::kInvalidReference:
            return "INVALID_REFERENCE";
        case DownloadErrorCode::kUnsupportedSource:
            return "UNSUPPORTED_SOURCE";
        case DownloadErrorCode::kMetadataFetchFailed:
            return "METADATA_FETCH_FAILED";
        case DownloadErrorCode::kNoMatchingFiles:
            return "NO_MATCHING_FILES";
        case DownloadErrorCode::kAccessDenied:
            return "ACCESS_DENIED";
        case DownloadErrorCode::kNotFound:
            return "NOT_FOUND";
        case DownloadErrorCode::kUpstreamError:
            return "UPSTREAM_ERROR";
        case DownloadErrorCode::kUnexpectedContentType:
            return "UNEXPECTED_CONTENT_TYPE";
        case DownloadErrorCode::kIoFailure:
            return "IO_FAILURE";
        case DownloadErrorCode::kNetworkFailure:
            return "NETWORK_FAILURE";
        case DownloadErrorCode::kUnexpectedStatus:
            return "UNEXPECTED_STATUS";
        case DownloadErrorCode::kTooManyRedirects:
            return "TOO_MANY_REDIRECTS";
        case DownloadErrorCode::kCancelled:
            return "CANCELLED";
    }
    return "UNKNOWN";
}

/// Result of a pipeline stage (generic template)
template<typename T>
struct DownloadOutcome {
    DownloadErrorCode code{DownloadErrorCode::kOk};
    std::string message;
    std::optional<T> data;

    bool ok() const { return code == DownloadErrorCode::kOk; }

    static DownloadOutcome success(T value) {
        DownloadOutcome out;
        out.data = std::move(value);
        return out;
    }

    static DownloadOutcome failure(DownloadErrorCode code, std::string message) {
        DownloadOutcome out;
        out.code = code;
        out.message = std::move(message);
        return out;
    }
};

/// Specialization for stages that only report success or failure
template<>
struct DownloadOutcome<void> {
    DownloadErrorCode code{DownloadErrorCode::kOk};
    std::string message;

    bool ok() const { return code == DownloadErrorCode::kOk; }
};

/// Map a final HTTP status of a transfer to its failure class.
/// Returns kOk for 2xx.
inline DownloadErrorCode classifyTransferStatus(int status) {
    if (status >= 200 && status < 300) return DownloadErrorCode::kOk;
    if (status == 400 || status == 401 || status == 403) return DownloadErrorCode::kAccessDenied;
    if (status == 404 || status == 410) return DownloadErrorCode::kNotFound;
    if (status >= 500 && status < 600) return DownloadErrorCode::kUpstreamError;
    return DownloadErrorCode::kUnexpectedStatus;
}

}  // namespace airdl
