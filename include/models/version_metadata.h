#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace airdl {

struct FileMetadata {
    std::optional<std::string> format;  // e.g. "SafeTensor", "PickleTensor"
    std::optional<std::string> size;    // "full" | "pruned"
    std::optional<int> fp;              // 8 | 16 | 32
};

struct FileDescriptor {
    std::string name;
    std::string type;  // "Model", "VAE", "Other", "Config", ...
    FileMetadata metadata;
    std::optional<int64_t> id;
    std::optional<double> size_kb;
    std::optional<std::string> download_url;
    bool primary{false};
};

/// File manifest of one model version as returned by /api/v1/model-versions/{id}.
struct VersionMetadata {
    std::string version_id;
    std::optional<int64_t> model_id;
    std::string name;
    std::string base_model;
    std::vector<FileDescriptor> files;
};

/// Normalize the registry's precision field ("fp16", "16", 16) to a bit width.
std::optional<int> normalizeFp(const nlohmann::json& value);

/// Decode a version metadata document. Returns nullopt and sets error when
/// the body is not an object with a "files" array.
std::optional<VersionMetadata> decodeVersionMetadata(const nlohmann::json& body, std::string* error = nullptr);

std::optional<VersionMetadata> parseVersionMetadata(const std::string& body, std::string* error = nullptr);

}  // namespace airdl
