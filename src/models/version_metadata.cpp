#include "models/version_metadata.h"

#include "utils/string_utils.h"

namespace airdl {

namespace {

std::optional<std::string> optionalString(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key) || !obj[key].is_string()) return std::nullopt;
    return obj[key].get<std::string>();
}

std::string idToString(const nlohmann::json& value) {
    if (value.is_number_integer()) return std::to_string(value.get<int64_t>());
    if (value.is_string()) return value.get<std::string>();
    return "";
}

}  // namespace

std::optional<int> normalizeFp(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    if (value.is_number_float()) {
        return static_cast<int>(value.get<double>());
    }
    if (!value.is_string()) {
        return std::nullopt;
    }
    std::string text = toLowerAscii(trimAscii(value.get<std::string>()));
    if (startsWith(text, "fp")) {
        text = text.substr(2);
    }
    if (!isAllDigits(text) || text.size() > 3) {
        return std::nullopt;
    }
    return std::stoi(text);
}

std::optional<VersionMetadata> decodeVersionMetadata(const nlohmann::json& body, std::string* error) {
    if (!body.is_object()) {
        if (error) *error = "metadata response is not a JSON object";
        return std::nullopt;
    }
    if (!body.contains("files") || !body["files"].is_array()) {
        if (error) *error = "metadata response missing files array";
        return std::nullopt;
    }

    VersionMetadata out;
    if (body.contains("id")) out.version_id = idToString(body["id"]);
    if (body.contains("modelId") && body["modelId"].is_number_integer()) {
        out.model_id = body["modelId"].get<int64_t>();
    }
    out.name = optionalString(body, "name").value_or("");
    out.base_model = optionalString(body, "baseModel").value_or("");

    for (const auto& entry : body["files"]) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            continue;
        }
        FileDescriptor file;
        file.name = entry["name"].get<std::string>();
        file.type = optionalString(entry, "type").value_or("");
        if (entry.contains("id") && entry["id"].is_number_integer()) {
            file.id = entry["id"].get<int64_t>();
        }
        if (entry.contains("sizeKB") && entry["sizeKB"].is_number()) {
            file.size_kb = entry["sizeKB"].get<double>();
        }
        file.download_url = optionalString(entry, "downloadUrl");
        if (entry.contains("primary") && entry["primary"].is_boolean()) {
            file.primary = entry["primary"].get<bool>();
        }
        if (entry.contains("metadata") && entry["metadata"].is_object()) {
            const auto& meta = entry["metadata"];
            file.metadata.format = optionalString(meta, "format");
            file.metadata.size = optionalString(meta, "size");
            if (meta.contains("fp")) {
                file.metadata.fp = normalizeFp(meta["fp"]);
            }
        }
        out.files.push_back(std::move(file));
    }
    return out;
}

std::optional<VersionMetadata> parseVersionMetadata(const std::string& body, std::string* error) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        if (error) *error = "metadata response is not valid JSON";
        return std::nullopt;
    }
    return decodeVersionMetadata(j, error);
}

}  // namespace airdl
