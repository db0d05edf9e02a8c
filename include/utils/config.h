#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace airdl {

struct DownloadConfig {
    std::string registry_base_url{"https://civitai.com"};
    std::string registry_name{"civitai"};
    std::string registry_domain{"civitai.com"};
    std::chrono::milliseconds timeout{30000};
    size_t chunk_size{16 * 1024 * 1024};
    int max_redirects{10};
    std::string user_agent;  // empty -> "airdl/<version>"
};

DownloadConfig loadDownloadConfig();

// Returns the config and a description of the sources applied
// (e.g. "file=/home/u/.airdl/config.json env:CHUNK=1024 |sources=env,file").
std::pair<DownloadConfig, std::string> loadDownloadConfigWithLog();

std::optional<std::string> getEnvValue(const char* name);

// ~/.airdl/config.json, empty if HOME is unset.
std::filesystem::path defaultConfigPath();

}  // namespace airdl
