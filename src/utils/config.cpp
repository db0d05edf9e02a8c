#include "utils/config.h"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <spdlog/spdlog.h>
#ifdef _WIN32
#include <windows.h>
#endif

namespace airdl {

namespace {

constexpr size_t kMaxChunkSize = 256u * 1024u * 1024u;
constexpr int kMaxRedirectLimit = 50;

bool applyChunk(DownloadConfig& cfg, long long v) {
    if (v <= 0 || static_cast<unsigned long long>(v) > kMaxChunkSize) return false;
    cfg.chunk_size = static_cast<size_t>(v);
    return true;
}

bool applyRedirects(DownloadConfig& cfg, long long v) {
    if (v < 0 || v > kMaxRedirectLimit) return false;
    cfg.max_redirects = static_cast<int>(v);
    return true;
}

bool applyTimeout(DownloadConfig& cfg, long long ms) {
    if (ms <= 0) return false;
    cfg.timeout = std::chrono::milliseconds(ms);
    return true;
}

}  // namespace

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
#ifdef _WIN32
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    DWORD size = GetEnvironmentVariableA(name, nullptr, 0);
    if (size == 0) {
        return std::nullopt;
    }
    std::string value(size, '\0');
    DWORD copied = GetEnvironmentVariableA(name, value.data(), size);
    value.resize(copied);
    return value;
#else
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
#endif
}

std::filesystem::path defaultConfigPath() {
    auto home = getEnvValue("HOME");
    if (!home || home->empty()) {
        home = getEnvValue("USERPROFILE");
    }
    if (!home || home->empty()) return std::filesystem::path();
    return std::filesystem::path(*home) / ".airdl" / "config.json";
}

DownloadConfig loadDownloadConfig() {
    auto info = loadDownloadConfigWithLog();
    return info.first;
}

std::pair<DownloadConfig, std::string> loadDownloadConfigWithLog() {
    DownloadConfig cfg;
    std::ostringstream log;
    bool used_file = false;
    bool used_env = false;

    // Optional JSON config file: path from AIRDL_CONFIG or ~/.airdl/config.json
    auto load_from_file = [&](const std::filesystem::path& path) {
        if (path.empty() || !std::filesystem::exists(path)) return false;
        std::ifstream ifs(path);
        if (!ifs.is_open()) return false;

        auto j = nlohmann::json::parse(ifs, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            spdlog::warn("Config: ignoring malformed config file '{}'", path.string());
            return false;
        }
        if (j.contains("registry_url") && j["registry_url"].is_string()) {
            cfg.registry_base_url = j["registry_url"].get<std::string>();
        }
        if (j.contains("registry_name") && j["registry_name"].is_string()) {
            cfg.registry_name = j["registry_name"].get<std::string>();
        }
        if (j.contains("registry_domain") && j["registry_domain"].is_string()) {
            cfg.registry_domain = j["registry_domain"].get<std::string>();
        }
        if (j.contains("timeout_ms") && j["timeout_ms"].is_number_integer()) {
            applyTimeout(cfg, j["timeout_ms"].get<long long>());
        }
        if (j.contains("chunk") && j["chunk"].is_number_integer()) {
            applyChunk(cfg, j["chunk"].get<long long>());
        }
        if (j.contains("max_redirects") && j["max_redirects"].is_number_integer()) {
            applyRedirects(cfg, j["max_redirects"].get<long long>());
        }
        if (j.contains("user_agent") && j["user_agent"].is_string()) {
            cfg.user_agent = j["user_agent"].get<std::string>();
        }
        log << "file=" << path.string() << " ";
        return true;
    };

    if (auto env = getEnvValue("AIRDL_CONFIG")) {
        used_file = load_from_file(*env);
    } else {
        used_file = load_from_file(defaultConfigPath());
    }

    if (auto env = getEnvValue("AIRDL_REGISTRY_URL")) {
        if (!env->empty()) {
            cfg.registry_base_url = *env;
            log << "env:REGISTRY_URL=" << *env << " ";
            used_env = true;
        }
    }

    if (auto env = getEnvValue("AIRDL_TIMEOUT_MS")) {
        try {
            long long ms = std::stoll(*env);
            if (applyTimeout(cfg, ms)) {
                log << "env:TIMEOUT_MS=" << ms << " ";
                used_env = true;
            }
        } catch (const std::exception&) {
            spdlog::warn("Config: ignoring invalid AIRDL_TIMEOUT_MS='{}'", *env);
        }
    }

    if (auto env = getEnvValue("AIRDL_CHUNK")) {
        try {
            long long v = std::stoll(*env);
            if (applyChunk(cfg, v)) {
                log << "env:CHUNK=" << v << " ";
                used_env = true;
            }
        } catch (const std::exception&) {
            spdlog::warn("Config: ignoring invalid AIRDL_CHUNK='{}'", *env);
        }
    }

    if (auto env = getEnvValue("AIRDL_MAX_REDIRECTS")) {
        try {
            long long v = std::stoll(*env);
            if (applyRedirects(cfg, v)) {
                log << "env:MAX_REDIRECTS=" << v << " ";
                used_env = true;
            }
        } catch (const std::exception&) {
            spdlog::warn("Config: ignoring invalid AIRDL_MAX_REDIRECTS='{}'", *env);
        }
    }

    if (auto env = getEnvValue("AIRDL_USER_AGENT")) {
        if (!env->empty()) {
            cfg.user_agent = *env;
            log << "env:USER_AGENT=" << *env << " ";
            used_env = true;
        }
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

}  // namespace airdl
