#include "utils/token_store.h"

#include <fstream>
#include <iostream>
#include <spdlog/spdlog.h>

#include "utils/config.h"
#include "utils/string_utils.h"

namespace fs = std::filesystem;

namespace airdl {

std::string tokenSourceToString(TokenSource source) {
    switch (source) {
        case TokenSource::None:
            return "none";
        case TokenSource::CommandLine:
            return "command line";
        case TokenSource::Environment:
            return "environment";
        case TokenSource::File:
            return "token file";
        case TokenSource::Prompt:
            return "prompt";
    }
    return "unknown";
}

TokenStore::TokenStore(fs::path path) : path_(std::move(path)) {}

fs::path TokenStore::defaultPath() {
    if (auto env = getEnvValue("AIRDL_TOKEN_FILE")) {
        if (!env->empty()) return fs::path(*env);
    }
    auto home = getEnvValue("HOME");
    if (!home || home->empty()) {
        home = getEnvValue("USERPROFILE");
    }
    if (!home || home->empty()) {
        return fs::path(".civitai") / "config";
    }
    return fs::path(*home) / ".civitai" / "config";
}

std::optional<std::string> TokenStore::load() const {
    std::error_code ec;
    if (path_.empty() || !fs::exists(path_, ec)) {
        return std::nullopt;
    }
    std::ifstream ifs(path_);
    if (!ifs.is_open()) {
        spdlog::warn("TokenStore: failed to open token file '{}'", path_.string());
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    auto token = trimAscii(content);
    if (token.empty()) return std::nullopt;
    return token;
}

bool TokenStore::save(const std::string& token) const {
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            spdlog::warn("TokenStore: failed to create '{}': {}", path_.parent_path().string(), ec.message());
            return false;
        }
    }
    std::ofstream ofs(path_, std::ios::trunc);
    if (!ofs.is_open()) {
        spdlog::warn("TokenStore: failed to open token file for write path='{}'", path_.string());
        return false;
    }
    ofs << token;
    ofs.flush();
    if (!ofs.good()) {
        spdlog::warn("TokenStore: failed to write token file path='{}'", path_.string());
        return false;
    }
    ofs.close();
#ifndef _WIN32
    fs::permissions(path_, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("TokenStore: failed to restrict permissions on '{}': {}", path_.string(), ec.message());
    }
#endif
    return true;
}

ResolvedToken TokenStore::resolve(const std::optional<std::string>& explicit_token,
                                  std::istream* prompt_in,
                                  std::ostream* prompt_out) const {
    ResolvedToken out;
    if (explicit_token && !trimAscii(*explicit_token).empty()) {
        out.value = trimAscii(*explicit_token);
        out.source = TokenSource::CommandLine;
        return out;
    }
    if (auto env = getEnvValue("CIVITAI_TOKEN")) {
        auto token = trimAscii(*env);
        if (!token.empty()) {
            out.value = token;
            out.source = TokenSource::Environment;
            return out;
        }
    }
    if (auto stored = load()) {
        out.value = *stored;
        out.source = TokenSource::File;
        return out;
    }
    if (prompt_in) {
        if (prompt_out) {
            *prompt_out << "Enter your CivitAI API token (leave empty for anonymous access): " << std::flush;
        }
        std::string line;
        if (std::getline(*prompt_in, line)) {
            auto token = trimAscii(line);
            if (!token.empty()) {
                if (!save(token)) {
                    spdlog::warn("TokenStore: token will be used for this run only");
                }
                out.value = token;
                out.source = TokenSource::Prompt;
                return out;
            }
        }
    }
    return out;
}

}  // namespace airdl
