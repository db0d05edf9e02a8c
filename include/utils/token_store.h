#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace airdl {

/// Where the bearer token came from (for diagnostics only; the value is never logged).
enum class TokenSource {
    None,
    CommandLine,
    Environment,
    File,
    Prompt,
};

std::string tokenSourceToString(TokenSource source);

struct ResolvedToken {
    std::optional<std::string> value;
    TokenSource source{TokenSource::None};
};

/// Persisted registry token (plain text file, one line).
class TokenStore {
public:
    /// @param path Token file path (default: AIRDL_TOKEN_FILE or ~/.civitai/config)
    explicit TokenStore(std::filesystem::path path = defaultPath());

    static std::filesystem::path defaultPath();

    /// Read and trim the stored token. Empty file or missing file -> nullopt.
    std::optional<std::string> load() const;

    /// Write the token, creating parent directories. Mode 0600 on POSIX.
    bool save(const std::string& token) const;

    /// Resolve in order: explicit value, CIVITAI_TOKEN, token file, prompt.
    /// The prompt is only used when prompt_in is non-null; an entered token is saved.
    ResolvedToken resolve(const std::optional<std::string>& explicit_token,
                          std::istream* prompt_in = nullptr,
                          std::ostream* prompt_out = nullptr) const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace airdl
