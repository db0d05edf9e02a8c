#include "utils/cli.h"
#include "utils/string_utils.h"
#include "utils/version.h"
#include <cstring>
#include <fstream>
#include <sstream>

namespace airdl {

namespace {

const char* kUsageLine =
    "Usage: airdl (--url <URL>... | --air <AIR>...) --local-dir <DIR> [OPTIONS]\n";

bool isFlag(const char* arg, const char* long_name, const char* short_name = nullptr) {
    return std::strcmp(arg, long_name) == 0 || (short_name != nullptr && std::strcmp(arg, short_name) == 0);
}

bool looksLikeOption(const char* arg) {
    return arg[0] == '-' && arg[1] != '\0';
}

CliResult usageError(const std::string& message) {
    CliResult result;
    result.should_exit = true;
    result.exit_code = 1;
    result.output = "Error: " + message + "\n\n" + kUsageLine;
    return result;
}

}  // namespace

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "airdl " << AIRDL_VERSION << " - Batch CivitAI model downloader\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    airdl --url <URL|FILE>... --local-dir <DIR> [OPTIONS]\n";
    oss << "    airdl --air <AIR>... --local-dir <DIR> [OPTIONS]\n";
    oss << "\n";
    oss << "REFERENCES (exactly one of):\n";
    oss << "    -u, --url <URL|FILE>...   Download URLs, or text files listing one URL per line\n";
    oss << "                              e.g. https://civitai.com/api/download/models/746484?type=Model\n";
    oss << "    -a, --air <AIR>...        AIR resource names\n";
    oss << "                              e.g. urn:air:flux1:lora:civitai:667004@746484\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -l, --local-dir <DIR>     Output directory (required)\n";
    oss << "    --size <full|pruned>      Only download model files of this size\n";
    oss << "    --fp <8|16|32>            Only download model files of this precision\n";
    oss << "    --include-companions      Also download companion files (VAE, config)\n";
    oss << "    --force-unsafe            Allow non-SafeTensor model files (.ckpt, .pt)\n";
    oss << "    -t, --token <TOKEN>       CivitAI API token (or CIVITAI_TOKEN, ~/.civitai/config)\n";
    oss << "    --debug                   Print debug logs\n";
    oss << "    -h, --help                Print help information\n";
    oss << "    -V, --version             Print version information\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    CIVITAI_TOKEN             API token\n";
    oss << "    AIRDL_TOKEN_FILE          Token file (default: ~/.civitai/config)\n";
    oss << "    AIRDL_CONFIG              Config file path (default: ~/.airdl/config.json)\n";
    oss << "    AIRDL_REGISTRY_URL        Registry base URL (default: https://civitai.com)\n";
    oss << "    AIRDL_TIMEOUT_MS          HTTP timeout in milliseconds (default: 30000)\n";
    oss << "    AIRDL_CHUNK               Write chunk size in bytes (default: 16777216)\n";
    oss << "    AIRDL_MAX_REDIRECTS       Redirect limit (default: 10)\n";
    oss << "    AIRDL_LOG_LEVEL           Log level (trace|debug|info|warn|error)\n";
    oss << "    AIRDL_LOG_DIR             Log directory (default: ~/.airdl/logs)\n";
    oss << "    AIRDL_LOG_RETENTION_DAYS  Log retention days (default: 7)\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "airdl " << AIRDL_VERSION << "\n";
    return oss.str();
}

std::string referenceModeToString(ReferenceMode mode) {
    switch (mode) {
        case ReferenceMode::Url:
            return "url";
        case ReferenceMode::Air:
            return "air";
        case ReferenceMode::None:
            break;
    }
    return "none";
}

std::vector<std::string> readReferenceFile(const std::filesystem::path& path) {
    std::vector<std::string> out;
    std::ifstream ifs(path);
    std::string line;
    while (std::getline(ifs, line)) {
        const std::string trimmed = trimAscii(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;
        out.push_back(trimmed);
    }
    return out;
}

std::vector<std::string> expandReferenceFiles(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    for (const auto& arg : args) {
        std::error_code ec;
        if (arg.find("://") == std::string::npos && std::filesystem::is_regular_file(arg, ec)) {
            auto listed = readReferenceFile(arg);
            out.insert(out.end(), listed.begin(), listed.end());
        } else {
            out.push_back(arg);
        }
    }
    return out;
}

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;
    DownloadOptions& opts = result.options;

    for (int i = 1; i < argc; ++i) {
        if (isFlag(argv[i], "--help", "-h")) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getHelpMessage();
            return result;
        }
        if (isFlag(argv[i], "--version", "-V")) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getVersionMessage();
            return result;
        }
    }

    if (argc < 2) {
        return usageError("one of --url or --air is required");
    }

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const bool is_url = isFlag(arg, "--url", "-u");
        if (is_url || isFlag(arg, "--air", "-a")) {
            const ReferenceMode mode = is_url ? ReferenceMode::Url : ReferenceMode::Air;
            if (opts.mode != ReferenceMode::None && opts.mode != mode) {
                return usageError("--url and --air cannot be used together");
            }
            opts.mode = mode;
            const size_t before = opts.references.size();
            while (i + 1 < argc && !looksLikeOption(argv[i + 1])) {
                opts.references.emplace_back(argv[++i]);
            }
            if (opts.references.size() == before) {
                return usageError(std::string(arg) + " expects at least one value");
            }
        } else if (isFlag(arg, "--local-dir", "-l")) {
            if (i + 1 >= argc) return usageError("--local-dir expects a directory");
            opts.local_dir = argv[++i];
        } else if (isFlag(arg, "--size")) {
            if (i + 1 >= argc) return usageError("--size expects full or pruned");
            const std::string value = argv[++i];
            if (value != "full" && value != "pruned") {
                return usageError("invalid --size '" + value + "' (choose from full, pruned)");
            }
            opts.size = value;
        } else if (isFlag(arg, "--fp")) {
            if (i + 1 >= argc) return usageError("--fp expects 8, 16 or 32");
            const std::string value = argv[++i];
            if (value != "8" && value != "16" && value != "32") {
                return usageError("invalid --fp '" + value + "' (choose from 8, 16, 32)");
            }
            opts.fp = std::stoi(value);
        } else if (isFlag(arg, "--token", "-t")) {
            if (i + 1 >= argc) return usageError("--token expects a value");
            opts.token = std::string(argv[++i]);
        } else if (isFlag(arg, "--include-companions")) {
            opts.include_companions = true;
        } else if (isFlag(arg, "--force-unsafe")) {
            opts.force_unsafe = true;
        } else if (isFlag(arg, "--debug")) {
            opts.debug = true;
        } else {
            return usageError(std::string("unrecognized argument '") + arg + "'");
        }
    }

    if (opts.mode == ReferenceMode::None) {
        return usageError("one of --url or --air is required");
    }
    if (opts.local_dir.empty()) {
        return usageError("--local-dir is required");
    }
    if (opts.mode == ReferenceMode::Url) {
        opts.references = expandReferenceFiles(opts.references);
        if (opts.references.empty()) {
            return usageError("no URLs given");
        }
    }
    return result;
}

}  // namespace airdl
