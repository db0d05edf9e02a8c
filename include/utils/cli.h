#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "models/resource_ref.h"

namespace airdl {

/// Options for a download run
struct DownloadOptions {
    ReferenceMode mode{ReferenceMode::None};
    std::vector<std::string> references;
    std::string local_dir;
    std::optional<std::string> size;  // full | pruned
    std::optional<int> fp;            // 8 | 16 | 32
    bool include_companions{false};
    bool force_unsafe{false};
    bool debug{false};
    std::optional<std::string> token;
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    /// Parsed options, valid when should_exit is false
    DownloadOptions options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

/// Get the help message for the CLI
///
/// @return Help message string
std::string getHelpMessage();

/// Get the version message for the CLI
///
/// @return Version message string
std::string getVersionMessage();

/// Read one reference per line; blank lines and '#' comments are skipped.
std::vector<std::string> readReferenceFile(const std::filesystem::path& path);

/// Replace every argument naming an existing file with the references it lists.
std::vector<std::string> expandReferenceFiles(const std::vector<std::string>& args);

std::string referenceModeToString(ReferenceMode mode);

}  // namespace airdl
