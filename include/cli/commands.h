#pragma once

#include <atomic>

#include "utils/cli.h"

namespace airdl {
namespace cli {
namespace commands {

/// Execute a download run
/// @param options Parsed command line options
/// @param cancel Set asynchronously (e.g. from SIGINT) to stop after the current chunk
/// @return Exit code (0=every reference succeeded, 1=at least one failed)
int download(const DownloadOptions& options, const std::atomic<bool>* cancel = nullptr);

}  // namespace commands
}  // namespace cli
}  // namespace airdl
