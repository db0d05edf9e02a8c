// airdl download: resolve references, pick files, stream them to --local-dir

#include "cli/commands.h"
#include "cli/progress_renderer.h"
#include "models/download_pipeline.h"
#include "models/filename_resolver.h"
#include "utils/config.h"
#include "utils/token_store.h"
#include <iostream>
#include <string>
#include <spdlog/spdlog.h>

#ifdef _WIN32
#include <io.h>
#include <cstdio>
#else
#include <unistd.h>
#endif

namespace airdl {
namespace cli {
namespace commands {

namespace {

bool stdinIsTerminal() {
#ifdef _WIN32
    return _isatty(_fileno(stdin)) != 0;
#else
    return isatty(STDIN_FILENO) != 0;
#endif
}

}  // namespace

int download(const DownloadOptions& options, const std::atomic<bool>* cancel) {
    auto [cfg, cfg_log] = loadDownloadConfigWithLog();
    spdlog::info("download: config {}", cfg_log);

    TokenStore store;
    auto token = store.resolve(options.token, stdinIsTerminal() ? &std::cin : nullptr, &std::cerr);
    spdlog::info("download: token source={}", tokenSourceToString(token.source));
    if (!token.value) {
        std::cerr << "Warning: no CivitAI token found; only public models can be downloaded" << std::endl;
    }

    SelectionConstraints constraints;
    constraints.size = options.size;
    constraints.fp = options.fp;
    constraints.include_companions = options.include_companions;
    constraints.allow_unsafe_format = options.force_unsafe;

    DownloadPipeline pipeline(cfg, token.value, options.local_dir, constraints);
    pipeline.setCancelFlag(cancel);
    pipeline.setReferenceMode(options.mode);

    ProgressRenderer progress(std::cout);
    bool transfer_active = false;

    PipelineCallbacks callbacks;
    callbacks.on_resolved = [&](const std::string& raw, const std::string& url,
                                const std::optional<std::string>& format) {
        const char* kind = options.mode == ReferenceMode::Air ? "AIR" : "URL";
        std::cout << "Found " << kind << ": " << raw << " -> " << url
                  << " (format: " << format.value_or("unknown") << ")" << std::endl;
    };
    callbacks.on_selection = [&](const std::string&, const std::vector<FileDecision>& decisions) {
        for (const auto& d : decisions) {
            switch (d.decision) {
                case SelectionDecision::Included:
                    std::cout << "Found file: " << d.name << std::endl;
                    break;
                case SelectionDecision::SkippedCompanion:
                    std::cout << "Skipping companion file " << d.name << std::endl;
                    break;
                case SelectionDecision::SkippedUnsafe:
                    std::cout << "Skipping unsafe file " << d.name << " (type: " << d.type << ")" << std::endl;
                    break;
                case SelectionDecision::SkippedConstraintMismatch:
                case SelectionDecision::SkippedOtherType:
                    spdlog::debug("download: {} {}", d.name, selectionDecisionToString(d.decision));
                    break;
            }
        }
    };
    callbacks.on_transfer_start = [&](const std::string& url) {
        std::cout << "Downloading " << url << "..." << std::endl;
        progress.start(lastPathSegment(url));
        transfer_active = true;
    };
    callbacks.on_progress = [&](const std::string&, size_t downloaded, size_t total) {
        progress.update(downloaded, total);
    };
    callbacks.on_transfer_complete = [&](const TransferResult& result) {
        transfer_active = false;
        if (!result.redirects.empty()) {
            std::cout << "\nRedirected " << result.redirects.size() << " times:" << std::endl;
            for (const auto& hop : result.redirects) {
                std::cout << " - " << hop.status << " -> " << hop.url << std::endl;
            }
        }
        progress.complete(result.local_path.string(), result.bytes_written,
                          std::chrono::duration<double>(result.elapsed).count());
    };
    callbacks.on_transfer_failed = [&](const std::string& url, DownloadErrorCode code, const std::string& message) {
        if (transfer_active) {
            progress.fail(message);
            transfer_active = false;
        }
        std::cerr << "Failed to download file " << url << ": " << message << " [" << to_string(code) << "]"
                  << std::endl;
    };
    callbacks.on_reference_failed = [&](const std::string& raw, DownloadErrorCode code, const std::string& message) {
        std::cerr << "Failed to download " << raw << ": " << message << " [" << to_string(code) << "]" << std::endl;
    };
    pipeline.setCallbacks(std::move(callbacks));

    const int rc = pipeline.run(options.references);
    if (cancel && cancel->load()) {
        std::cerr << "Interrupted; partial files were left in " << options.local_dir << std::endl;
    }
    return rc;
}

}  // namespace commands
}  // namespace cli
}  // namespace airdl
