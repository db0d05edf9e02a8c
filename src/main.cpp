#include <atomic>
#include <iostream>
#include <signal.h>

#include "cli/commands.h"
#include "utils/cli.h"
#include "utils/logger.h"

namespace {

std::atomic<bool> g_cancel_requested{false};

void signalHandler(int) {
    g_cancel_requested.store(true);
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse CLI arguments first
    auto cli_result = airdl::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    airdl::logger::init_from_env(cli_result.options.debug);

    // Ctrl-C stops the current stream after its next chunk; the partial file stays
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    return airdl::cli::commands::download(cli_result.options, &g_cancel_requested);
}
