/**
 * @file main.cpp
 * @brief mx - bulk upload of video files to the archive
 *
 * USAGE:
 *   mx --api-key KEY --tags "tag1 tag2" clip.mp4 videos/
 *   MX_API_KEY=KEY mx -j 8 -t tag videos/
 */

#include "mx/archive/client.hpp"
#include "mx/cli/app.hpp"
#include "mx/cli/options.hpp"
#include "mx/core/cancellation.hpp"
#include "mx/net/http_client.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// Global token for signal handling
mx::CancellationToken* g_cancellation = nullptr;

void signal_handler(int signal) {
    if ((signal == SIGINT || signal == SIGTERM) && g_cancellation) {
        g_cancellation->cancel();
    }
}

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::vector<std::string> args(argv + 1, argv + argc);
    std::optional<std::string> env_api_key;
    if (const char* key = std::getenv(mx::cli::kApiKeyEnv)) {
        env_api_key = key;
    }

    auto parsed = mx::cli::parse_args(args, env_api_key);
    if (parsed.is_error()) {
        spdlog::error("{}", parsed.error());
        std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
        return mx::cli::kExitFailure;
    }
    const auto& options = parsed.value();

    if (options.show_help) {
        mx::cli::print_usage(std::cout, argv[0]);
        return mx::cli::kExitOk;
    }

    spdlog::set_level(options.log_level);

    mx::CancellationToken cancellation;
    g_cancellation = &cancellation;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    mx::net::HttpClientConfig http_config;
    http_config.connect_timeout_seconds = options.connect_timeout_seconds;
    http_config.timeout_seconds = options.timeout_seconds;

    mx::net::HttpClient http(http_config, &cancellation);
    mx::archive::ArchiveClient client(options.host, options.api_key, http);

    spdlog::debug("Archive host: {}, workers: {}", options.host, options.jobs);

    const int exit_code = mx::cli::run(options, client, std::cout, std::cerr, &cancellation);

    g_cancellation = nullptr;
    return exit_code;
}
