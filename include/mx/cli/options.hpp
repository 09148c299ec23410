#pragma once

#include "mx/archive/types.hpp"
#include "mx/core/result.hpp"
#include "mx/upload/executor.hpp"

#include <spdlog/common.h>

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace mx::cli {

constexpr const char* kDefaultHost = "https://spin-archive.org";
constexpr const char* kApiKeyEnv = "MX_API_KEY";

struct Options {
    std::string host = kDefaultHost;
    std::string api_key;
    archive::FinalizeOptions finalize;  ///< tags, source, description, original date
    std::size_t jobs = upload::kDefaultWorkers;
    long connect_timeout_seconds = 30;
    long timeout_seconds = 0;
    bool abort_on_auth_error = false;
    spdlog::level::level_enum log_level = spdlog::level::info;
    bool show_help = false;
    std::vector<std::filesystem::path> paths;
};

/**
 * @brief Parse command-line arguments (without the program name)
 *
 * @param env_api_key Value of MX_API_KEY, used when --api-key is absent
 *
 * ERRORS: unknown option, missing or malformed value, missing --tags,
 * missing API key, no FILE arguments. With --help nothing else is checked.
 */
mx::Result<Options> parse_args(const std::vector<std::string>& args,
                               std::optional<std::string> env_api_key = std::nullopt);

void print_usage(std::ostream& out, const char* program_name);

} // namespace mx::cli
