#include "mx/cli/options.hpp"

#include <set>
#include <stdexcept>

namespace mx::cli {
namespace {

mx::Result<long> parse_long(const std::string& flag, const std::string& value, long min, long max) {
    long parsed = 0;
    std::size_t consumed = 0;
    try {
        parsed = std::stol(value, &consumed);
    } catch (const std::logic_error&) {
        return mx::Err("Invalid value for " + flag + ": " + value);
    }
    if (consumed != value.size() || parsed < min || parsed > max) {
        return mx::Err("Invalid value for " + flag + ": " + value);
    }
    return mx::Ok(parsed);
}

bool takes_value(const std::string& arg) {
    static const std::set<std::string> flags = {
        "-H", "--host", "--api-key", "-t", "--tags", "-j", "--jobs", "--source",
        "--description", "--original-date", "--connect-timeout", "--timeout",
    };
    return flags.count(arg) > 0;
}

} // namespace

mx::Result<Options> parse_args(const std::vector<std::string>& args,
                               std::optional<std::string> env_api_key) {
    Options options;
    bool positional_only = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (positional_only || arg.empty() || arg[0] != '-' || arg == "-") {
            options.paths.emplace_back(arg);
            continue;
        }

        if (arg == "--") {
            positional_only = true;
            continue;
        }

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
            return mx::Ok(std::move(options));
        }
        if (arg == "-v" || arg == "--verbose") {
            options.log_level = spdlog::level::debug;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            options.log_level = spdlog::level::warn;
            continue;
        }
        if (arg == "--abort-on-auth-error") {
            options.abort_on_auth_error = true;
            continue;
        }

        // Everything below takes a value
        if (i + 1 >= args.size()) {
            return mx::Err(takes_value(arg) ? arg + " requires a value" : "Unknown option: " + arg);
        }
        const std::string& value = args[i + 1];

        if (arg == "-H" || arg == "--host") {
            options.host = value;
        } else if (arg == "--api-key") {
            options.api_key = value;
        } else if (arg == "-t" || arg == "--tags") {
            options.finalize.tags = value;
        } else if (arg == "--source") {
            options.finalize.source = value;
        } else if (arg == "--description") {
            options.finalize.description = value;
        } else if (arg == "--original-date") {
            options.finalize.original_upload_date = value;
        } else if (arg == "-j" || arg == "--jobs") {
            auto jobs = parse_long(arg, value, 1, static_cast<long>(upload::kMaxWorkers));
            if (jobs.is_error()) {
                return mx::Err(jobs.error());
            }
            options.jobs = static_cast<std::size_t>(jobs.value());
        } else if (arg == "--connect-timeout") {
            auto secs = parse_long(arg, value, 0, 86400);
            if (secs.is_error()) {
                return mx::Err(secs.error());
            }
            options.connect_timeout_seconds = secs.value();
        } else if (arg == "--timeout") {
            auto secs = parse_long(arg, value, 0, 86400 * 7);
            if (secs.is_error()) {
                return mx::Err(secs.error());
            }
            options.timeout_seconds = secs.value();
        } else {
            return mx::Err("Unknown option: " + arg);
        }
        ++i;
    }

    if (options.api_key.empty() && env_api_key.has_value()) {
        options.api_key = *env_api_key;
    }
    if (options.api_key.empty()) {
        return mx::Err(std::string("Missing API key (use --api-key or ") + kApiKeyEnv + ")");
    }
    if (options.finalize.tags.empty()) {
        return mx::Err("Missing required option --tags");
    }
    if (options.paths.empty()) {
        return mx::Err("No files or directories given");
    }

    return mx::Ok(std::move(options));
}

void print_usage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name << " [OPTIONS] --tags TAGS FILE...\n\n";
    out << "Upload video files (or directories of them, recursively) to the archive.\n\n";
    out << "Options:\n";
    out << "  -H, --host URL            Archive base URL (default: " << kDefaultHost << ")\n";
    out << "      --api-key KEY         API key (default: $" << kApiKeyEnv << ")\n";
    out << "  -t, --tags TAGS           Tags applied to every upload (required)\n";
    out << "  -j, --jobs N              Concurrent uploads, 1-" << upload::kMaxWorkers
        << " (default: " << upload::kDefaultWorkers << ")\n";
    out << "      --source TEXT         Source recorded with each upload\n";
    out << "      --description TEXT    Description recorded with each upload\n";
    out << "      --original-date DATE  Original upload date recorded with each upload\n";
    out << "      --connect-timeout S   Connect timeout per request (default: 30)\n";
    out << "      --timeout S           Total timeout per request, 0 = none (default: 0)\n";
    out << "      --abort-on-auth-error Stop starting uploads once the API key is rejected\n";
    out << "  -v, --verbose             Debug logging\n";
    out << "  -q, --quiet               Warnings and errors only\n";
    out << "  -h, --help                Show this help message\n";
    out << "\n";
    out << "Examples:\n";
    out << "  " << program_name << " --api-key KEY -t \"spin trick\" clip.mp4\n";
    out << "  " << program_name << " -j 8 -t contest ~/Videos/contest\n";
}

} // namespace mx::cli
