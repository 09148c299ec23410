#include "mx/cli/app.hpp"
#include "mx/discovery/discovery.hpp"
#include "mx/events/components.hpp"
#include "mx/upload/executor.hpp"

#include <spdlog/spdlog.h>

namespace mx::cli {

int run(const Options& options,
        archive::ProtocolClient& client,
        std::ostream& out,
        std::ostream& err,
        CancellationToken* cancellation) {
    auto candidates = discovery::collect_candidates(options.paths);
    if (candidates.is_error()) {
        err << candidates.error() << "\n";
        return kExitFailure;
    }

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::StatsComponent stats(bus);
    events::ReporterComponent reporter(bus, out, err);

    upload::ExecutorConfig config;
    config.workers = options.jobs;
    config.abort_on_auth_error = options.abort_on_auth_error;

    upload::UploadExecutor executor(client, bus, config, cancellation);
    const auto report = executor.run(candidates.value(), options.finalize);

    if (report.nothing_to_do) {
        err << "No video files found.\n";
        return kExitFailure;
    }

    stats.print_stats();
    if (cancellation != nullptr && cancellation->is_cancelled()) {
        spdlog::warn("Run cancelled; {} of {} files uploaded", report.succeeded(), report.outcomes.size());
    }
    return kExitOk;
}

} // namespace mx::cli
