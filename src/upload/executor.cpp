#include "mx/upload/executor.hpp"
#include "mx/core/thread_safe_queue.hpp"
#include "mx/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <system_error>
#include <thread>

namespace mx::upload {

std::size_t ExecutionReport::succeeded() const {
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(), is_success));
}

std::size_t ExecutionReport::failed() const {
    return outcomes.size() - succeeded();
}

UploadExecutor::UploadExecutor(archive::ProtocolClient& client,
                               events::EventBus& bus,
                               ExecutorConfig config,
                               CancellationToken* cancellation)
    : client_(client),
      bus_(bus),
      config_(config),
      cancellation_(cancellation) {
    config_.workers = std::clamp<std::size_t>(config_.workers, 1, kMaxWorkers);
}

ExecutionReport UploadExecutor::run(const std::vector<std::filesystem::path>& targets,
                                    const archive::FinalizeOptions& options) {
    ExecutionReport report;

    if (targets.empty()) {
        report.nothing_to_do = true;
        bus_.emit(events::NothingToUploadEvent{});
        return report;
    }

    const auto start = std::chrono::steady_clock::now();
    const std::size_t worker_count = std::min(config_.workers, targets.size());
    bus_.emit(events::BatchStartedEvent{targets.size(), options.tags, worker_count});

    ThreadSafeQueue<std::filesystem::path> queue;
    for (const auto& target : targets) {
        queue.push(target);
        bus_.emit(events::UploadQueuedEvent{target});
    }
    queue.close();

    std::mutex outcomes_mutex;
    report.outcomes.reserve(targets.size());

    // Tripped by the first Auth failure; only gates tasks not yet started
    CancellationToken auth_abort;
    auto should_skip = [&]() {
        return auth_abort.is_cancelled()
            || (cancellation_ != nullptr && cancellation_->is_cancelled());
    };

    auto worker_loop = [&]() {
        while (auto path = queue.pop()) {
            TaskOutcome outcome;
            if (should_skip()) {
                auto error = archive::UploadError::cancelled();
                bus_.emit(events::UploadFailedEvent{*path, error, to_string(TaskState::Pending)});
                outcome = UploadFailure{*path, std::move(error), TaskState::Pending};
            } else {
                outcome = run_upload_task(*path, client_, options, bus_);
            }

            if (config_.abort_on_auth_error) {
                const auto* failure = std::get_if<UploadFailure>(&outcome);
                if (failure != nullptr && failure->error.kind == archive::ErrorKind::Auth
                    && !auth_abort.is_cancelled()) {
                    spdlog::error("Credential rejected, skipping uploads not yet started");
                    auth_abort.cancel();
                }
            }

            std::lock_guard lock(outcomes_mutex);
            report.outcomes.push_back(std::move(outcome));
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        try {
            workers.emplace_back(worker_loop);
        } catch (const std::system_error& e) {
            spdlog::warn("Started {} of {} upload workers: {}", workers.size(), worker_count, e.what());
            break;
        }
    }
    if (workers.empty()) {
        // The queue is closed, so the calling thread can drain it alone
        worker_loop();
    }
    for (auto& worker : workers) {
        worker.join();
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    bus_.emit(events::BatchCompletedEvent{report.succeeded(), report.failed(), elapsed});

    return report;
}

} // namespace mx::upload
