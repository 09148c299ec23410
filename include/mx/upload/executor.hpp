/**
 * @file executor.hpp
 * @brief Bounded worker pool running one upload task per file
 *
 * ARCHITECTURE:
 * Targets are pushed into a ThreadSafeQueue which is then closed. A fixed
 * set of worker threads pops paths until the queue drains; each worker
 * runs a task to its terminal outcome before taking the next path, so at
 * most `workers` tasks are ever in flight.
 *
 *   paths -> [queue] -> worker 1..N -> run_upload_task -> outcomes
 *
 * Tasks share nothing but the queue and the outcome list. A failing task
 * never affects its siblings; run() returns only when every target has an
 * outcome.
 */

#pragma once

#include "mx/archive/client.hpp"
#include "mx/core/cancellation.hpp"
#include "mx/events/event_bus.hpp"
#include "mx/upload/task.hpp"

#include <cstddef>
#include <filesystem>
#include <vector>

namespace mx::upload {

constexpr std::size_t kDefaultWorkers = 4;
constexpr std::size_t kMaxWorkers = 64;

struct ExecutorConfig {
    std::size_t workers = kDefaultWorkers;
    bool abort_on_auth_error = false;  ///< First Auth failure skips tasks not yet started
};

/**
 * @brief Outcomes of one run, in completion order
 */
struct ExecutionReport {
    std::vector<TaskOutcome> outcomes;
    bool nothing_to_do = false;

    std::size_t succeeded() const;
    std::size_t failed() const;
};

class UploadExecutor {
public:
    /**
     * @param cancellation Optional external stop signal (e.g. tripped by SIGINT).
     *        Targets still queued when it trips fail as Cancelled. The
     *        executor only reads it; abort_on_auth_error never trips it, so
     *        transfers already in flight run to completion.
     */
    UploadExecutor(archive::ProtocolClient& client,
                   events::EventBus& bus,
                   ExecutorConfig config = {},
                   CancellationToken* cancellation = nullptr);

    UploadExecutor(const UploadExecutor&) = delete;
    UploadExecutor& operator=(const UploadExecutor&) = delete;

    /**
     * @brief Upload every target, blocking until all have an outcome
     *
     * An empty target list performs no protocol calls and returns a report
     * with nothing_to_do set.
     */
    ExecutionReport run(const std::vector<std::filesystem::path>& targets,
                        const archive::FinalizeOptions& options);

    const ExecutorConfig& config() const { return config_; }

private:
    archive::ProtocolClient& client_;
    events::EventBus& bus_;
    ExecutorConfig config_;
    CancellationToken* cancellation_;
};

} // namespace mx::upload
