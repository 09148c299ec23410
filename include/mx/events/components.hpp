/**
 * @file components.hpp
 * @brief Observers of the upload pipeline
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * StatsComponent stats(bus);
 * ReporterComponent reporter(bus, std::cout, std::cerr);
 * // Run the executor, then:
 * stats.print_stats();
 */

#pragma once

#include "mx/core/byte_size.hpp"
#include "mx/events/event_bus.hpp"
#include "mx/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <ostream>
#include <vector>

namespace mx::events {

/**
 * @brief Keeps the subscriptions of one component and drops them on destruction
 */
class SubscriptionSet {
public:
    explicit SubscriptionSet(EventBus& bus) : bus_(bus) {}

    SubscriptionSet(const SubscriptionSet&) = delete;
    SubscriptionSet& operator=(const SubscriptionSet&) = delete;

    ~SubscriptionSet() {
        for (auto& release : releases_) {
            release();
        }
    }

    template<typename EventType>
    void add(std::function<void(const EventType&)> handler) {
        size_t id = bus_.subscribe<EventType>(std::move(handler));
        releases_.push_back([this, id]() { bus_.unsubscribe<EventType>(id); });
    }

private:
    EventBus& bus_;
    std::vector<std::function<void()>> releases_;
};

/**
 * @brief Logger component - logs every pipeline event
 *
 * Phase transitions go to debug, terminal outcomes and batch boundaries to info.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<BatchStartedEvent>([](const BatchStartedEvent& e) {
            spdlog::info("Uploading {} files with tags `{}`", e.file_count, e.tags);
            spdlog::debug("[BatchStarted] files={} workers={}", e.file_count, e.workers);
        });

        subscriptions_.add<NothingToUploadEvent>([](const NothingToUploadEvent&) {
            spdlog::debug("[NothingToUpload]");
        });

        subscriptions_.add<UploadQueuedEvent>([](const UploadQueuedEvent& e) {
            spdlog::debug("[UploadQueued] path={}", e.path.string());
        });

        subscriptions_.add<UploadInitiatedEvent>([](const UploadInitiatedEvent& e) {
            spdlog::info("Uploading \"{}\" ({})", e.file_name, format_byte_size(e.total_bytes));
            spdlog::debug("[UploadInitiated] path={} session={}", e.path.string(), e.session_id);
        });

        subscriptions_.add<UploadTransferredEvent>([](const UploadTransferredEvent& e) {
            spdlog::debug("[UploadTransferred] path={} session={} bytes={}",
                          e.path.string(), e.session_id, e.total_bytes);
        });

        subscriptions_.add<UploadSucceededEvent>([](const UploadSucceededEvent& e) {
            spdlog::debug("[UploadSucceeded] path={} url={} duration={}ms",
                          e.path.string(), e.final_url, e.duration.count());
        });

        subscriptions_.add<UploadFailedEvent>([](const UploadFailedEvent& e) {
            spdlog::warn("[UploadFailed] path={} phase={} kind={} reason={}",
                         e.path.string(), e.phase, archive::to_string(e.error.kind), e.error.reason);
        });

        subscriptions_.add<BatchCompletedEvent>([](const BatchCompletedEvent& e) {
            spdlog::debug("[BatchCompleted] succeeded={} failed={} duration={}ms",
                          e.succeeded, e.failed, e.duration.count());
        });
    }

private:
    SubscriptionSet subscriptions_;
};

/**
 * @brief Stats component - counts outcomes for the run summary
 *
 * USAGE:
 * StatsComponent stats(bus);
 * // Later...
 * const auto& s = stats.get_stats();
 * std::cout << "Uploaded: " << s.uploaded << "\n";
 */
class StatsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> queued{0};
        std::atomic<uint64_t> uploaded{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> failed{0};
        std::atomic<uint64_t> auth_failures{0};
        std::atomic<uint64_t> validation_failures{0};
        std::atomic<uint64_t> transport_failures{0};
        std::atomic<uint64_t> local_io_failures{0};
        std::atomic<uint64_t> cancelled{0};
    };

    explicit StatsComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<UploadQueuedEvent>([this](const UploadQueuedEvent&) {
            stats_.queued++;
        });

        subscriptions_.add<UploadSucceededEvent>([this](const UploadSucceededEvent& e) {
            stats_.uploaded++;
            stats_.bytes_uploaded += e.total_bytes;
        });

        subscriptions_.add<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            on_upload_failed(e);
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Summary:");
        spdlog::info("  Files uploaded:  {}", stats_.uploaded.load());
        spdlog::info("  Bytes uploaded:  {}", format_byte_size(stats_.bytes_uploaded.load()));
        spdlog::info("  Files failed:    {}", stats_.failed.load());
        if (stats_.failed.load() > 0) {
            spdlog::info("    auth:       {}", stats_.auth_failures.load());
            spdlog::info("    validation: {}", stats_.validation_failures.load());
            spdlog::info("    transport:  {}", stats_.transport_failures.load());
            spdlog::info("    local-io:   {}", stats_.local_io_failures.load());
            spdlog::info("    cancelled:  {}", stats_.cancelled.load());
        }
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_upload_failed(const UploadFailedEvent& e) {
        stats_.failed++;
        switch (e.error.kind) {
            case archive::ErrorKind::Auth:       stats_.auth_failures++; break;
            case archive::ErrorKind::Validation: stats_.validation_failures++; break;
            case archive::ErrorKind::Transport:  stats_.transport_failures++; break;
            case archive::ErrorKind::LocalIo:    stats_.local_io_failures++; break;
            case archive::ErrorKind::Cancelled:  stats_.cancelled++; break;
        }
    }

    Stats stats_;
    SubscriptionSet subscriptions_;
};

/**
 * @brief Reporter component - prints one line per terminal outcome
 *
 *   [<path>] Uploaded: <url>     -> out
 *   [<path>] Error: <reason>     -> err
 *
 * Lines from concurrent workers never interleave.
 */
class ReporterComponent {
public:
    ReporterComponent(EventBus& bus, std::ostream& out, std::ostream& err)
        : out_(out), err_(err), subscriptions_(bus) {
        subscriptions_.add<UploadSucceededEvent>([this](const UploadSucceededEvent& e) {
            std::lock_guard lock(mutex_);
            out_ << "[" << e.path.string() << "] Uploaded: " << e.final_url << "\n";
            out_.flush();
        });

        subscriptions_.add<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            std::lock_guard lock(mutex_);
            err_ << "[" << e.path.string() << "] Error: " << e.error.reason << "\n";
            err_.flush();
        });
    }

private:
    std::ostream& out_;
    std::ostream& err_;
    std::mutex mutex_;
    SubscriptionSet subscriptions_;
};

} // namespace mx::events
