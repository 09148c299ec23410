/**
 * @file events.hpp
 * @brief Events published by the upload pipeline
 *
 * NAMING CONVENTION:
 * Events are past-tense: UploadInitiatedEvent, UploadFailedEvent
 *
 * ORDER PER FILE:
 * UploadQueued -> UploadInitiated -> UploadTransferred -> UploadSucceeded
 * with UploadFailed replacing the tail at whichever phase failed.
 * Events of different files interleave freely.
 */

#pragma once

#include "mx/archive/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace mx::events {

// ════════════════════════════════════════════════════════
// Batch Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once before the executor dispatches any task
 *
 * WHO EMITS: UploadExecutor::run (only when there is work)
 * WHO SUBSCRIBES: Logger
 */
struct BatchStartedEvent {
    std::size_t file_count = 0;
    std::string tags;
    std::size_t workers = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted after every target has a terminal outcome
 */
struct BatchCompletedEvent {
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted instead of BatchStarted when there are no eligible targets
 */
struct NothingToUploadEvent {
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Per-file Events
// ════════════════════════════════════════════════════════

struct UploadQueuedEvent {
    std::filesystem::path path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when Initiate returned a session for the file
 */
struct UploadInitiatedEvent {
    std::filesystem::path path;
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::string session_id;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadTransferredEvent {
    std::filesystem::path path;
    std::string session_id;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Terminal success: Finalize published the file
 *
 * WHO SUBSCRIBES: Reporter (prints URL), Stats, Logger
 */
struct UploadSucceededEvent {
    std::filesystem::path path;
    std::string final_url;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Terminal failure at any phase
 *
 * WHO SUBSCRIBES: Reporter (prints reason), Stats, Logger
 */
struct UploadFailedEvent {
    std::filesystem::path path;
    archive::UploadError error;
    std::string phase;  ///< State the task was in when it failed
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace mx::events
