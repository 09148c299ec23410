#pragma once

#include "mx/archive/client.hpp"
#include "mx/archive/types.hpp"
#include "mx/events/event_bus.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>

namespace mx::upload {

enum class TaskState {
    Pending,
    Initiated,
    Transferred,
    Finalized,
    Failed
};

const char* to_string(TaskState state) noexcept;

/**
 * @brief A file resolved once before its protocol sequence begins
 */
struct UploadTarget {
    std::filesystem::path path;
    std::string file_name;
    std::uint64_t content_length = 0;
};

struct UploadSuccess {
    std::filesystem::path path;
    std::string final_url;
    std::string upload_id;
};

struct UploadFailure {
    std::filesystem::path path;
    archive::UploadError error;
    TaskState failed_in = TaskState::Pending;  ///< Last state reached before failing
};

/**
 * @brief Terminal result of one upload task
 */
using TaskOutcome = std::variant<UploadSuccess, UploadFailure>;

inline bool is_success(const TaskOutcome& outcome) {
    return std::holds_alternative<UploadSuccess>(outcome);
}

const std::filesystem::path& outcome_path(const TaskOutcome& outcome);

/**
 * @brief Resolve the path's size and base name
 *
 * Fails with LocalIo when the file cannot be stat'ed.
 */
mx::Result<UploadTarget, archive::UploadError> resolve_target(const std::filesystem::path& path);

/**
 * @brief Drive one file through initiate -> transfer -> finalize
 *
 * A failed phase ends the task; later phases are never called. Every error
 * kind becomes an UploadFailure, nothing is thrown. Exactly one of
 * UploadSucceededEvent / UploadFailedEvent is emitted.
 */
TaskOutcome run_upload_task(const std::filesystem::path& path,
                            archive::ProtocolClient& client,
                            const archive::FinalizeOptions& options,
                            events::EventBus& bus);

} // namespace mx::upload
