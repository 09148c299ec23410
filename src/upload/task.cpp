#include "mx/upload/task.hpp"
#include "mx/events/events.hpp"

#include <chrono>
#include <system_error>

namespace mx::upload {
namespace {

TaskOutcome fail(const std::filesystem::path& path,
                 archive::UploadError error,
                 TaskState failed_in,
                 events::EventBus& bus) {
    bus.emit(events::UploadFailedEvent{path, error, to_string(failed_in)});
    return UploadFailure{path, std::move(error), failed_in};
}

} // namespace

const char* to_string(TaskState state) noexcept {
    switch (state) {
        case TaskState::Pending:     return "pending";
        case TaskState::Initiated:   return "initiated";
        case TaskState::Transferred: return "transferred";
        case TaskState::Finalized:   return "finalized";
        case TaskState::Failed:      return "failed";
    }
    return "unknown";
}

const std::filesystem::path& outcome_path(const TaskOutcome& outcome) {
    return std::visit([](const auto& o) -> const std::filesystem::path& { return o.path; }, outcome);
}

mx::Result<UploadTarget, archive::UploadError> resolve_target(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return mx::Err(archive::UploadError::local_io("Cannot read " + path.string() + ": " + ec.message()));
    }

    UploadTarget target;
    target.path = path;
    target.file_name = path.filename().string();
    target.content_length = static_cast<std::uint64_t>(size);
    return mx::Ok(std::move(target));
}

TaskOutcome run_upload_task(const std::filesystem::path& path,
                            archive::ProtocolClient& client,
                            const archive::FinalizeOptions& options,
                            events::EventBus& bus) {
    const auto start = std::chrono::steady_clock::now();

    auto resolved = resolve_target(path);
    if (resolved.is_error()) {
        return fail(path, resolved.error(), TaskState::Pending, bus);
    }
    const UploadTarget target = std::move(resolved.value());

    // Pending -> Initiated
    auto session = client.initiate(target.file_name, static_cast<std::int64_t>(target.content_length));
    if (session.is_error()) {
        return fail(path, session.error(), TaskState::Pending, bus);
    }
    bus.emit(events::UploadInitiatedEvent{path, target.file_name, target.content_length, session.value().id});

    // Initiated -> Transferred
    auto transferred = client.transfer(target.path, target.content_length, session.value().url);
    if (transferred.is_error()) {
        return fail(path, transferred.error(), TaskState::Initiated, bus);
    }
    bus.emit(events::UploadTransferredEvent{path, session.value().id, target.content_length});

    // Transferred -> Finalized
    const auto record = archive::FinalizationRecord::from(session.value(), options);
    auto finalized = client.finalize(record);
    if (finalized.is_error()) {
        return fail(path, finalized.error(), TaskState::Transferred, bus);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    bus.emit(events::UploadSucceededEvent{path, finalized.value().url, target.content_length, elapsed});

    return UploadSuccess{path, finalized.value().url, finalized.value().id};
}

} // namespace mx::upload
