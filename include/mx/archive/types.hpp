#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace mx::archive {

enum class ErrorKind {
    Auth,        ///< Credential rejected (HTTP 403)
    Validation,  ///< Server rejected this specific request (HTTP 400)
    Transport,   ///< Network fault, unexpected status or unparseable body
    LocalIo,     ///< Local file could not be read
    Cancelled    ///< Stopped before completion by a cancellation request
};

const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief Failure of one protocol call, discriminated by kind
 */
struct UploadError {
    ErrorKind kind = ErrorKind::Transport;
    std::string reason;   ///< Human-readable; server-supplied for Validation
    int status_code = 0;  ///< HTTP status when one was received

    static UploadError auth();
    static UploadError validation(std::string reason);
    static UploadError transport(std::string reason, int status_code = 0);
    static UploadError local_io(std::string reason);
    static UploadError cancelled();
};

/**
 * @brief Server-issued identity and one-time write destination from Initiate
 */
struct UploadSession {
    std::string id;
    std::string url;
};

/**
 * @brief Caller-level metadata attached to every finalized upload
 */
struct FinalizeOptions {
    std::string tags;
    std::string source;
    std::string description;
    std::optional<std::string> original_upload_date;
};

/**
 * @brief Body of the Finalize call for one session
 */
struct FinalizationRecord {
    std::string id;
    std::string tags;
    std::string source;
    std::string description;
    std::optional<std::string> original_upload_date;

    static FinalizationRecord from(const UploadSession& session, const FinalizeOptions& options);
};

/**
 * @brief Published artifact returned by Finalize
 */
struct FinalizedUpload {
    std::string id;
    std::string url;
};

} // namespace mx::archive
