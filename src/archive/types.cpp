#include "mx/archive/types.hpp"

namespace mx::archive {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Auth: return "auth";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::LocalIo: return "local-io";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

UploadError UploadError::auth() {
    return UploadError{ErrorKind::Auth, "Invalid API key", 403};
}

UploadError UploadError::validation(std::string reason) {
    return UploadError{ErrorKind::Validation, std::move(reason), 400};
}

UploadError UploadError::transport(std::string reason, int status_code) {
    return UploadError{ErrorKind::Transport, std::move(reason), status_code};
}

UploadError UploadError::local_io(std::string reason) {
    return UploadError{ErrorKind::LocalIo, std::move(reason), 0};
}

UploadError UploadError::cancelled() {
    return UploadError{ErrorKind::Cancelled, "Upload cancelled", 0};
}

FinalizationRecord FinalizationRecord::from(const UploadSession& session, const FinalizeOptions& options) {
    FinalizationRecord record;
    record.id = session.id;
    record.tags = options.tags;
    record.source = options.source;
    record.description = options.description;
    record.original_upload_date = options.original_upload_date;
    return record;
}

} // namespace mx::archive
