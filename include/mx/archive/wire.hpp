#pragma once

#include "mx/archive/types.hpp"
#include "mx/core/result.hpp"

#include <cstdint>
#include <string>

namespace mx::archive::wire {

constexpr const char* kUploadsPath = "/api/v1/uploads";
constexpr const char* kFinalizePath = "/api/v1/uploads/finalize";

/**
 * @brief Join the configured host and an API path, tolerating a trailing '/'
 */
std::string endpoint(const std::string& host, const std::string& path);

std::string encode_initiate_request(const std::string& file_name, std::int64_t content_length);
std::string encode_finalize_request(const FinalizationRecord& record);

mx::Result<UploadSession, std::string> decode_session(const std::string& body);
mx::Result<FinalizedUpload, std::string> decode_finalized(const std::string& body);

/**
 * @brief Extract the `reason` field of a 400 response ({status, reason})
 */
mx::Result<std::string, std::string> decode_error_reason(const std::string& body);

} // namespace mx::archive::wire
