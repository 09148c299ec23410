#pragma once

#include "mx/archive/types.hpp"
#include "mx/core/result.hpp"
#include "mx/net/http_client.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace mx::archive {

/**
 * @brief The three calls of the archive upload protocol
 *
 * Sequencing contract, per file:
 *   initiate -> transfer(session.url) -> finalize(record for session.id)
 * Each call is attempted at most once; nothing is retried or rolled back.
 * Implementations must be safe to call from several workers at once.
 */
class ProtocolClient {
public:
    virtual ~ProtocolClient() = default;

    virtual mx::Result<UploadSession, UploadError> initiate(const std::string& file_name,
                                                            std::int64_t content_length) = 0;

    virtual mx::Result<void, UploadError> transfer(const std::filesystem::path& local_path,
                                                   std::uint64_t content_length,
                                                   const std::string& destination_url) = 0;

    virtual mx::Result<FinalizedUpload, UploadError> finalize(const FinalizationRecord& record) = 0;
};

/**
 * @brief ProtocolClient speaking HTTP/JSON to the archive service
 *
 * Initiate:  POST {host}/api/v1/uploads          403 -> Auth, 400 -> Validation
 * Transfer:  PUT  {session url}, raw file bytes  non-2xx -> Transport
 * Finalize:  POST {host}/api/v1/uploads/finalize 403 -> Auth
 * Any other non-2xx status or an unparseable body maps to Transport.
 */
class ArchiveClient : public ProtocolClient {
public:
    ArchiveClient(std::string host, std::string api_key, const net::HttpClient& http);

    mx::Result<UploadSession, UploadError> initiate(const std::string& file_name,
                                                    std::int64_t content_length) override;

    mx::Result<void, UploadError> transfer(const std::filesystem::path& local_path,
                                           std::uint64_t content_length,
                                           const std::string& destination_url) override;

    mx::Result<FinalizedUpload, UploadError> finalize(const FinalizationRecord& record) override;

private:
    net::HttpHeaders auth_headers() const;

    std::string host_;
    std::string api_key_;
    const net::HttpClient& http_;
};

} // namespace mx::archive
