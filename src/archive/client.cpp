#include "mx/archive/client.hpp"
#include "mx/archive/wire.hpp"

#include <spdlog/spdlog.h>

namespace mx::archive {
namespace {

constexpr int kStatusBadRequest = 400;
constexpr int kStatusForbidden = 403;

UploadError from_http_error(const net::HttpErrorInfo& info) {
    switch (info.error) {
        case net::HttpError::Aborted:
            return UploadError::cancelled();
        case net::HttpError::FileReadError:
            return UploadError::local_io(info.message);
        case net::HttpError::NetworkError:
            break;
    }
    return UploadError::transport(info.message);
}

UploadError unexpected_status(const net::HttpReply& reply) {
    return UploadError::transport("Unexpected HTTP status " + std::to_string(reply.status_code),
                                  reply.status_code);
}

} // namespace

ArchiveClient::ArchiveClient(std::string host, std::string api_key, const net::HttpClient& http)
    : host_(std::move(host)), api_key_(std::move(api_key)), http_(http) {}

net::HttpHeaders ArchiveClient::auth_headers() const {
    return net::HttpHeaders{{"authorization", "Bearer " + api_key_}};
}

mx::Result<UploadSession, UploadError> ArchiveClient::initiate(const std::string& file_name,
                                                               std::int64_t content_length) {
    const auto url = wire::endpoint(host_, wire::kUploadsPath);
    const auto body = wire::encode_initiate_request(file_name, content_length);

    auto response = http_.post_json(url, body, auth_headers());
    if (response.is_error()) {
        return mx::Err(from_http_error(response.error()));
    }

    const auto& reply = response.value();
    if (reply.status_code == kStatusForbidden) {
        return mx::Err(UploadError::auth());
    }
    if (reply.status_code == kStatusBadRequest) {
        auto reason = wire::decode_error_reason(reply.body);
        if (reason.is_error()) {
            return mx::Err(UploadError::transport(reason.error(), reply.status_code));
        }
        return mx::Err(UploadError::validation(reason.value()));
    }
    if (!reply.is_success()) {
        return mx::Err(unexpected_status(reply));
    }

    auto session = wire::decode_session(reply.body);
    if (session.is_error()) {
        return mx::Err(UploadError::transport(session.error(), reply.status_code));
    }

    spdlog::debug("Initiated upload {} for {}", session.value().id, file_name);
    return mx::Ok(std::move(session.value()));
}

mx::Result<void, UploadError> ArchiveClient::transfer(const std::filesystem::path& local_path,
                                                      std::uint64_t content_length,
                                                      const std::string& destination_url) {
    // The destination is a pre-authorised URL issued by Initiate; no bearer header.
    auto response = http_.put_file(destination_url, local_path, content_length, {});
    if (response.is_error()) {
        return mx::Err(from_http_error(response.error()));
    }

    if (!response.value().is_success()) {
        return mx::Err(unexpected_status(response.value()));
    }
    return mx::Ok();
}

mx::Result<FinalizedUpload, UploadError> ArchiveClient::finalize(const FinalizationRecord& record) {
    const auto url = wire::endpoint(host_, wire::kFinalizePath);
    const auto body = wire::encode_finalize_request(record);

    auto response = http_.post_json(url, body, auth_headers());
    if (response.is_error()) {
        return mx::Err(from_http_error(response.error()));
    }

    const auto& reply = response.value();
    if (reply.status_code == kStatusForbidden) {
        return mx::Err(UploadError::auth());
    }
    if (!reply.is_success()) {
        return mx::Err(unexpected_status(reply));
    }

    auto finalized = wire::decode_finalized(reply.body);
    if (finalized.is_error()) {
        return mx::Err(UploadError::transport(finalized.error(), reply.status_code));
    }
    return mx::Ok(std::move(finalized.value()));
}

} // namespace mx::archive
