#pragma once

#include "mx/core/cancellation.hpp"
#include "mx/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace mx::net {

enum class HttpError {
    NetworkError,   // Connect/TLS/timeout/protocol failure reported by libcurl
    FileReadError,  // Local body file could not be opened or read
    Aborted         // Cancelled through the CancellationToken
};

struct HttpErrorInfo {
    HttpError error = HttpError::NetworkError;
    std::string message;
};

/**
 * @brief Status and body of a completed exchange (any status code)
 */
struct HttpReply {
    int status_code = 0;
    std::string body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

struct HttpClientConfig {
    long connect_timeout_seconds = 30;
    long timeout_seconds = 0;  // 0 = no overall limit
};

using HttpHeaders = std::map<std::string, std::string>;

/**
 * @brief Blocking HTTP client backed by libcurl
 *
 * Every call uses its own easy handle, so one client may be shared by all
 * upload workers. A status code >= 400 is not an error at this layer; the
 * caller interprets it.
 */
class HttpClient {
public:
    explicit HttpClient(HttpClientConfig config = {},
                        const CancellationToken* cancellation = nullptr);

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    mx::Result<HttpReply, HttpErrorInfo> post_json(const std::string& url,
                                                   const std::string& body,
                                                   const HttpHeaders& headers) const;

    /**
     * @brief Stream a local file as the body of a PUT request
     *
     * The file is read incrementally; it is never loaded into memory whole.
     */
    mx::Result<HttpReply, HttpErrorInfo> put_file(const std::string& url,
                                                  const std::filesystem::path& path,
                                                  std::uint64_t content_length,
                                                  const HttpHeaders& headers) const;

private:
    HttpClientConfig config_;
    const CancellationToken* cancellation_;
};

} // namespace mx::net
