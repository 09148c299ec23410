#include "mx/net/http_client.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <memory>
#include <mutex>

namespace mx::net {
namespace {

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

size_t write_string_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t realsize = size * nmemb;
    auto* body = static_cast<std::string*>(userp);
    body->append(static_cast<char*>(contents), realsize);
    return realsize;
}

size_t read_file_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* input = static_cast<std::ifstream*>(userp);
    input->read(buffer, static_cast<std::streamsize>(size * nitems));
    if (input->bad()) {
        return CURL_READFUNC_ABORT;
    }
    return static_cast<size_t>(input->gcount());
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int cancellation_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* token = static_cast<const CancellationToken*>(clientp);
    return (token != nullptr && token->is_cancelled()) ? 1 : 0;
}

HeaderList build_headers(const HttpHeaders& headers) {
    curl_slist* list = nullptr;
    for (const auto& [name, value] : headers) {
        // "Name:" with nothing after the colon removes a default curl header
        std::string line = value.empty() ? name + ":" : name + ": " + value;
        list = curl_slist_append(list, line.c_str());
    }
    return HeaderList(list);
}

mx::Result<HttpReply, HttpErrorInfo> perform(CURL* curl,
                                             const HttpClientConfig& config,
                                             const CancellationToken* cancellation,
                                             const std::string& url,
                                             curl_slist* headers,
                                             std::string& response_body) {
    if (cancellation != nullptr && cancellation->is_cancelled()) {
        return mx::Err(HttpErrorInfo{HttpError::Aborted, "Transfer cancelled"});
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    // A redirected upload would have to rewind the body stream; report 3xx as-is
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, config.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_string_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, cancellation_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, cancellation);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    const CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return mx::Err(HttpErrorInfo{HttpError::Aborted, "Transfer cancelled"});
    }
    if (res == CURLE_READ_ERROR) {
        return mx::Err(HttpErrorInfo{HttpError::FileReadError, curl_easy_strerror(res)});
    }
    if (res != CURLE_OK) {
        return mx::Err(HttpErrorInfo{HttpError::NetworkError, curl_easy_strerror(res)});
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    spdlog::debug("HTTP {} -> {}", url, http_code);

    HttpReply reply;
    reply.status_code = static_cast<int>(http_code);
    reply.body = std::move(response_body);
    return mx::Ok(std::move(reply));
}

} // namespace

HttpClient::HttpClient(HttpClientConfig config, const CancellationToken* cancellation)
    : config_(config), cancellation_(cancellation) {
    ensure_curl_initialized();
}

mx::Result<HttpReply, HttpErrorInfo> HttpClient::post_json(const std::string& url,
                                                           const std::string& body,
                                                           const HttpHeaders& headers) const {
    EasyHandle curl(curl_easy_init());
    if (!curl) {
        return mx::Err(HttpErrorInfo{HttpError::NetworkError, "Failed to init CURL"});
    }

    HttpHeaders all_headers = headers;
    all_headers["content-type"] = "application/json";
    HeaderList header_list = build_headers(all_headers);

    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));

    std::string response_body;
    return perform(curl.get(), config_, cancellation_, url, header_list.get(), response_body);
}

mx::Result<HttpReply, HttpErrorInfo> HttpClient::put_file(const std::string& url,
                                                          const std::filesystem::path& path,
                                                          std::uint64_t content_length,
                                                          const HttpHeaders& headers) const {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return mx::Err(HttpErrorInfo{HttpError::FileReadError, "Failed to open " + path.string()});
    }

    EasyHandle curl(curl_easy_init());
    if (!curl) {
        return mx::Err(HttpErrorInfo{HttpError::NetworkError, "Failed to init CURL"});
    }

    HttpHeaders all_headers = headers;
    all_headers["Expect"] = "";  // no 100-continue round trip
    HeaderList header_list = build_headers(all_headers);

    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, read_file_callback);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &input);
    curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(content_length));

    std::string response_body;
    return perform(curl.get(), config_, cancellation_, url, header_list.get(), response_body);
}

} // namespace mx::net
