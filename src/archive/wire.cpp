#include "mx/archive/wire.hpp"

#include <nlohmann/json.hpp>

namespace mx::archive::wire {

using json = nlohmann::json;

namespace {

mx::Result<json, std::string> parse_object(const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return mx::Err("Malformed JSON response");
    }
    if (!parsed.is_object()) {
        return mx::Err("Expected a JSON object in response");
    }
    return mx::Ok(std::move(parsed));
}

mx::Result<std::string, std::string> string_field(const json& object, const char* name) {
    auto it = object.find(name);
    if (it == object.end() || !it->is_string()) {
        return mx::Err(std::string("Response is missing string field '") + name + "'");
    }
    return mx::Ok(it->get<std::string>());
}

} // namespace

std::string endpoint(const std::string& host, const std::string& path) {
    if (host.empty()) {
        return path;
    }
    if (host.back() == '/' && !path.empty() && path.front() == '/') {
        return host + path.substr(1);
    }
    if (host.back() != '/' && !path.empty() && path.front() != '/') {
        return host + "/" + path;
    }
    return host + path;
}

std::string encode_initiate_request(const std::string& file_name, std::int64_t content_length) {
    json j;
    j["file_name"] = file_name;
    j["content_length"] = content_length;
    return j.dump();
}

std::string encode_finalize_request(const FinalizationRecord& record) {
    json j;
    j["id"] = record.id;
    j["tags"] = record.tags;
    j["source"] = record.source;
    j["description"] = record.description;
    if (record.original_upload_date) {
        j["original_upload_date"] = *record.original_upload_date;
    } else {
        j["original_upload_date"] = nullptr;
    }
    return j.dump();
}

mx::Result<UploadSession, std::string> decode_session(const std::string& body) {
    auto parsed = parse_object(body);
    if (parsed.is_error()) {
        return mx::Err(parsed.error());
    }

    auto id = string_field(parsed.value(), "id");
    if (id.is_error()) {
        return mx::Err(id.error());
    }
    auto url = string_field(parsed.value(), "url");
    if (url.is_error()) {
        return mx::Err(url.error());
    }

    return mx::Ok(UploadSession{id.value(), url.value()});
}

mx::Result<FinalizedUpload, std::string> decode_finalized(const std::string& body) {
    auto session = decode_session(body);
    if (session.is_error()) {
        return mx::Err(session.error());
    }
    return mx::Ok(FinalizedUpload{session.value().id, session.value().url});
}

mx::Result<std::string, std::string> decode_error_reason(const std::string& body) {
    auto parsed = parse_object(body);
    if (parsed.is_error()) {
        return mx::Err(parsed.error());
    }
    return string_field(parsed.value(), "reason");
}

} // namespace mx::archive::wire
