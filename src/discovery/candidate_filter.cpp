#include "mx/discovery/candidate_filter.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace mx::discovery {
namespace {

const std::unordered_map<std::string, std::string>& mime_table() {
    static const std::unordered_map<std::string, std::string> table = {
        // video
        {"mp4", "video/mp4"},
        {"m4v", "video/x-m4v"},
        {"mkv", "video/x-matroska"},
        {"webm", "video/webm"},
        {"mov", "video/quicktime"},
        {"qt", "video/quicktime"},
        {"avi", "video/x-msvideo"},
        {"flv", "video/x-flv"},
        {"wmv", "video/x-ms-wmv"},
        {"mpeg", "video/mpeg"},
        {"mpg", "video/mpeg"},
        {"mpe", "video/mpeg"},
        {"ogv", "video/ogg"},
        {"3gp", "video/3gpp"},
        {"3g2", "video/3gpp2"},
        {"ts", "video/mp2t"},
        {"m2ts", "video/mp2t"},
        // non-video types commonly found beside recordings
        {"mp3", "audio/mpeg"},
        {"wav", "audio/wav"},
        {"ogg", "audio/ogg"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"png", "image/png"},
        {"gif", "image/gif"},
        {"txt", "text/plain"},
        {"json", "application/json"},
        {"srt", "application/x-subrip"},
    };
    return table;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::optional<std::string> mime_type_for(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    if (ext.size() < 2) {
        return std::nullopt;
    }

    const auto& table = mime_table();
    auto it = table.find(lowercase(ext.substr(1)));
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool is_eligible(const std::filesystem::path& path) {
    auto mime = mime_type_for(path);
    return mime.has_value() && mime->rfind("video/", 0) == 0;
}

} // namespace mx::discovery
