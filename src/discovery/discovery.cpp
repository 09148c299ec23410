#include "mx/discovery/discovery.hpp"
#include "mx/discovery/candidate_filter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace mx::discovery {
namespace {

class CandidateList {
public:
    void add(const fs::path& path) {
        if (!is_eligible(path)) {
            spdlog::debug("Skipping {} (not a video file)", path.string());
            return;
        }
        if (seen_.insert(path.lexically_normal()).second) {
            paths_.push_back(path);
        }
    }

    std::vector<fs::path> release() { return std::move(paths_); }

private:
    std::vector<fs::path> paths_;
    std::set<fs::path> seen_;
};

// Regular files below dir, sorted for a stable upload order
mx::Result<std::vector<fs::path>> walk_directory(const fs::path& dir) {
    std::vector<fs::path> files;
    std::error_code ec;

    fs::recursive_directory_iterator it(dir, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return mx::Err("Cannot read directory " + dir.string() + ": " + ec.message());
    }

    std::sort(files.begin(), files.end());
    return mx::Ok(std::move(files));
}

} // namespace

mx::Result<std::vector<fs::path>> collect_candidates(const std::vector<fs::path>& inputs) {
    CandidateList candidates;

    for (const auto& input : inputs) {
        std::error_code ec;

        if (fs::is_regular_file(input, ec)) {
            candidates.add(input);
            continue;
        }

        if (!fs::is_directory(input, ec)) {
            return mx::Err("Invalid path: " + input.string());
        }

        auto files = walk_directory(input);
        if (files.is_error()) {
            return mx::Err(files.error());
        }
        for (const auto& file : files.value()) {
            candidates.add(file);
        }
    }

    return mx::Ok(candidates.release());
}

} // namespace mx::discovery
