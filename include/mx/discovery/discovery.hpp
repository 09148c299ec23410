#pragma once

#include "mx/core/result.hpp"

#include <filesystem>
#include <vector>

namespace mx::discovery {

/**
 * @brief Expand the user's inputs into the list of eligible files
 *
 * Files are taken as given, directories are walked recursively (regular
 * files only). Ineligible files are dropped and duplicates keep their
 * first position.
 *
 * ERRORS:
 * An input that is neither a regular file nor a directory, or a directory
 * that cannot be walked.
 */
mx::Result<std::vector<std::filesystem::path>> collect_candidates(
    const std::vector<std::filesystem::path>& inputs);

} // namespace mx::discovery
