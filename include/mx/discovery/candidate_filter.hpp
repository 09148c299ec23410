#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace mx::discovery {

/**
 * @brief MIME type guessed from the file extension, case-insensitive
 *
 * RETURNS: e.g. "video/mp4" for "clip.MP4", nullopt for unknown extensions
 */
std::optional<std::string> mime_type_for(const std::filesystem::path& path);

/**
 * @brief True when the guessed MIME type is video/*
 */
bool is_eligible(const std::filesystem::path& path);

} // namespace mx::discovery
