#pragma once

#include <cstdint>
#include <string>

namespace mx {

/**
 * @brief Render a byte count for humans, binary units with one decimal
 *
 * 512 -> "512 B", 1536 -> "1.5 KB", 3 * 1024 * 1024 -> "3.0 MB"
 */
std::string format_byte_size(std::uint64_t bytes);

} // namespace mx
