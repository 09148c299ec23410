#include "mx/core/byte_size.hpp"

#include <iomanip>
#include <sstream>

namespace mx {

std::string format_byte_size(std::uint64_t bytes) {
    constexpr std::uint64_t kUnit = 1024;
    if (bytes < kUnit) {
        return std::to_string(bytes) + " B";
    }

    static const char kPrefixes[] = "KMGTPE";
    double value = static_cast<double>(bytes) / kUnit;
    std::size_t prefix = 0;
    while (value >= kUnit && prefix + 1 < sizeof(kPrefixes) - 1) {
        value /= kUnit;
        ++prefix;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << ' ' << kPrefixes[prefix] << 'B';
    return oss.str();
}

} // namespace mx
