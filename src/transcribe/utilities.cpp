#include "utilities.hpp"

#include <format>
#include <iterator>

std::string natural_size(uint64_t bytes) {
    static constexpr std::string_view suffixes[] = {"kB", "MB", "GB", "TB", "PB", "EB", "ZB", "YB"};

    if (bytes == 1) return "1 Byte";
    if (bytes < 1000) return std::format("{} Bytes", bytes);

    const double b = static_cast<double>(bytes);
    double unit = 1000.0;
    for (auto suffix : suffixes) {
        unit *= 1000.0;
        if (b < unit) {
            return std::format("{:.1f} {}", 1000.0 * b / unit, suffix);
        }
    }
    return std::format("{:.1f} {}", 1000.0 * b / unit, suffixes[std::size(suffixes) - 1]);
}

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}
