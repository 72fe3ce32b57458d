#include "util/quantity.hpp"

#include <array>
#include <fmt/core.h>

namespace d8::util {

std::string formatBinarySI(int64_t bytes) {
    static constexpr std::array<const char*, 7> kSuffixes{"", "Ki", "Mi", "Gi", "Ti", "Pi", "Ei"};
    if (bytes == 0) return "0";

    std::size_t idx = 0;
    while (idx + 1 < kSuffixes.size() && bytes % 1024 == 0) {
        bytes /= 1024;
        ++idx;
    }
    return fmt::format("{}{}", bytes, kSuffixes[idx]);
}

}
