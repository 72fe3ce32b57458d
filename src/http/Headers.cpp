#include "http/Headers.hpp"

#include <algorithm>
#include <cctype>

namespace d8::http {

bool CaseInsensitiveLess::operator()(const std::string_view a, const std::string_view b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](const char x, const char y) {
        return std::tolower(static_cast<unsigned char>(x)) < std::tolower(static_cast<unsigned char>(y));
    });
}

std::optional<std::string> Headers::get(const std::string_view name) const {
    if (const auto it = map_.find(name); it != map_.end()) return it->second;
    return std::nullopt;
}

static std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

void Headers::addRaw(const std::string_view line) {
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) return;
    const auto name = trim(line.substr(0, colon));
    if (name.empty()) return;
    map_[std::string(name)] = std::string(trim(line.substr(colon + 1)));
}

}
