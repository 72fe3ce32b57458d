#include "util/url.hpp"

namespace d8::util {

std::string joinURL(std::string_view base, std::string_view path) {
    const bool dir = !path.empty() && path.back() == '/';
    while (!base.empty() && base.back() == '/') base.remove_suffix(1);
    while (!path.empty() && path.front() == '/') path.remove_prefix(1);
    std::string out(base);
    if (path.empty()) {
        if (dir) out += '/';
        return out;
    }
    out += '/';
    out += path;
    return out;
}

bool hasScheme(const std::string_view url) {
    return url.starts_with("http://") || url.starts_with("https://");
}

}
