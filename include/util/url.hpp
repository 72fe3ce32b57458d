#pragma once

#include <string>
#include <string_view>

namespace d8::util {

// Joins URL path segments with exactly one '/' between them. A trailing '/'
// on the last segment is kept, since it marks a directory request.
std::string joinURL(std::string_view base, std::string_view path);

bool hasScheme(std::string_view url);

}
