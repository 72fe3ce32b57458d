#pragma once

#include <string>
#include <string_view>

namespace d8::util {

// Standard alphabet with padding; embedded whitespace and newlines are ignored.
std::string b64Decode(std::string_view b64);
std::string b64Encode(std::string_view data);

}
