#pragma once

#include <cstdint>
#include <string>

namespace d8::util {

// 10737418240 -> "10Gi", 1536 -> "1536" (only exact powers of 1024 get a suffix)
std::string formatBinarySI(int64_t bytes);

}
