#include "util/base64.hpp"

#include <cstring>
#include <sodium.h>
#include <stdexcept>

namespace d8::util {

std::string b64Decode(const std::string_view b64) {
    std::string decoded(b64.size() / 4 * 3 + 3, '\0');
    size_t out_len = 0;
    if (sodium_base642bin(reinterpret_cast<unsigned char*>(decoded.data()), decoded.size(),
                          b64.data(), b64.size(),
                          " \t\r\n", &out_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0)
        throw std::runtime_error("Invalid base64 data");
    decoded.resize(out_len);
    return decoded;
}

std::string b64Encode(const std::string_view data) {
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    result.resize(std::strlen(result.c_str())); // Trim null terminator
    return result;
}

}
