#include "http/HttpClient.hpp"

#include <algorithm>
#include <cstring>

namespace d8::http {

std::size_t StringSource::read(char* buf, const std::size_t n) {
    const auto len = std::min(n, data_.size() - pos_);
    std::memcpy(buf, data_.data() + pos_, len);
    pos_ += len;
    return len;
}

}
