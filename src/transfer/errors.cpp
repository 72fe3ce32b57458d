#include "transfer/errors.hpp"

#include <fmt/core.h>

namespace d8::transfer {

HttpStatusError::HttpStatusError(std::string operation, const long status, std::string bodyExcerpt)
    : TransferError(bodyExcerpt.empty()
                        ? fmt::format("{}: server returned {}", operation, status)
                        : fmt::format("{}: server returned {}: {}", operation, status, bodyExcerpt)),
      status_(status), body_(std::move(bodyExcerpt)) {}

}
