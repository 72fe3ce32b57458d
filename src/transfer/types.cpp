#include "transfer/types.hpp"
#include "transfer/errors.hpp"

#include <fmt/core.h>

namespace d8::transfer {

VolumeMode parseVolumeMode(const std::string_view s) {
    if (s == "Filesystem") return VolumeMode::Filesystem;
    if (s == "Block") return VolumeMode::Block;
    throw TransferError(fmt::format("invalid volume mode: {}", s));
}

std::string to_string(const VolumeMode mode) {
    switch (mode) {
        case VolumeMode::Filesystem: return "Filesystem";
        case VolumeMode::Block: return "Block";
    }
    throw TransferError("invalid volume mode");
}

}
