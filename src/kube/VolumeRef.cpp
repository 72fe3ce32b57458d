#include "kube/VolumeRef.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fmt/core.h>
#include <stdexcept>

namespace d8::kube {

namespace {

struct KindAlias {
    std::string_view alias;
    std::string_view shortName;
    std::string_view kind;
};

constexpr std::array<KindAlias, 8> kAliases{{
    {"pvc", "pvc", "PersistentVolumeClaim"},
    {"persistentvolumeclaim", "pvc", "PersistentVolumeClaim"},
    {"vs", "vs", "VolumeSnapshot"},
    {"volumesnapshot", "vs", "VolumeSnapshot"},
    {"vd", "vd", "VirtualDisk"},
    {"virtualdisk", "vd", "VirtualDisk"},
    {"vds", "vds", "VirtualDiskSnapshot"},
    {"virtualdisksnapshot", "vds", "VirtualDiskSnapshot"},
}};

std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return std::tolower(c); });
    return out;
}

const KindAlias* findAlias(const std::string_view kind) {
    const auto key = lower(kind);
    for (const auto& a : kAliases)
        if (a.alias == key) return &a;
    return nullptr;
}

}

ExportTarget resolveExportTarget(const std::string_view input) {
    const auto slash = input.find('/');
    if (slash == std::string_view::npos) return {std::string(input), std::nullopt};

    const auto* alias = findAlias(input.substr(0, slash));
    if (!alias) return {std::string(input), std::nullopt};

    const auto name = input.substr(slash + 1);
    return {
        fmt::format("de-{}-{}", alias->shortName, name),
        VolumeRef{std::string(alias->kind), std::string(name)},
    };
}

VolumeRef parseVolumeRef(const std::string_view input) {
    const auto slash = input.find('/');
    if (slash == std::string_view::npos || input.find('/', slash + 1) != std::string_view::npos)
        throw std::invalid_argument("invalid volume format, expect: <type>/<name>");

    const auto kind = input.substr(0, slash);
    const auto* alias = findAlias(kind);
    if (!alias) throw std::invalid_argument(fmt::format("invalid volume type: {} (valid: pvc, vs, vd, vds)", lower(kind)));

    const auto name = input.substr(slash + 1);
    if (name.empty()) throw std::invalid_argument("invalid volume format, expect: <type>/<name>");
    return {std::string(alias->kind), std::string(name)};
}

}
