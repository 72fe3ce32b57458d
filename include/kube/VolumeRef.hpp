#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace d8::kube {

struct VolumeRef {
    std::string kind; // PersistentVolumeClaim, VolumeSnapshot, VirtualDisk, VirtualDiskSnapshot
    std::string name;
};

struct ExportTarget {
    std::string exportName;
    std::optional<VolumeRef> volume; // set when the DataExport has to be created
};

// "pvc/data" -> {de-pvc-data, PersistentVolumeClaim/data}; a bare name refers to an existing DataExport.
ExportTarget resolveExportTarget(std::string_view input);

// Strict KIND/NAME form used by `export create`; throws std::invalid_argument.
VolumeRef parseVolumeRef(std::string_view input);

}
