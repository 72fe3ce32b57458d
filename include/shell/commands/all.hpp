#pragma once

#include "shell/types.hpp"
#include "transfer/Downloader.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <string>

namespace d8::shell {

class Router;

namespace commands {

void registerExportCommands(Router& r);
void registerImportCommands(Router& r);

inline void registerAllCommands(Router& r) {
    registerExportCommands(r);
    registerImportCommands(r);
}

// Local name a remote path downloads to when -o is absent: its last component, "." for the root.
std::string defaultDownloadOutput(const std::string& srcPath);

// Runs download, then cleanup whether or not every file arrived. A partial download
// fails with the number of files written; otherwise summary() becomes stdout.
CommandResult downloadThenCleanup(const std::function<transfer::DownloadStats()>& download,
                                  const std::function<void()>& cleanup,
                                  const std::function<std::string(const transfer::DownloadStats&)>& summary);

// Reads a PersistentVolumeClaim manifest into {metadata, spec}; throws std::invalid_argument.
nlohmann::json loadPvcTemplate(const std::filesystem::path& path);

}

}
