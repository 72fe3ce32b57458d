#include "shell/CommandUsage.hpp"
#include "util/cmdLineHelpers.hpp"

#include <stdexcept>

using namespace d8::shell;

UsageManager::UsageManager() {
    root_ = std::make_shared<CommandUsage>();
    root_->aliases = {"d8-data"};
    root_->description = "Move data in and out of cluster volumes through DataExport and DataImport resources.";
    root_->options = {
        {"--config", "Path to the d8-data YAML config (default $D8_DATA_CONFIG, then ~/.config/d8/data.yaml)"},
        {"--kubeconfig", "Path to the kubeconfig file (default $KUBECONFIG, then ~/.kube/config)"},
        {"--context", "Kubeconfig context to use instead of current-context"},
        {"--verbose", "Debug logging on stderr", {"-v"}},
        {"--help", "Show help for a command", {"-h"}}
    };
    root_->examples = {
        {"d8-data export download -n project pvc/data /srv/ -o ./srv", "Download a directory from a PVC"},
        {"d8-data import upload my-import -n project -f ./disk.img -d disk.img --resume", "Resume an interrupted upload"}
    };

    root_->addSubcommand(exportUsage());
    root_->addSubcommand(importUsage());
    for (auto& dep : deprecatedUsages()) {
        for (const auto& alias : dep->aliases)
            if (root_->findSubcommand(alias)) throw std::runtime_error("UsageManager: duplicate top-level alias: " + alias);
        root_->addSubcommand(dep);
    }
}

const UsageManager& UsageManager::instance() {
    static const UsageManager manager;
    return manager;
}

std::shared_ptr<CommandUsage> UsageManager::resolve(const std::vector<std::string>& args) const {
    auto node = root_;
    for (const auto& arg : args) {
        const auto next = node->findSubcommand(arg);
        if (!next) break;
        node = next;
    }
    return node;
}

std::shared_ptr<CommandUsage> UsageManager::resolve(const std::string& topLevel) const {
    return resolve(std::vector{topLevel});
}

std::string UsageManager::renderHelp(const std::vector<std::string>& args) const {
    CommandUsage usage = *resolve(args);
    usage.term_width = util::term_width();
    usage.theme.enabled = isatty(STDOUT_FILENO) == 1;
    return usage.str();
}
