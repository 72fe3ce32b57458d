#include "shell/CommandUsage.hpp"

namespace d8::shell {

namespace {

const Entry NAMESPACE{"--namespace", "Namespace of the DataImport (default d8-data-exporter)", {"-n"}};

std::shared_ptr<CommandUsage> create() {
    auto cmd = std::make_shared<CommandUsage>();
    cmd->aliases = {"create"};
    cmd->description = "Create a DataImport that provisions a PVC from a template";
    cmd->positionals = {{"NAME", "Name of the DataImport", {}, true}};
    cmd->options = {
        {"--file", "PersistentVolumeClaim template (YAML with metadata and spec)", {"-f"}, true},
        {"--namespace", "Namespace of the DataImport (default: the template's namespace)", {"-n"}},
        {"--ttl", "Lifetime of the DataImport after its last use (default 2m)"},
        {"--publish", "Expose the importer through its public ingress"},
        {"--wffc", "Bind the PVC only when its first consumer appears (WaitForFirstConsumer)"}
    };
    cmd->examples = {
        {"d8-data import create my-import -f pvc.yaml -n project --ttl 30m", "Prepare a volume for upload"}
    };
    return cmd;
}

std::shared_ptr<CommandUsage> remove() {
    auto cmd = std::make_shared<CommandUsage>();
    cmd->aliases = {"delete", "rm"};
    cmd->description = "Delete a DataImport";
    cmd->positionals = {{"NAME", "Name of the DataImport", {}, true}};
    cmd->options = {NAMESPACE};
    return cmd;
}

std::shared_ptr<CommandUsage> upload() {
    auto cmd = std::make_shared<CommandUsage>();
    cmd->aliases = {"upload", "put"};
    cmd->description = "Upload a local file into a DataImport volume in chunks";
    cmd->positionals = {{"NAME", "Name of the DataImport", {}, true}};
    cmd->options = {
        {"--file", "Local file to upload", {"-f"}, true},
        {"--dstPath", "Destination path inside the volume", {"-d"}, true},
        {"--chunks", "Number of chunks the file is split into (default 10)", {"-c"}},
        {"--resume", "Continue from the offset the server already holds"},
        {"--publish", "Reach the importer through its public ingress. Omit to auto-detect", {"-P"}},
        NAMESPACE
    };
    cmd->examples = {
        {"d8-data import upload my-import -n project -f ./dump.sql -d /data/dump.sql", "Upload one file"},
        {"d8-data import upload my-import -n project -f ./dump.sql -d /data/dump.sql --resume", "Resume after an interruption"}
    };
    return cmd;
}

}

std::shared_ptr<CommandUsage> importUsage() {
    auto cmd = std::make_shared<CommandUsage>();
    cmd->aliases = {"import"};
    cmd->description = "Manage DataImports and upload data into them";
    cmd->addSubcommand(create());
    cmd->addSubcommand(remove());
    cmd->addSubcommand(upload());
    return cmd;
}

}
