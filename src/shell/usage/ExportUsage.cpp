#include "shell/CommandUsage.hpp"

namespace d8::shell {

namespace {

const Entry NAMESPACE{"--namespace", "Namespace of the DataExport and its volume (default d8-data-exporter)", {"-n"}};
const Entry TTL{"--ttl", "Lifetime of an auto-created DataExport after its last use (default 2m)"};
const Entry PUBLISH{"--publish", "Reach the exporter through its public ingress. Omit to auto-detect; --publish=false forces the in-cluster URL"};

std::shared_ptr<CommandUsage> create() {
    auto cmd = std::make_shared<CommandUsage>();
    cmd->aliases = {"create"};
    cmd->description = "Create a DataExport for a volume";
    cmd->positionals = {
        {"NAME", "Name of the DataExport", {}, true},
        {"KIND/VOLUME", "Volume to export: pvc/, vs/, vd/ or vds/ followed by its name", {}, true}
    };
    cmd->options = {NAMESPACE, TTL, PUBLISH};
    cmd->examples = {
        {"d8-data export create my-export pvc/data -n project --ttl 10m", "Export a PVC for ten minutes"}
    };
    return cmd;
}

std::shared_ptr<CommandUsage> remove() {
    auto cmd = std::make_shared<CommandUsage>();
    cmd->aliases = {"delete", "rm"};
    cmd->description = "Delete a DataExport";
    cmd->positionals = {{"NAME", "Name of the DataExport", {}, true}};
    cmd->options = {NAMESPACE};
    return cmd;
}

std::shared_ptr<CommandUsage> list() {
    auto cmd = std::make_shared<CommandUsage>();
    cmd->aliases = {"list", "ls"};
    cmd->description = "Print the directory listing of an export, or the disk size of a block volume";
    cmd->positionals = {
        {"[KIND/]NAME", "DataExport name, or a volume reference that creates one", {}, true},
        {"PATH/", "Directory to list; must end with '/' (default /)"}
    };
    cmd->options = {NAMESPACE, TTL, PUBLISH};
    cmd->examples = {
        {"d8-data export list -n project pvc/data /var/log/", "List a directory of a PVC"},
        {"d8-data export list -n project vd/root-disk", "Show the size of a block volume"}
    };
    return cmd;
}

std::shared_ptr<CommandUsage> download() {
    auto cmd = std::make_shared<CommandUsage>();
    cmd->aliases = {"download", "get"};
    cmd->description = "Download a file or a directory tree from an export";
    cmd->positionals = {
        {"[KIND/]NAME", "DataExport name, or a volume reference that creates one", {}, true},
        {"PATH", "Remote file, or directory ending with '/' (Filesystem volumes only)"}
    };
    cmd->options = {
        {"--output", "Local destination (default: last path component, or the export name for block volumes)", {"-o"}},
        NAMESPACE, TTL, PUBLISH
    };
    cmd->examples = {
        {"d8-data export download -n project pvc/data /etc/app.conf -o app.conf", "Download one file"},
        {"d8-data export download -n project pvc/data /srv/ -o ./srv", "Download a directory tree"},
        {"d8-data export download -n project vs/snap -o disk.img", "Download a block volume image"}
    };
    return cmd;
}

}

std::shared_ptr<CommandUsage> exportUsage() {
    auto cmd = std::make_shared<CommandUsage>();
    cmd->aliases = {"export"};
    cmd->description = "Manage DataExports and download their data";
    cmd->addSubcommand(create());
    cmd->addSubcommand(remove());
    cmd->addSubcommand(list());
    cmd->addSubcommand(download());
    return cmd;
}

std::vector<std::shared_ptr<CommandUsage>> deprecatedUsages() {
    std::vector<std::shared_ptr<CommandUsage>> out;
    for (const auto* verb : {"create", "delete", "list", "download"}) {
        auto cmd = std::make_shared<CommandUsage>();
        cmd->aliases = {verb};
        cmd->description = std::string("Removed; use `export ") + verb + "`";
        out.push_back(cmd);
    }
    return out;
}

}
