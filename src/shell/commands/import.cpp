#include "shell/commands/all.hpp"
#include "shell/commands/helpers.hpp"
#include "shell/CommandUsage.hpp"
#include "shell/Router.hpp"
#include "concurrency/Context.hpp"
#include "config/ConfigRegistry.hpp"
#include "fs/FileSystem.hpp"
#include "kube/KubeEndpointProvider.hpp"
#include "kube/repositories.hpp"
#include "logging/LogRegistry.hpp"
#include "transfer/Uploader.hpp"
#include "util/shellArgsHelpers.hpp"
#include "util/yamlJson.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

#include <filesystem>

using namespace d8::shell;
using namespace d8::shell::commands;
using namespace d8::logging;
using namespace d8::config;

nlohmann::json d8::shell::commands::loadPvcTemplate(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) throw std::invalid_argument(fmt::format("PVC file does not exist: {}", path.string()));

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument(fmt::format("failed to parse PVC file {}: {}", path.string(), e.what()));
    }
    if (!root.IsMap()) throw std::invalid_argument(fmt::format("PVC file {} is not a YAML mapping", path.string()));

    const auto doc = d8::util::yamlToJson(root);
    if (!doc.contains("spec") || !doc["spec"].is_object())
        throw std::invalid_argument(fmt::format("PVC file {} has no spec", path.string()));

    nlohmann::json tmpl{{"metadata", doc.value("metadata", nlohmann::json::object())}, {"spec", doc["spec"]}};
    if (!tmpl["metadata"].is_object()) throw std::invalid_argument("PVC metadata must be a mapping");
    return tmpl;
}

namespace {

// Absent -> false, bare flag -> true, --key=VALUE -> parsed; nullopt when VALUE is not a bool.
std::optional<bool> boolOption(const CommandCall& call, const std::string& key) {
    const auto v = optVal(call, key);
    if (!v) return false;
    if (v->empty()) return true;
    return parseBool(*v);
}

CommandResult handle_import_create(const CommandCall& call) {
    if (wantsHelp(call)) return usage(call.constructFullArgs());
    if (const auto bad = checkPositionals(call, 1, 1)) return *bad;

    const auto file = optVal(call, std::vector<std::string>{"file", "f"});
    if (!file || file->empty()) return invalid(call.constructFullArgs(), "import create: --file/-f is required");

    nlohmann::json tmpl;
    try {
        tmpl = loadPvcTemplate(*file);
    } catch (const std::invalid_argument& e) {
        return invalid(fmt::format("import create: {}", e.what()));
    }

    const auto wffc = boolOption(call, "wffc");
    if (!wffc) return invalid(fmt::format("import create: invalid value for --wffc: '{}'", *optVal(call, "wffc")));

    std::string ns;
    const auto& metadata = tmpl["metadata"];
    if (const auto flag = optVal(call, std::vector<std::string>{"namespace", "n"}); flag && !flag->empty()) ns = *flag;
    else if (metadata.contains("namespace") && metadata["namespace"].is_string()) ns = metadata["namespace"].get<std::string>();
    if (ns.empty())
        return invalid(call.constructFullArgs(), "import create: no namespace given with -n and none in the PVC template");

    return runGuarded("import create", [&] {
        auto ks = openKubeSession();

        d8::kube::DataImport imp;
        imp.name = call.positionals[0];
        imp.namespace_ = ns;
        imp.ttl = ttlFor(call);
        imp.publish = resolvePublish(call, *ks.client);
        imp.waitForFirstConsumer = *wffc;
        imp.pvcTemplate = tmpl;

        d8::kube::DataImportRepository(*ks.client).create(*call.ctx, imp);
        return ok(fmt::format("DataImport {}/{} created\n", ns, imp.name));
    });
}

CommandResult handle_import_delete(const CommandCall& call) {
    if (wantsHelp(call)) return usage(call.constructFullArgs());
    if (const auto bad = checkPositionals(call, 1, 1)) return *bad;

    return runGuarded("import delete", [&] {
        auto ks = openKubeSession();
        const auto ns = namespaceFor(call);
        d8::kube::DataImportRepository(*ks.client).remove(*call.ctx, call.positionals[0], ns);
        return ok(fmt::format("DataImport {}/{} deleted\n", ns, call.positionals[0]));
    });
}

CommandResult handle_import_upload(const CommandCall& call) {
    if (wantsHelp(call)) return usage(call.constructFullArgs());
    if (const auto bad = checkPositionals(call, 1, 1)) return *bad;

    const auto file = optVal(call, std::vector<std::string>{"file", "f"});
    if (!file || file->empty()) return invalid(call.constructFullArgs(), "import upload: --file/-f is required");

    const auto dst = optVal(call, std::vector<std::string>{"dstPath", "d"});
    if (!dst || dst->empty()) return invalid(call.constructFullArgs(), "import upload: --dstPath/-d is required");

    unsigned int chunks = ConfigRegistry::get().transfer.upload_chunks;
    if (const auto c = optVal(call, std::vector<std::string>{"chunks", "c"})) {
        const auto parsed = parseUInt(*c);
        if (!parsed || *parsed == 0) return invalid(fmt::format("import upload: --chunks must be a positive integer, got '{}'", *c));
        chunks = *parsed;
    }

    const auto resume = boolOption(call, "resume");
    if (!resume) return invalid(fmt::format("import upload: invalid value for --resume: '{}'", *optVal(call, "resume")));

    return runGuarded("import upload", [&] {
        auto ks = openKubeSession();
        const auto& name = call.positionals[0];
        const auto ns = namespaceFor(call);
        const bool publish = resolvePublish(call, *ks.client, {"publish", "P"});

        d8::kube::KubeEndpointProvider provider(d8::kube::ResourceKind::DataImport, *ks.client, *ks.dataClient);
        const auto session = provider.prepare(*call.ctx, name, ns, publish);

        d8::fs::LocalFileSystem fs;
        d8::transfer::Uploader(*session.httpClient, fs).upload(*call.ctx, session.baseURL, *dst, *file, chunks, *resume);
        return ok(fmt::format("Uploaded {} to {}/{}:{}\n", *file, ns, name, *dst));
    });
}

bool isImportMatch(const std::string& cmd, const std::string_view input) {
    return isCommandMatch({"import", cmd}, input);
}

CommandResult handle_import(const CommandCall& call) {
    if (call.positionals.empty()) return wantsHelp(call) ? usage({"import"}) : invalid({"import"}, "import: missing subcommand");

    const auto [sub, subcall] = descend(call);

    if (isImportMatch("create", sub)) return handle_import_create(subcall);
    if (isImportMatch("delete", sub)) return handle_import_delete(subcall);
    if (isImportMatch("upload", sub)) return handle_import_upload(subcall);

    return invalid({"import"}, fmt::format("Unknown import subcommand: '{}'", sub));
}

}

void d8::shell::commands::registerImportCommands(Router& r) {
    r.registerCommand(UsageManager::instance().resolve("import"), handle_import);
}
