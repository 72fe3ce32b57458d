#include "shell/commands/all.hpp"
#include "shell/commands/helpers.hpp"
#include "shell/CommandUsage.hpp"
#include "shell/Router.hpp"
#include "concurrency/Context.hpp"
#include "config/ConfigRegistry.hpp"
#include "fs/FileSystem.hpp"
#include "kube/KubeEndpointProvider.hpp"
#include "kube/VolumeRef.hpp"
#include "kube/repositories.hpp"
#include "logging/LogRegistry.hpp"
#include "transfer/Downloader.hpp"
#include "transfer/errors.hpp"
#include "util/cmdLineHelpers.hpp"
#include "util/shellArgsHelpers.hpp"
#include "util/url.hpp"

#include <fmt/core.h>

using namespace d8::shell;
using namespace d8::shell::commands;
using namespace d8::logging;
using namespace d8::config;

namespace {

struct PreparedExport {
    std::string name;
    std::string namespace_;
    bool created = false;
    d8::transfer::TransferSession session;
};

PreparedExport prepareExport(const CommandCall& call, KubeSession& ks, const std::string& target) {
    const auto resolved = d8::kube::resolveExportTarget(target);

    PreparedExport out;
    out.name = resolved.exportName;
    out.namespace_ = namespaceFor(call);

    const bool publish = resolvePublish(call, *ks.client);
    d8::kube::DataExportRepository repo(*ks.client);

    if (resolved.volume) {
        d8::kube::DataExport exp;
        exp.name = out.name;
        exp.namespace_ = out.namespace_;
        exp.ttl = ttlFor(call);
        exp.publish = publish;
        exp.targetKind = resolved.volume->kind;
        exp.targetName = resolved.volume->name;
        repo.create(*call.ctx, exp);
        out.created = true;
    }

    d8::kube::KubeEndpointProvider provider(d8::kube::ResourceKind::DataExport, *ks.client, *ks.dataClient);
    out.session = provider.prepare(*call.ctx, out.name, out.namespace_, publish);
    return out;
}

// Offers to delete an export this invocation created; failures only warn.
void offerCleanup(const CommandCall& call, KubeSession& ks, const PreparedExport& prepared) {
    if (!prepared.created) return;

    const auto timeout = ConfigRegistry::get().defaults.delete_prompt_timeout;
    const auto prompt = fmt::format(
        "DataExport will auto-delete in {} sec [press y+Enter to delete now, n+Enter to cancel]", timeout.count());
    if (!d8::util::askYesNoWithTimeout(prompt, timeout)) return;

    try {
        d8::kube::DataExportRepository(*ks.client).remove(*call.ctx, prepared.name, prepared.namespace_);
    } catch (const std::exception& e) {
        LogRegistry::d8()->warn("[export] Failed to delete DataExport {}/{}: {}", prepared.namespace_, prepared.name, e.what());
    }
}

// Streams the listing body as-is; a non-200 reply keeps a bounded excerpt instead.
class RawListingSink : public d8::http::BodySink {
public:
    explicit RawListingSink(const std::size_t limit) : limit_(limit) {}

    void onResponse(const long status, const d8::http::Headers&) override { status_ = status; }

    void write(const std::string_view chunk) override {
        if (status_ == 200) {
            out_.write(chunk);
            return;
        }
        if (excerpt_.size() < limit_) excerpt_.append(chunk.substr(0, limit_ - excerpt_.size()));
    }

    [[nodiscard]] long status() const { return status_; }
    [[nodiscard]] const std::string& excerpt() const { return excerpt_; }

private:
    std::size_t limit_;
    long status_ = 0;
    std::string excerpt_;
    d8::fs::StdoutWriter out_;
};

std::string withLeadingSlash(std::string path) {
    if (!path.starts_with('/')) path.insert(path.begin(), '/');
    return path;
}

// Last non-empty component of a remote path, "." for the root.
std::string defaultOutputFor(const std::string& srcPath) {
    auto end = srcPath.find_last_not_of('/');
    if (end == std::string::npos) return ".";
    const auto begin = srcPath.find_last_of('/', end);
    return srcPath.substr(begin == std::string::npos ? 0 : begin + 1, end - (begin == std::string::npos ? 0 : begin + 1) + 1);
}

CommandResult handle_export_create(const CommandCall& call) {
    if (wantsHelp(call)) return usage(call.constructFullArgs());
    if (const auto bad = checkPositionals(call, 2, 2)) return *bad;

    const auto& name = call.positionals[0];
    d8::kube::VolumeRef ref;
    try {
        ref = d8::kube::parseVolumeRef(call.positionals[1]);
    } catch (const std::invalid_argument& e) {
        return invalid(call.constructFullArgs(), fmt::format("export create: {}", e.what()));
    }

    return runGuarded("export create", [&] {
        auto ks = openKubeSession();

        d8::kube::DataExport exp;
        exp.name = name;
        exp.namespace_ = namespaceFor(call);
        exp.ttl = ttlFor(call);
        exp.publish = resolvePublish(call, *ks.client);
        exp.targetKind = ref.kind;
        exp.targetName = ref.name;

        d8::kube::DataExportRepository(*ks.client).create(*call.ctx, exp);
        return ok(fmt::format("DataExport {}/{} created\n", exp.namespace_, exp.name));
    });
}

CommandResult handle_export_delete(const CommandCall& call) {
    if (wantsHelp(call)) return usage(call.constructFullArgs());
    if (const auto bad = checkPositionals(call, 1, 1)) return *bad;

    return runGuarded("export delete", [&] {
        auto ks = openKubeSession();
        const auto ns = namespaceFor(call);
        d8::kube::DataExportRepository(*ks.client).remove(*call.ctx, call.positionals[0], ns);
        return ok(fmt::format("DataExport {}/{} deleted\n", ns, call.positionals[0]));
    });
}

CommandResult handle_export_list(const CommandCall& call) {
    if (wantsHelp(call)) return usage(call.constructFullArgs());
    if (const auto bad = checkPositionals(call, 1, 2)) return *bad;

    const auto path = withLeadingSlash(call.positionals.size() > 1 ? call.positionals[1] : "/");

    return runGuarded("export list", [&] {
        auto ks = openKubeSession();
        const auto prepared = prepareExport(call, ks, call.positionals[0]);
        const auto& session = prepared.session;

        if (session.volumeMode == d8::transfer::VolumeMode::Block) {
            d8::fs::LocalFileSystem fs;
            d8::transfer::Downloader(*session.httpClient, fs)
                .download(*call.ctx, session.baseURL, "", "", d8::transfer::VolumeMode::Block);
        } else {
            if (!path.ends_with('/')) throw std::invalid_argument(fmt::format("path must end with '/': {}", path));

            const auto url = d8::util::joinURL(session.baseURL, "api/v1/files" + path);
            LogRegistry::transfer()->info("[export list] Listing {}", url);

            RawListingSink sink(ConfigRegistry::get().transfer.error_body_limit);
            const auto resp = session.httpClient->get(*call.ctx, url, sink);
            if (resp.status != 200)
                throw d8::transfer::HttpStatusError("list " + path, resp.status, sink.excerpt());
        }

        offerCleanup(call, ks, prepared);
        return ok("");
    });
}

CommandResult handle_export_download(const CommandCall& call) {
    if (wantsHelp(call)) return usage(call.constructFullArgs());
    if (const auto bad = checkPositionals(call, 1, 2)) return *bad;

    const auto srcPath = withLeadingSlash(call.positionals.size() > 1 ? call.positionals[1] : "");
    const auto output = optVal(call, std::vector<std::string>{"output", "o"});
    if (output && *output == "-" && srcPath.ends_with('/'))
        return invalid(call.constructFullArgs(),
                       fmt::format("export download: cannot write directory {} to stdout, pass -o <dir>", srcPath));

    return runGuarded("export download", [&]() -> CommandResult {
        auto ks = openKubeSession();
        const auto prepared = prepareExport(call, ks, call.positionals[0]);
        const auto& session = prepared.session;
        const bool block = session.volumeMode == d8::transfer::VolumeMode::Block;

        std::string dst;
        if (output && !output->empty()) dst = *output == "-" ? "" : *output;
        else dst = block ? prepared.name : defaultOutputFor(srcPath);

        d8::fs::LocalFileSystem fs;
        d8::transfer::Downloader downloader(*session.httpClient, fs);

        return downloadThenCleanup(
            [&] { return downloader.download(*call.ctx, session.baseURL, block ? "" : srcPath, dst, session.volumeMode); },
            [&] { offerCleanup(call, ks, prepared); },
            [&](const d8::transfer::DownloadStats& stats) -> std::string {
                if (dst.empty()) return "";
                return block ? fmt::format("Downloaded disk image to {}\n", dst)
                             : fmt::format("Downloaded {} file(s) to {}\n", stats.files, dst);
            });
    });
}

bool isExportMatch(const std::string& cmd, const std::string_view input) {
    return isCommandMatch({"export", cmd}, input);
}

CommandResult handle_export(const CommandCall& call) {
    if (call.positionals.empty()) return wantsHelp(call) ? usage({"export"}) : invalid({"export"}, "export: missing subcommand");

    const auto [sub, subcall] = descend(call);

    if (isExportMatch("create", sub)) return handle_export_create(subcall);
    if (isExportMatch("delete", sub)) return handle_export_delete(subcall);
    if (isExportMatch("list", sub)) return handle_export_list(subcall);
    if (isExportMatch("download", sub)) return handle_export_download(subcall);

    return invalid({"export"}, fmt::format("Unknown export subcommand: '{}'", sub));
}

CommandResult handle_deprecated(const CommandCall& call) {
    return invalid(fmt::format("'{}' has moved: use `d8-data export {}` instead", call.name, call.name));
}

}

void d8::shell::commands::registerExportCommands(Router& r) {
    const auto& usages = UsageManager::instance();
    r.registerCommand(usages.resolve("export"), handle_export);
    for (const auto* verb : {"create", "delete", "list", "download"})
        r.registerCommand(usages.resolve(verb), handle_deprecated);
}

CommandResult d8::shell::commands::downloadThenCleanup(
    const std::function<d8::transfer::DownloadStats()>& download,
    const std::function<void()>& cleanup,
    const std::function<std::string(const d8::transfer::DownloadStats&)>& summary) {
    d8::transfer::DownloadStats stats;
    try {
        stats = download();
    } catch (const d8::transfer::PartialDownloadError& e) {
        cleanup();
        return failed(fmt::format("downloaded {} file(s) before failure: {}", e.filesDownloaded(), e.what()));
    }

    cleanup();
    return ok(summary(stats));
}

std::string d8::shell::commands::defaultDownloadOutput(const std::string& srcPath) {
    return defaultOutputFor(srcPath);
}
