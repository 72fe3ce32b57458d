#include "shell/Router.hpp"
#include "shell/Token.hpp"
#include "shell/Parser.hpp"
#include "shell/commands/all.hpp"
#include "util/shellArgsHelpers.hpp"
#include "concurrency/Context.hpp"
#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>

#include <csignal>
#include <cstdio>
#include <string>
#include <vector>

using namespace d8::config;
using namespace d8::concurrency;
using namespace d8::logging;
using namespace d8::shell;

namespace {
Context* rootContext = nullptr;

void signalHandler(const int) {
    if (rootContext) rootContext->cancel();
}

void applyGlobalFlags(const CommandCall& call) {
    auto& cfg = ConfigRegistry::mutableConfig();
    if (const auto kc = optVal(call, "kubeconfig"); kc && !kc->empty()) cfg.kube.kubeconfig = *kc;
    if (const auto ctx = optVal(call, "context"); ctx && !ctx->empty()) cfg.kube.context = *ctx;
    if (hasKey(call, "verbose") || hasKey(call, "v")) LogRegistry::setVerbose(true);
}

void emit(const CommandResult& res) {
    if (!res.stdout_text.empty()) {
        std::fputs(res.stdout_text.c_str(), stdout);
        if (res.stdout_text.back() != '\n') std::fputc('\n', stdout);
    }
    if (!res.stderr_text.empty()) fmt::print(stderr, "Error: {}\n", res.stderr_text);
}
}

int main(const int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    try {
        const auto globals = parseTokens(tokenize(args));
        const auto configFlag = optVal(globals, "config");
        ConfigRegistry::init(d8::paths::getConfigPath(configFlag && !configFlag->empty()
                                                      ? std::optional<std::filesystem::path>(*configFlag)
                                                      : std::nullopt));
        LogRegistry::init();
        applyGlobalFlags(globals);

        const auto root = Context::background();
        rootContext = root.get();
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        Router router;
        commands::registerAllCommands(router);

        const auto res = router.execute(args, root);
        emit(res);

        std::fflush(stdout);
        rootContext = nullptr;
        return res.exit_code;
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
