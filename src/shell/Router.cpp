#include "shell/Router.hpp"
#include "shell/Token.hpp"
#include "shell/Parser.hpp"
#include "shell/CommandUsage.hpp"
#include "logging/LogRegistry.hpp"
#include "util/shellArgsHelpers.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <cctype>
#include <string>

using namespace d8::shell;
using namespace d8::logging;

void Router::registerCommand(const std::shared_ptr<CommandUsage>& usage, CommandHandler handler) {
    const std::string key = normalize(usage->primary());

    CommandInfo info{usage->description.empty() ? "No description provided." : usage->description, std::move(handler), {}};

    for (const std::string& alias : usage->aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            LogRegistry::shell()->warn("Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                       a, aliasMap_.at(a), key);
            continue;
        }
        info.aliases.insert(a);
        aliasMap_[a] = key;
        LogRegistry::shell()->debug("Alias '{}' mapped to '{}'", a, key);
    }

    commands_[key] = std::move(info);
}

bool Router::has(const std::string& nameOrAlias) const {
    return commands_.contains(canonicalFor(nameOrAlias));
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    const std::string n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n;
}

CommandResult Router::execute(const std::vector<std::string>& args,
                              const std::shared_ptr<concurrency::Context>& ctx) const {
    const auto tokens = tokenize(args);
    LogRegistry::shell()->debug("[Router] Tokens: {}", to_string(tokens));

    auto call = parseTokens(tokens);
    call.ctx = ctx;

    if (call.name.empty()) {
        if (wantsHelp(call)) return usage();
        return invalid(std::vector<std::string>{}, "No command provided.");
    }

    const auto canonical = canonicalFor(call.name);
    if (!commands_.contains(canonical))
        return invalid(std::vector<std::string>{}, fmt::format("Unknown command: {}", call.name));

    call.name = canonical;
    LogRegistry::shell()->debug("[Router] Executing command '{}' with positionals [{}]",
                                canonical, fmt::join(call.positionals, ", "));

    return commands_.at(canonical).handler(call);
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}
