#include "util/shellArgsHelpers.hpp"
#include "shell/CommandUsage.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <limits>

using namespace d8::shell;

CommandResult d8::shell::invalid(std::string msg) { return {2, "", std::move(msg)}; }
CommandResult d8::shell::ok(std::string out) { return {0, std::move(out), ""}; }
CommandResult d8::shell::failed(std::string msg) { return {1, "", std::move(msg)}; }

CommandResult d8::shell::invalid(const std::vector<std::string>& args, std::string msg) {
    return {2, UsageManager::instance().renderHelp(args), std::move(msg)};
}

CommandResult d8::shell::usage(const std::vector<std::string>& args) {
    return {0, UsageManager::instance().renderHelp(args), ""};
}

std::optional<std::string> d8::shell::optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

std::optional<std::string> d8::shell::optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& key : keys) if (auto v = optVal(c, key)) return v;
    return std::nullopt;
}

bool d8::shell::hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}

bool d8::shell::hasKey(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

bool d8::shell::wantsHelp(const CommandCall& c) {
    return hasKey(c, "help") || hasKey(c, "h");
}

std::optional<unsigned int> d8::shell::parseUInt(const std::string& sv) {
    if (sv.empty()) return std::nullopt;

    unsigned long long v = 0;
    for (const char c : sv) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > std::numeric_limits<unsigned int>::max()) return std::nullopt;
    }

    return static_cast<unsigned int>(v);
}

std::optional<bool> d8::shell::parseBool(const std::string_view s) {
    if (s == "1" || s == "t" || s == "T" || s == "TRUE" || s == "true" || s == "True") return true;
    if (s == "0" || s == "f" || s == "F" || s == "FALSE" || s == "false" || s == "False") return false;
    return std::nullopt;
}

PublishParse d8::shell::parsePublish(const CommandCall& c, const std::vector<std::string>& keys) {
    PublishParse out;
    for (const auto& key : keys) {
        for (const auto& [k, v] : c.options) {
            if (k != key) continue;
            out.explicit_ = true;
            if (!v) {
                out.value = true;
                out.ok = true;
                return out;
            }
            const auto parsed = parseBool(*v);
            if (!parsed) {
                out.error = fmt::format("invalid value for --publish: '{}' (expected true or false)", *v);
                return out;
            }
            out.value = *parsed;
            out.ok = true;
            return out;
        }
    }
    out.ok = true;
    return out;
}

bool d8::shell::isCommandMatch(const std::vector<std::string>& path, std::string_view subcmd) {
    const auto usage = UsageManager::instance().resolve(path);
    return std::ranges::any_of(usage->aliases, [&](const auto& alias) { return alias == subcmd; });
}

std::pair<std::string, CommandCall> d8::shell::descend(const CommandCall& call) {
    if (call.positionals.empty()) return {"", call};
    std::string sub = call.positionals[0];
    CommandCall subcall = call;
    subcall.positionals.erase(subcall.positionals.begin());
    if (subcall.path.empty()) subcall.path.push_back(call.name);
    subcall.path.push_back(sub);
    return {sub, subcall};
}

std::optional<CommandResult> d8::shell::checkPositionals(const CommandCall& call, const std::size_t min, const std::size_t max) {
    const auto n = call.positionals.size();
    if (n >= min && n <= max) return std::nullopt;
    const auto cmd = fmt::format("{}", fmt::join(call.constructFullArgs(), " "));
    if (n < min) return invalid(call.constructFullArgs(), fmt::format("{}: missing required argument(s)", cmd));
    return invalid(call.constructFullArgs(), fmt::format("{}: too many arguments", cmd));
}
