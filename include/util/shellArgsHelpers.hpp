#pragma once

#include "shell/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace d8::shell {

class CommandUsage;

struct PublishParse {
    bool ok = false;
    bool explicit_ = false; // false when the flag is absent
    bool value = false;
    std::string error;
};

CommandResult invalid(std::string msg);
CommandResult invalid(const std::vector<std::string>& args, std::string msg);
CommandResult ok(std::string out);
CommandResult failed(std::string msg);
CommandResult usage(const std::vector<std::string>& args = {});

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);

std::optional<unsigned int> parseUInt(const std::string& sv);

// 1 t T TRUE true True / 0 f F FALSE false False
std::optional<bool> parseBool(std::string_view s);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasKey(const CommandCall& c, const std::string& key);
[[nodiscard]] bool wantsHelp(const CommandCall& c);

// Absent -> not explicit; bare flag -> true; --publish=VALUE -> parsed.
PublishParse parsePublish(const CommandCall& c, const std::vector<std::string>& keys = {"publish"});

bool isCommandMatch(const std::vector<std::string>& path, std::string_view subcmd);

// Pops the first positional as the subcommand and records it in the call's path.
std::pair<std::string, CommandCall> descend(const CommandCall& call);

// Rejects calls whose positional count falls outside [min, max].
std::optional<CommandResult> checkPositionals(const CommandCall& call, std::size_t min, std::size_t max);

}
