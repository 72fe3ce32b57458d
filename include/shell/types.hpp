#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace d8::concurrency {
class Context;
}

namespace d8::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
    std::vector<std::string> path; // command words consumed so far, for help lookup

    std::shared_ptr<concurrency::Context> ctx; // cancelled on SIGINT/SIGTERM

    [[nodiscard]] inline std::vector<std::string> constructFullArgs() const {
        std::vector<std::string> args = path;
        if (args.empty() && !name.empty()) args.push_back(name);
        return args;
    }
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success, 1 = failure, 2 = usage
    std::string stdout_text;
    std::string stderr_text;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string description;
    CommandHandler handler;
    std::unordered_set<std::string> aliases;
};

}
