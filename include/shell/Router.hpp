#pragma once

#include "shell/types.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace d8::shell {

class CommandUsage;

class Router {
public:
    void registerCommand(const std::shared_ptr<CommandUsage>& usage, CommandHandler handler);

    // args excludes argv[0]
    CommandResult execute(const std::vector<std::string>& args,
                          const std::shared_ptr<concurrency::Context>& ctx) const;

    [[nodiscard]] bool has(const std::string& nameOrAlias) const;

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical

    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
};

}
