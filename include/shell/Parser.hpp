#pragma once

#include "shell/Token.hpp"
#include "shell/types.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace d8::shell {

// Flags that never take a detached value: `--publish export` keeps `export` positional.
inline const std::unordered_set<std::string>& booleanFlags() {
    static const std::unordered_set<std::string> flags{
        "publish", "P", "resume", "wffc", "v", "verbose", "h", "help"
    };
    return flags;
}

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c,
                   const std::string& key,
                   const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

// The first Word is the command name. Flags may appear anywhere, including before it.
inline CommandCall parseTokens(const std::vector<Token>& toks,
                               const std::unordered_set<std::string>& boolFlags = booleanFlags()) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    bool stop_flags = false;

    for (size_t i = 0; i < toks.size(); ++i) {
        const Token& t = toks[i];

        if (!stop_flags && t.type == TokenType::Word && t.text == "--" && !t.glued) {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            const auto& key = t.text;
            const bool hasNext = i + 1 < toks.size() && toks[i + 1].type == TokenType::Word;
            const bool takesValue = hasNext && (toks[i + 1].glued || !boolFlags.contains(key));
            if (takesValue) {
                setOpt(call, key, toks[i + 1].text);
                ++i;
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        if (call.name.empty() && !stop_flags) {
            call.name = t.text;
            continue;
        }

        call.positionals.push_back(t.text);
    }

    return call;
}

}
