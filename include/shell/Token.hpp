#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace d8::shell {

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;
    bool glued = false; // value written as --key=value or -kVALUE
};

inline bool looks_negative_number(std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    bool dot = false, digit = false;
    for (size_t i = 1; i < s.size(); ++i) {
        const char c = s[i];
        if (c >= '0' && c <= '9') { digit = true; continue; }
        if (c == '.' && !dot) { dot = true; continue; }
        return false;
    }
    return digit;
}

inline void pushFlag(std::vector<Token>& out, std::string k) {
    out.push_back({TokenType::Flag, std::move(k), false});
}

inline void pushWord(std::vector<Token>& out, std::string v, const bool glued = false) {
    out.push_back({TokenType::Word, std::move(v), glued});
}

// "-kVALUE" vs bundle "-abc": a tail with path/number characters is a value.
inline bool looks_glued_value(std::string_view tail) {
    if (!tail.empty() && tail.front() == '=') return true;
    if (std::ranges::all_of(tail, [](char c) { return c >= '0' && c <= '9'; })) return true;
    return std::ranges::any_of(tail, [](char c) { return c == '/' || c == '.' || c == ':' || c == '='; });
}

inline void expand_bundle(std::string_view bundle, std::vector<Token>& out) {
    for (const char c : bundle) pushFlag(out, std::string(1, c));
}

// argv is already split by the invoking shell, so every element is one atom.
inline std::vector<Token> tokenize(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size() + 4);

    for (const auto& atom : args) {
        if (atom == "--" || atom == "-" || atom.empty() || atom[0] != '-' || looks_negative_number(atom)) {
            pushWord(out, atom);
            continue;
        }

        if (atom.starts_with("--")) {
            const auto eq = atom.find('=');
            if (eq == std::string::npos) {
                pushFlag(out, atom.substr(2));
            } else {
                pushFlag(out, atom.substr(2, eq - 2));
                pushWord(out, atom.substr(eq + 1), true);
            }
            continue;
        }

        if (atom.size() == 2) {
            pushFlag(out, atom.substr(1));
            continue;
        }

        const std::string_view tail = std::string_view(atom).substr(2);
        if (looks_glued_value(tail)) {
            pushFlag(out, std::string(1, atom[1]));
            std::string value(tail);
            if (value.front() == '=') value.erase(value.begin());
            pushWord(out, std::move(value), true);
        } else {
            expand_bundle(std::string_view(atom).substr(1), out);
        }
    }

    return out;
}

inline std::string to_string(const Token& t) {
    switch (t.type) {
    case TokenType::Word: return (t.glued ? "Glued(" : "Word(") + t.text + ")";
    case TokenType::Flag: return "Flag(" + t.text + ")";
    }
    return "UnknownToken";
}

inline std::string to_string(const std::vector<Token>& tokens) {
    std::string out;
    out.reserve(64 + tokens.size() * 16);
    for (const auto& t : tokens) {
        if (!out.empty()) out += " ";
        out += to_string(t);
    }
    return out;
}

}
