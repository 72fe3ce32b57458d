#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace d8::shell {

// A labeled entry (positional or option), with optional aliases.
struct Entry {
    std::string label;                  // e.g. "--namespace" or "NAME"
    std::string desc;
    std::vector<std::string> aliases;   // e.g. {"-n"}
    bool required = false;
};

// Example: {"d8-data export download pvc/data /dir/ -o ./out", "Download a directory"}
struct Example {
    std::string cmd;
    std::string note;
};

// ANSI color theme. Set enabled=false to disable.
struct ColorTheme {
    bool enabled = false;

    std::string header = "\033[1;36m";  // section titles (bold cyan)
    std::string command = "\033[1;32m"; // command name (bold green)
    std::string key = "\033[33m";       // left column keys (yellow)
    std::string reset = "\033[0m";

    [[nodiscard]] std::string maybe(const std::string& code) const {
        return enabled ? code : "";
    }
    [[nodiscard]] std::string H() const { return maybe(header); }
    [[nodiscard]] std::string C() const { return maybe(command); }
    [[nodiscard]] std::string K() const { return maybe(key); }
    [[nodiscard]] std::string R() const { return maybe(reset); }
};

class CommandUsage : public std::enable_shared_from_this<CommandUsage> {
public:
    std::vector<std::string> aliases;   // aliases[0] is the primary name
    std::string description;
    std::optional<std::string> synopsis; // if empty, synthesized
    std::weak_ptr<CommandUsage> parent;
    std::vector<std::shared_ptr<CommandUsage>> subcommands;
    std::vector<Entry> positionals;
    std::vector<Entry> options;
    std::vector<Example> examples;

    int term_width = 100;
    std::size_t max_key_col = 30;
    ColorTheme theme{};

    [[nodiscard]] std::string primary() const;
    [[nodiscard]] bool matches(const std::string& alias) const;

    [[nodiscard]] std::shared_ptr<CommandUsage> findSubcommand(const std::string& alias) const;

    // Attaches child and sets its parent link.
    std::shared_ptr<CommandUsage> addSubcommand(std::shared_ptr<CommandUsage> child);

    [[nodiscard]] std::string str() const;

private:
    [[nodiscard]] std::string commandPath_() const;
    [[nodiscard]] std::string buildSynopsis_() const;
    [[nodiscard]] static std::string normalizePositional_(const Entry& e);
};

// Owns the usage tree rooted at the binary name.
class UsageManager {
public:
    UsageManager();

    [[nodiscard]] const std::shared_ptr<CommandUsage>& root() const { return root_; }

    // Longest matching prefix of args; the root when nothing matches.
    [[nodiscard]] std::shared_ptr<CommandUsage> resolve(const std::vector<std::string>& args) const;
    [[nodiscard]] std::shared_ptr<CommandUsage> resolve(const std::string& topLevel) const;
    [[nodiscard]] std::string renderHelp(const std::vector<std::string>& args) const;

    static const UsageManager& instance();

private:
    std::shared_ptr<CommandUsage> root_;
};

std::shared_ptr<CommandUsage> exportUsage();
std::shared_ptr<CommandUsage> importUsage();
std::vector<std::shared_ptr<CommandUsage>> deprecatedUsages();

}
