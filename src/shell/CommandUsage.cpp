#include "shell/CommandUsage.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace d8::shell {

namespace {

std::string trimRight(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

std::vector<std::string> wrap(const std::string& s, int width) {
    const int W = std::max(20, width);
    std::vector<std::string> out;
    std::size_t i = 0, n = s.size();
    while (i < n) {
        while (i < n && std::isspace(static_cast<unsigned char>(s[i])) && s[i] != '\n') ++i;

        if (i < n && s[i] == '\n') {
            out.emplace_back("");
            ++i;
            continue;
        }

        if (i >= n) break;

        const std::size_t end = std::min<std::size_t>(i + W, n);
        std::size_t break_pos = end;

        if (end < n && s[end] != ' ') {
            auto sp = s.rfind(' ', end);
            if (sp != std::string::npos && sp >= i) break_pos = sp;
        }

        if (break_pos == i) break_pos = end;

        out.push_back(trimRight(s.substr(i, break_pos - i)));

        if (break_pos < n && s[break_pos] == ' ') i = break_pos + 1;
        else i = break_pos;
    }
    if (out.empty()) out.emplace_back("");
    return out;
}

std::string keyOf(const Entry& e) {
    if (e.aliases.empty()) return e.label;
    return fmt::format("{}, {}", fmt::join(e.aliases, ", "), e.label);
}

std::string padRight(const std::string& s, std::size_t width) {
    if (s.size() >= width) return s;
    return s + std::string(width - s.size(), ' ');
}

void emitTwoColSection(std::ostringstream& out,
                       const std::string& title,
                       const std::vector<Entry>& items,
                       int width,
                       std::size_t max_key_col,
                       const ColorTheme& theme) {
    if (items.empty()) return;
    constexpr std::size_t indent = 2, gap = 3;

    std::size_t keyw = 0;
    for (const auto& it : items) keyw = std::max(keyw, keyOf(it).size());
    keyw = std::min(keyw, max_key_col);

    out << theme.H() << title << theme.R() << "\n";
    const int rightw = width - static_cast<int>(indent + keyw + gap);
    for (const auto& it : items) {
        const auto desc_lines = wrap(it.desc, std::max(20, rightw));
        out << std::string(indent, ' ') << theme.K() << padRight(keyOf(it), keyw) << theme.R()
            << std::string(gap, ' ') << desc_lines[0] << "\n";
        for (std::size_t i = 1; i < desc_lines.size(); ++i)
            out << std::string(indent + keyw + gap, ' ') << desc_lines[i] << "\n";
    }
    out << "\n";
}

}

std::string CommandUsage::primary() const {
    return aliases.empty() ? std::string{} : aliases.front();
}

bool CommandUsage::matches(const std::string& alias) const {
    return std::ranges::find(aliases, alias) != aliases.end();
}

std::shared_ptr<CommandUsage> CommandUsage::findSubcommand(const std::string& alias) const {
    for (const auto& sub : subcommands) if (sub->matches(alias)) return sub;
    return nullptr;
}

std::shared_ptr<CommandUsage> CommandUsage::addSubcommand(std::shared_ptr<CommandUsage> child) {
    child->parent = weak_from_this();
    subcommands.push_back(child);
    return child;
}

std::string CommandUsage::commandPath_() const {
    std::vector<std::string> parts{primary()};
    for (auto p = parent.lock(); p; p = p->parent.lock()) parts.push_back(p->primary());
    std::ranges::reverse(parts);
    return fmt::format("{}", fmt::join(parts, " "));
}

std::string CommandUsage::normalizePositional_(const Entry& e) {
    if (e.label.find('<') != std::string::npos || e.label.find('[') != std::string::npos) return e.label;
    return e.required ? e.label : fmt::format("[{}]", e.label);
}

std::string CommandUsage::buildSynopsis_() const {
    if (synopsis) return fmt::format("{} {}", commandPath_(), *synopsis);

    std::ostringstream syn;
    syn << commandPath_();
    if (!subcommands.empty()) syn << " <command>";
    for (const auto& p : positionals) syn << " " << normalizePositional_(p);
    if (!options.empty()) syn << " [flags]";
    return syn.str();
}

std::string CommandUsage::str() const {
    std::ostringstream out;

    if (!description.empty()) {
        for (const auto& ln : wrap(description, term_width)) out << ln << "\n";
        out << "\n";
    }

    out << theme.H() << "Usage:" << theme.R() << "\n";
    out << "  " << theme.C() << buildSynopsis_() << theme.R() << "\n\n";

    if (aliases.size() > 1) {
        out << theme.H() << "Aliases:" << theme.R() << "\n";
        out << "  " << fmt::format("{}", fmt::join(aliases, ", ")) << "\n\n";
    }

    if (!subcommands.empty()) {
        std::vector<Entry> cmds;
        cmds.reserve(subcommands.size());
        for (const auto& sub : subcommands) cmds.push_back({sub->primary(), sub->description, {}});
        emitTwoColSection(out, "Commands:", cmds, term_width, max_key_col, theme);
    }

    emitTwoColSection(out, "Arguments:", positionals, term_width, max_key_col, theme);
    emitTwoColSection(out, "Flags:", options, term_width, max_key_col, theme);

    if (!examples.empty()) {
        out << theme.H() << "Examples:" << theme.R() << "\n";
        for (const auto& ex : examples) {
            if (!ex.note.empty()) out << "  # " << ex.note << "\n";
            out << "  " << ex.cmd << "\n";
        }
        out << "\n";
    }

    return trimRight(out.str()) + "\n";
}

}
