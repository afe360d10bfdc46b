#include "srelvis/help.hpp"

#include <algorithm>
#include <utility>

#include "srelvis/escape.hpp"
#include "srelvis/utils.hpp"

namespace {

using srelvis::OptionType;

struct Entry {
    std::vector<std::string> lines;
    std::string description;
    const srelvis::VarOption* variable{nullptr};  // null for flags
};

// "  -a=META, -abc=META": the option and its aliases, sorted by name.
std::string optHeader(const std::string& name,
                             std::vector<std::string> aliases,
                             const std::string& prefix,
                             const std::string& suffix) {
    aliases.push_back(name);
    std::sort(aliases.begin(), aliases.end());
    std::string out = "  ";
    for (std::size_t i = 0; i < aliases.size(); ++i) {
        if (i) out += ", ";
        out += "-" + prefix + aliases[i] + suffix;
    }
    return out;
}

std::vector<std::string> variableLines(const srelvis::VarOption& opt) {
    const std::string suffix = "=" + opt.metavar();

    std::vector<std::string> lines;
    if (opt.type() == OptionType::List) {
        lines.push_back(optHeader(opt.name(), opt.aliases(), "add-", suffix));
        lines.push_back(optHeader(opt.name(), opt.aliases(), "clear-", ""));
        lines.push_back(optHeader(opt.name(), opt.aliases(), "remove-", suffix));
    } else {
        lines.push_back(optHeader(opt.name(), opt.aliases(), "", suffix));
    }

    // Enum values are aligned just past the last '=' of the last header.
    if (opt.isEnumLike()) {
        const auto offset = lines.back().rfind('=') + 1;
        for (const auto& value : opt.values()) lines.push_back(std::string(offset, ' ') + value);
    }
    return lines;
}

std::vector<std::string> flagLines(const srelvis::FlagOption& flag) {
    if (flag.targetType() == OptionType::List) {
        return {optHeader(flag.name(), flag.aliases(), "add-", ""),
                optHeader(flag.name(), flag.aliases(), "remove-", "")};
    }
    return {optHeader(flag.name(), flag.aliases(), "", "")};
}

} // namespace

namespace srelvis {

std::string flagDescription(const OptionGraph& graph, const FlagOption& flag) {
    if (flag.targetType() == OptionType::List) {
        const auto* target = graph.findVariable(flag.target());
        const auto elementType = target ? target->elementType() : OptionType::Anything;
        return "An alias for the '" + std::string(optionTypeName(elementType)) + "' list option '" + flag.target() +
               "' with the values '" + utils::join(flag.listValues(), ",") + "'";
    }
    return "An alias for -" + flag.target() + "=" + flag.value();
}

std::vector<std::string> localHelpLines(const OptionGraph& graph) {
    if (!graph.anyOptions()) return {};

    constexpr OptionType kHelpOrder[] = {OptionType::Bool, OptionType::Enum, OptionType::Anything,
                                         OptionType::Special, OptionType::List};

    std::vector<Entry> entries;
    for (const auto type : kHelpOrder) {
        for (const auto* opt : graph.bucket(type)) {
            entries.push_back(Entry{variableLines(*opt), opt->description(), opt});
        }
    }
    // Flags follow, grouped by the type of their target.
    for (const auto type : kHelpOrder) {
        for (const auto& flag : graph.flags()) {
            if (flag.targetType() != type) continue;
            entries.push_back(Entry{flagLines(flag), flagDescription(graph, flag), nullptr});
        }
    }

    std::size_t longest = 0;
    for (const auto& e : entries) {
        for (const auto& line : e.lines) longest = std::max(longest, line.size());
    }

    std::vector<std::string> out;
    const std::string indent(longest + 4, ' ');
    for (const auto& e : entries) {
        for (std::size_t i = 0; i < e.lines.size(); ++i) {
            std::string line = e.lines[i] + std::string(longest - e.lines[i].size(), ' ');
            if (i == 0) {
                line += "    " + escape::escapeHeredoc(e.description);
            } else {
                line += "  | ";
            }
            out.push_back(std::move(line));
        }
        if (!e.variable) continue;

        const auto var = graph.variableName(e.variable->name());
        out.push_back(indent + "Default: $" + var);
        if (e.variable->type() == OptionType::Special) {
            const char* global = e.variable->specialKind() == SpecialKind::Results ? "SURFRAW_results" : "SURFRAW_lang";
            out.push_back(indent + "Environment: " + var + ", " + global);
        } else {
            out.push_back(indent + "Environment: " + var);
        }
    }
    return out;
}

void printLocalHelp(std::ostream& os, const OptionGraph& graph) {
    for (const auto& line : localHelpLines(graph)) os << line << "\n";
}

} // namespace srelvis
