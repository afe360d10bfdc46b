#include "srelvis/completion.hpp"

#include <cctype>
#include <utility>

#include "srelvis/escape.hpp"
#include "srelvis/utils.hpp"
#include "srelvis/version.hpp"

namespace {

std::string sanitizeIdentifier(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char ch : s) {
        if (std::isalnum(ch) || ch == '_') out.push_back(static_cast<char>(ch));
        else out.push_back('_');
    }
    return out;
}

} // namespace

namespace srelvis {

Completions completionsFor(const OptionGraph& graph) {
    Completions c;

    for (const auto* o : graph.bucketedVariables()) {
        std::vector<std::string> names{o->name()};
        names.insert(names.end(), o->aliases().begin(), o->aliases().end());

        ValueCompletion entry;
        if (o->type() == OptionType::Bool) entry.values = {"yes", "no"};
        if (o->isEnumLike()) entry.values = o->values();

        for (const auto& n : names) {
            if (o->type() == OptionType::List) {
                c.options.push_back("add-" + n + "=");
                c.options.push_back("remove-" + n + "=");
                c.options.push_back("clear-" + n);
                entry.patterns.push_back("-add-" + n + "=*");
                entry.patterns.push_back("-remove-" + n + "=*");
            } else {
                if (o->type() == OptionType::Bool) c.options.push_back(n);
                c.options.push_back(n + "=");
                entry.patterns.push_back("-" + n + "=*");
            }
        }
        if (!entry.values.empty()) c.values.push_back(std::move(entry));
    }

    for (const auto* f : graph.bucketedFlags()) {
        std::vector<std::string> names{f->name()};
        names.insert(names.end(), f->aliases().begin(), f->aliases().end());
        for (const auto& n : names) {
            if (f->targetType() == OptionType::List) {
                c.options.push_back("add-" + n);
                c.options.push_back("remove-" + n);
            } else {
                c.options.push_back(n);
            }
        }
    }
    return c;
}

void printBashCompletion(std::ostream& os, const OptionGraph& graph) {
    const auto c = completionsFor(graph);
    const auto fn = "_surfraw_" + sanitizeIdentifier(graph.name()) + "_complete";

    std::vector<std::string> words;
    for (const auto& o : c.options) words.push_back("-" + o);

    os << "# bash completion for the " << graph.name() << " elvis\n";
    os << "# Generated by " << graph.config().generator << " (srelvis) " << SRELVIS_VERSION << "\n";
    os << fn << "() {\n";
    os << "  local cur word prefix\n";
    // The whole word under the cursor, even when '=' is in COMP_WORDBREAKS.
    os << "  cur=\"${COMP_LINE:0:COMP_POINT}\"\n";
    os << "  cur=\"${cur##*[[:space:]]}\"\n";
    os << "  word=\"${cur#*=}\"\n";
    os << "  prefix=\"${cur%%=*}=\"\n";
    os << "  [[ \"$COMP_WORDBREAKS\" == *=* ]] && prefix=\"\"\n";
    os << "  COMPREPLY=()\n";
    os << "  case \"$cur\" in\n";
    for (const auto& v : c.values) {
        os << "    " << utils::join(v.patterns, "|") << ")\n";
        os << "      COMPREPLY=( $(compgen -P \"$prefix\" -W \"" << utils::join(v.values, " ")
           << "\" -- \"$word\") )\n";
        os << "      ;;\n";
    }
    os << "    -*=*)\n";
    os << "      ;;\n";
    os << "    -*)\n";
    os << "      COMPREPLY=( $(compgen -W \"" << utils::join(words, " ") << "\" -- \"$cur\") )\n";
    os << "      if [[ ${#COMPREPLY[@]} -eq 1 && \"${COMPREPLY[0]}\" == *= ]]; then\n";
    os << "        compopt -o nospace\n";
    os << "      fi\n";
    os << "      ;;\n";
    os << "  esac\n";
    os << "}\n";
    os << "complete -F " << fn << " " << escape::shellSingleQuote(graph.name()) << "\n";
}

} // namespace srelvis
