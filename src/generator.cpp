#include "srelvis/generator.hpp"

#include <sstream>
#include <utility>

#include "srelvis/completion.hpp"
#include "srelvis/escape.hpp"
#include "srelvis/help.hpp"
#include "srelvis/utils.hpp"
#include "srelvis/version.hpp"

namespace {

using srelvis::OptionType;
using srelvis::escape::shellSingleQuote;

constexpr const char* kIndent = "    ";

struct Arm {
    std::vector<std::string> labels;
    std::string action;
};

// One arm per pattern slot, labels gathered across the option and its aliases.
std::vector<Arm> armsFor(OptionType targetType,
                         bool isFlag,
                         const std::string& name,
                         const std::vector<std::string>& aliases,
                         const std::vector<std::string>& actions) {
    std::vector<Arm> arms;
    for (const auto& action : actions) arms.push_back(Arm{{}, action});
    std::vector<std::string> names{name};
    names.insert(names.end(), aliases.begin(), aliases.end());
    for (const auto& n : names) {
        const auto patterns = srelvis::parsePatterns(targetType, isFlag, n);
        for (std::size_t i = 0; i < patterns.size() && i < arms.size(); ++i) arms[i].labels.push_back(patterns[i]);
    }
    return arms;
}

std::string oneLine(std::string s) {
    for (auto& ch : s) {
        if (ch == '\n' || ch == '\r') ch = ' ';
    }
    return s;
}

} // namespace

namespace srelvis {

void Generator::render(std::ostream& os) const {
    header(os);
    usageHook(os);
    configHook(os);
    if (graph_.hasLists()) listContextHelpers(os);
    parseHook(os);
    if (graph_.config().enableCompletions && graph_.anyOptions()) completionHook(os);
    parseArgs(os);
    enumChecks(os);
    collapses(os);
    urlParameters(os);
    inlines(os);
    dispatch(os);
}

std::string Generator::render() const {
    std::ostringstream oss;
    render(oss);
    return oss.str();
}

void Generator::header(std::ostream& os) const {
    const auto& cfg = graph_.config();
    os << "# elvis: " << graph_.name() << std::string(static_cast<std::size_t>(cfg.numTabs), '\t') << "-- "
       << oneLine(graph_.description()) << "\n";
    os << "# Generated by " << cfg.generator << " (srelvis) " << SRELVIS_VERSION << "\n";
    os << ". surfraw || exit 1\n";
    os << "\n";
    // Both URLs stay open to parameter expansion and command substitution.
    os << "base_url=\"" << graph_.baseUrl() << "\"\n";
    os << "search_url=\"" << graph_.searchUrl() << "\"\n";
    os << "\n";
}

void Generator::usageHook(std::ostream& os) const {
    os << "w3_usage_hook () {\n";
    os << kIndent << "cat <<EOF\n";
    os << "Usage: $w3_argv0 [options] [search words]...\n";
    os << "Description:\n";
    os << "  " << escape::escapeHeredoc(graph_.description()) << "\n";
    if (graph_.anyOptions()) {
        os << "Local options:\n";
        printLocalHelp(os, graph_);
    }
    os << "EOF\n";
    os << kIndent << "w3_global_usage\n";
    os << "}\n\n";
}

void Generator::configHook(std::ostream& os) const {
    os << "w3_config_hook () {\n";
    bool any = false;

    const auto bools = graph_.bucket(OptionType::Bool);
    if (bools.empty()) os << kIndent << "# defyn SURFRAW_" << graph_.name() << "_NAME yes\n";
    for (const auto* o : bools) {
        os << kIndent << "defyn " << var(o->name()) << " " << shellSingleQuote(o->defaultValue()) << "\n";
        any = true;
    }

    const auto enums = graph_.bucket(OptionType::Enum);
    if (enums.empty()) os << kIndent << "# def SURFRAW_" << graph_.name() << "_NAME 'value'\n";
    for (const auto* o : enums) {
        os << kIndent << "def " << var(o->name()) << " " << shellSingleQuote(o->defaultValue()) << "\n";
        any = true;
    }

    const auto lists = graph_.bucket(OptionType::List);
    if (lists.empty()) os << kIndent << "# def SURFRAW_" << graph_.name() << "_NAME 'first,second'\n";
    for (const auto* o : lists) {
        os << kIndent << "def " << var(o->name()) << " " << shellSingleQuote(utils::join(o->defaults(), ","))
           << "\n";
        any = true;
    }

    const auto anythings = graph_.bucket(OptionType::Anything);
    if (anythings.empty()) os << kIndent << "# def SURFRAW_" << graph_.name() << "_NAME 'anything'\n";
    for (const auto* o : anythings) {
        os << kIndent << "def " << var(o->name()) << " " << shellSingleQuote(o->defaultValue()) << "\n";
        any = true;
    }

    const auto specials = graph_.bucket(OptionType::Special);
    if (specials.empty()) os << kIndent << "# def SURFRAW_" << graph_.name() << "_results \"$SURFRAW_results\"\n";
    for (const auto* o : specials) {
        // Special defaults are expansions of surfraw's own globals.
        os << kIndent << "def " << var(o->name()) << " \"" << o->defaultValue() << "\"\n";
        any = true;
    }

    if (!any) os << kIndent << ":\n";
    os << "}\n\n";
}

void Generator::listContextHelpers(std::ostream& os) const {
    os << "_sr_in_list_context=no\n";
    os << "_sr_enter_list_context () {\n";
    os << "    if [ \"$_sr_in_list_context\" = yes ]; then\n";
    os << "        err \"already in a list context\"\n";
    os << "    fi\n";
    os << "    _sr_in_list_context=yes\n";
    os << "    _sr_saved_ifs=\"$IFS\"\n";
    os << "    case \"$-\" in\n";
    os << "        *f*) _sr_noglob_was_set=yes ;;\n";
    os << "        *) _sr_noglob_was_set=no ;;\n";
    os << "    esac\n";
    os << "    IFS=,\n";
    os << "    set -f\n";
    os << "}\n";
    os << "_sr_leave_list_context () {\n";
    os << "    if [ \"$_sr_in_list_context\" = no ]; then\n";
    os << "        err \"not in a list context\"\n";
    os << "    fi\n";
    os << "    IFS=\"$_sr_saved_ifs\"\n";
    os << "    if [ \"$_sr_noglob_was_set\" = no ]; then\n";
    os << "        set +f\n";
    os << "    fi\n";
    os << "    _sr_in_list_context=no\n";
    os << "}\n";
    // $1 is always the name of a SURFRAW_ list variable, $2 a comma-separated list.
    os << "_sr_list_add () {\n";
    os << "    eval \"_sr_current=\\\"\\${$1}\\\"\"\n";
    os << "    if [ -z \"$_sr_current\" ]; then\n";
    os << "        eval \"$1=\\\"\\$2\\\"\"\n";
    os << "    else\n";
    os << "        eval \"$1=\\\"\\${_sr_current},\\$2\\\"\"\n";
    os << "    fi\n";
    os << "}\n";
    os << "_sr_list_remove () {\n";
    os << "    eval \"_sr_current=\\\"\\${$1}\\\"\"\n";
    os << "    _sr_result=\n";
    os << "    _sr_enter_list_context\n";
    os << "    for _sr_elem in $_sr_current; do\n";
    os << "        _sr_keep=yes\n";
    os << "        for _sr_pat in $2; do\n";
    os << "            if [ -n \"$_sr_pat\" ] && [ \"$_sr_elem\" = \"$_sr_pat\" ]; then\n";
    os << "                _sr_keep=no\n";
    os << "                break\n";
    os << "            fi\n";
    os << "        done\n";
    os << "        if [ \"$_sr_keep\" = yes ]; then\n";
    os << "            _sr_result=\"${_sr_result},${_sr_elem}\"\n";
    os << "        fi\n";
    os << "    done\n";
    os << "    _sr_leave_list_context\n";
    os << "    eval \"$1=\\\"\\${_sr_result#,}\\\"\"\n";
    os << "}\n";
    os << "_sr_list_clear () {\n";
    os << "    eval \"$1=\"\n";
    os << "}\n\n";
}

void Generator::parseHook(std::ostream& os) const {
    std::vector<Arm> arms;
    for (const auto* o : graph_.bucketedVariables()) {
        const auto v = var(o->name());
        std::vector<std::string> actions;
        switch (o->type()) {
            case OptionType::Bool:
                actions = {"setoptyn " + v + " \"$optarg\"", "setoptyn " + v + " yes"};
                break;
            case OptionType::List:
                actions = {"_sr_list_add " + v + " \"$optarg\"",
                           "_sr_list_remove " + v + " \"$optarg\"",
                           "_sr_list_clear " + v};
                break;
            default: actions = {"setopt " + v + " \"$optarg\""}; break;
        }
        for (auto& arm : armsFor(o->type(), false, o->name(), o->aliases(), actions)) arms.push_back(std::move(arm));
    }
    for (const auto* f : graph_.bucketedFlags()) {
        const auto v = var(f->target());
        std::vector<std::string> actions;
        switch (f->targetType()) {
            case OptionType::Bool: actions = {"setoptyn " + v + " " + shellSingleQuote(f->value())}; break;
            case OptionType::List: {
                const auto values = f->listValues();
                const auto patterns = escape::removalPatterns(values);
                actions = {values.empty() ? std::string(":")
                                          : "_sr_list_add " + v + " " + shellSingleQuote(utils::join(values, ",")),
                           patterns.empty()
                               ? std::string(":")
                               : "_sr_list_remove " + v + " " + shellSingleQuote(utils::join(patterns, ","))};
                break;
            }
            default: actions = {"setopt " + v + " " + shellSingleQuote(f->value())}; break;
        }
        for (auto& arm : armsFor(f->targetType(), true, f->name(), f->aliases(), actions)) {
            arms.push_back(std::move(arm));
        }
    }

    os << "w3_parse_option_hook () {\n";
    os << kIndent << "opt=\"$1\"\n";
    os << kIndent << "optarg=\"$2\"\n";
    os << kIndent << "case \"$opt\" in\n";
    for (const auto& arm : arms) {
        os << kIndent << kIndent << utils::join(arm.labels, "|") << ") " << arm.action << " ;;\n";
    }
    os << kIndent << kIndent << "*) return 1 ;;\n";
    os << kIndent << "esac\n";
    os << kIndent << "return 0\n";
    os << "}\n\n";
}

void Generator::completionHook(std::ostream& os) const {
    const auto c = completionsFor(graph_);

    os << "w3_complete_hook_opt () {\n";
    os << kIndent << "opt=\"$1\"\n";
    os << kIndent << "case \"$opt\" in\n";
    for (const auto& v : c.values) {
        os << kIndent << kIndent << utils::join(v.patterns, "|") << ") echo " << utils::join(v.values, " ") << " ;;\n";
    }
    os << kIndent << kIndent << "*) mkopts " << utils::join(c.options, " ") << " ;;\n";
    os << kIndent << "esac\n";
    os << "}\n\n";
}

void Generator::parseArgs(std::ostream& os) const {
    os << "w3_config\n";
    os << "w3_parse_args \"$@\"\n";
    os << "\n";
}

void Generator::enumChecks(std::ostream& os) const {
    bool any = false;
    for (const auto* o : graph_.bucketedVariables()) {
        if (!o->isEnumLike()) continue;
        any = true;
        const auto v = var(o->name());
        const auto allowed = utils::join(o->values(), ", ");

        if (o->type() == OptionType::Enum) {
            os << "case \"$" << v << "\" in\n";
            os << kIndent << escape::casePattern(o->values()) << ") ;;\n";
            os << kIndent << "*) err \"invalid value '$" << v << "' for -" << o->name() << "; must be one of: "
               << allowed << "\" ;;\n";
            os << "esac\n";
        } else {
            forEachListItem(os,
                            v,
                            {"case \"$_sr_elem\" in",
                             kIndent + escape::casePattern(o->values()) + ") ;;",
                             std::string(kIndent) + "*) err \"invalid value '$_sr_elem' for -" + o->name() +
                                 "; must be one of: " + allowed + "\" ;;",
                             "esac"},
                            "");
        }
    }
    if (any) os << "\n";
}

void Generator::collapses(std::ostream& os) const {
    const auto& all = graph_.collapses();
    for (std::size_t i = 0; i < all.size(); ++i) {
        const auto& c = all[i];
        const auto fn = "_sr_collapse_" + std::to_string(i + 1);
        const auto* target = graph_.findVariable(c.variable);
        const auto v = var(c.variable);

        // The value arrives as $1; the first matching branch wins.
        os << fn << " () {\n";
        os << kIndent << "case \"$1\" in\n";
        for (const auto& b : c.branches) {
            os << kIndent << kIndent << escape::casePattern(b.patterns) << ") printf '%s\\n' \""
               << escape::escapeDoubleQuotes(b.replacement) << "\" ;;\n";
        }
        os << kIndent << kIndent << "*) printf '%s\\n' \"$1\" ;;\n";
        os << kIndent << "esac\n";
        os << "}\n";

        if (target && target->type() == OptionType::List) {
            os << "_sr_collapsed=\n";
            forEachListItem(os, v, {"_sr_collapsed=\"${_sr_collapsed},$(" + fn + " \"$_sr_elem\")\""}, "");
            os << v << "=\"${_sr_collapsed#,}\"\n";
        } else {
            os << v << "=\"$(" << fn << " \"$" << v << "\")\"\n";
        }
        os << "\n";
    }
}

void Generator::urlParameters(std::ostream& os) const {
    const auto& mappings = graph_.mappings();
    if (mappings.empty()) return;

    os << "_sr_params=\n";
    for (std::size_t i = 0; i < mappings.size(); ++i) {
        const auto& m = mappings[i];
        const auto v = var(m.variable);
        const auto key = escape::percentEncode(m.parameter);
        const std::string sep = i == 0 ? "" : "&";

        if (m.list) {
            const std::string value = m.urlEncode ? "$(w3_url_escape \"$_sr_elem\")" : "${_sr_elem}";
            os << "_sr_list_param=\n";
            forEachListItem(os, v, {"_sr_list_param=\"${_sr_list_param}&" + key + "=" + value + "\""}, "");
            os << "_sr_list_param=\"${_sr_list_param#&}\"\n";
            // An empty list still sends the parameter, with an empty value.
            os << "_sr_params=\"${_sr_params}" << sep << "${_sr_list_param:-" << key << "=}\"\n";
        } else {
            const std::string value = m.urlEncode ? "$(w3_url_escape \"$" + v + "\")" : "${" + v + "}";
            os << "_sr_params=\"${_sr_params}" << sep << key << "=" << value << "\"\n";
        }
    }
    os << "\n";
}

void Generator::inlines(std::ostream& os) const {
    const auto& all = graph_.inlines();
    if (all.empty()) return;

    // $1 is the keyword, $2 the value. Empty values add nothing.
    os << "_sr_inlines=\n";
    os << "_sr_inline () {\n";
    os << kIndent << "case \"$2\" in\n";
    os << kIndent << kIndent << "'') ;;\n";
    os << kIndent << kIndent << "*[[:space:]]*) _sr_inlines=\"${_sr_inlines} $1:\\\"$2\\\"\" ;;\n";
    os << kIndent << kIndent << "*) _sr_inlines=\"${_sr_inlines} $1:$2\" ;;\n";
    os << kIndent << "esac\n";
    os << "}\n";
    for (const auto& in : all) {
        const auto v = var(in.variable);
        if (in.list) {
            forEachListItem(os, v, {"_sr_inline " + shellSingleQuote(in.keyword) + " \"$_sr_elem\""}, "");
        } else {
            os << "_sr_inline " << shellSingleQuote(in.keyword) << " \"$" << v << "\"\n";
        }
    }
    os << "\n";
}

void Generator::dispatch(std::ostream& os) const {
    const auto& cfg = graph_.config();
    const bool haveParams = !graph_.mappings().empty();
    const std::string inlined = graph_.inlines().empty() ? "" : "$_sr_inlines";

    os << "if [ -z \"$w3_args\" ]; then\n";
    os << kIndent << "w3_browse_url \"$base_url\"\n";
    os << "else\n";
    if (!cfg.appendSearchArgs) {
        os << kIndent << "w3_browse_url \"${search_url}" << (haveParams ? "${_sr_params}" : "") << "\"\n";
    } else {
        os << kIndent << "escaped_args=$(w3_url_of_arg \"$w3_args" << inlined << "\")\n";
        if (cfg.queryParameter.has_value()) {
            os << kIndent << "w3_browse_url \"${search_url}" << escape::percentEncode(*cfg.queryParameter)
               << "=${escaped_args}" << (haveParams ? "&${_sr_params}" : "") << "\"\n";
        } else {
            os << kIndent << "w3_browse_url \"${search_url}${escaped_args}\"\n";
        }
    }
    os << "fi\n";
}

void Generator::forEachListItem(std::ostream& os,
                                const std::string& value,
                                const std::vector<std::string>& body,
                                const std::string& indent) const {
    os << indent << "_sr_enter_list_context\n";
    os << indent << "for _sr_elem in $" << value << "; do\n";
    for (const auto& line : body) os << indent << kIndent << line << "\n";
    os << indent << "done\n";
    os << indent << "_sr_leave_list_context\n";
}

} // namespace srelvis
