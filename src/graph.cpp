#include "srelvis/graph.hpp"

#include <utility>

#include "srelvis/error.hpp"
#include "srelvis/utils.hpp"
#include "srelvis/validation.hpp"

namespace {

using srelvis::CompileError;
using srelvis::Directive;
using srelvis::ErrorKind;
using srelvis::OptionType;

std::string typeLabel(const Directive& d) { return std::string(srelvis::directiveTypeName(d.type)); }

[[noreturn]] static void fail(ErrorKind kind, std::string message, const Directive& d) {
    throw CompileError(kind, std::move(message), d.index, typeLabel(d));
}

bool isSchemeChar(char ch, bool first) {
    const bool alpha = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
    if (first) return alpha;
    return alpha || (ch >= '0' && ch <= '9') || ch == '+' || ch == '-' || ch == '.';
}

// "https://example.com" -> ("https", "example.com"); no scheme -> (nullopt, url).
std::pair<std::optional<std::string>, std::string> splitScheme(const std::string& url) {
    const auto pos = url.find("://");
    if (pos == std::string::npos || pos == 0) return {std::nullopt, url};
    for (std::size_t i = 0; i < pos; ++i) {
        if (!isSchemeChar(url[i], i == 0)) return {std::nullopt, url};
    }
    return {url.substr(0, pos), url.substr(pos + 3)};
}

bool contains(const std::vector<std::string>& values, const std::string& v) {
    for (const auto& x : values) {
        if (x == v) return true;
    }
    return false;
}

std::string quotedList(const std::vector<std::string>& values) {
    return "'" + srelvis::utils::join(values, ",") + "'";
}

std::string suggestion(const std::string& name, const std::vector<std::string>& candidates) {
    const auto close = srelvis::utils::suggest(name, candidates, /*maxResults=*/1);
    if (close.empty()) return {};
    return " (did you mean '" + close.front() + "'?)";
}

} // namespace

namespace srelvis {

std::string OptionGraph::description() const {
    const std::string text = config_.description.has_value() ? *config_.description : "Search " + config_.name;
    return text + " (" + baseUrlDisplay_ + ")";
}

const VarOption* OptionGraph::findVariable(const std::string& name) const {
    const auto it = variableIndex_.find(name);
    if (it == variableIndex_.end()) return nullptr;
    return &variables_[it->second];
}

const FlagOption* OptionGraph::findFlag(const std::string& name) const {
    const auto it = flagIndex_.find(name);
    if (it == flagIndex_.end()) return nullptr;
    return &flags_[it->second];
}

std::vector<const VarOption*> OptionGraph::bucket(OptionType type) const {
    std::vector<const VarOption*> out;
    for (const auto& v : variables_) {
        if (v.type() == type) out.push_back(&v);
    }
    return out;
}

std::vector<const VarOption*> OptionGraph::bucketedVariables() const {
    std::vector<const VarOption*> out;
    out.reserve(variables_.size());
    for (const auto type : {OptionType::Bool, OptionType::Enum, OptionType::List, OptionType::Anything,
                            OptionType::Special}) {
        for (const auto* v : bucket(type)) out.push_back(v);
    }
    return out;
}

std::vector<const FlagOption*> OptionGraph::bucketedFlags() const {
    std::vector<const FlagOption*> out;
    out.reserve(flags_.size());
    for (const auto type : {OptionType::Bool, OptionType::Enum, OptionType::List, OptionType::Anything,
                            OptionType::Special}) {
        for (const auto& f : flags_) {
            if (f.targetType() == type) out.push_back(&f);
        }
    }
    return out;
}

bool OptionGraph::hasLists() const {
    for (const auto& v : variables_) {
        if (v.type() == OptionType::List) return true;
    }
    return false;
}

std::string OptionGraph::variableName(std::string_view option) const {
    std::string out = "SURFRAW_";
    out += config_.name;
    out += '_';
    out += option;
    return out;
}

std::vector<std::string> parsePatterns(OptionType targetType, bool isFlag, const std::string& name) {
    if (targetType == OptionType::List) {
        if (isFlag) return {"-add-" + name, "-remove-" + name};
        return {"-add-" + name + "=*", "-remove-" + name + "=*", "-clear-" + name};
    }
    if (isFlag) return {"-" + name};
    if (targetType == OptionType::Bool) return {"-" + name + "=*", "-" + name};
    return {"-" + name + "=*"};
}

GraphBuilder::GraphBuilder(ElvisConfig config) { graph_.config_ = std::move(config); }

OptionGraph GraphBuilder::build(const std::vector<Directive>& directives) {
    checkSettings();
    registerVariables(directives);
    resolveFlags(directives);
    resolveAliases(directives);
    attachBehaviours(directives);
    checkDefaults();
    checkQueryParameter();
    resolveUrls();
    checkSpellings();
    return std::move(graph_);
}

void GraphBuilder::checkSettings() {
    const auto& cfg = graph_.config_;
    if (!isValidElvisName(cfg.name)) {
        throw CompileError(ErrorKind::InvalidSetting,
                           "elvis name '" + cfg.name + "' is invalid; elvis names may not be paths");
    }
    if (cfg.numTabs < 1) {
        throw CompileError(ErrorKind::InvalidSetting, "there must be at least one tab after the elvis name");
    }
    if (cfg.queryParameter.has_value() && cfg.queryParameter->empty()) {
        throw CompileError(ErrorKind::InvalidSetting, "the query parameter must not be empty");
    }
    if (cfg.queryParameter.has_value() && !cfg.appendSearchArgs) {
        throw CompileError(ErrorKind::InvalidSetting,
                           "a query parameter cannot be used when search arguments are not appended");
    }
}

void GraphBuilder::registerVariables(const std::vector<Directive>& directives) {
    auto add = [&](VarOption opt, const Directive& d) {
        if (graph_.variableIndex_.count(opt.name()) != 0) {
            fail(ErrorKind::DuplicateName, "the variable name '" + opt.name() + "' is duplicated", d);
        }
        graph_.variableIndex_.emplace(opt.name(), graph_.variables_.size());
        graph_.variables_.push_back(std::move(opt));
    };

    for (const auto& d : directives) {
        if (const auto* b = std::get_if<BoolDecl>(&d.payload)) {
            add(VarOption::makeBool(b->name, b->defaultValue), d);
        } else if (const auto* e = std::get_if<EnumDecl>(&d.payload)) {
            add(VarOption::makeEnum(e->name, e->defaultValue, e->values), d);
        } else if (const auto* a = std::get_if<AnythingDecl>(&d.payload)) {
            add(VarOption::makeAnything(a->name, a->defaultValue), d);
        } else if (const auto* l = std::get_if<ListDecl>(&d.payload)) {
            add(VarOption::makeList(l->name, l->elementType, l->defaults, l->values), d);
        } else if (const auto* s = std::get_if<SpecialDecl>(&d.payload)) {
            if (graph_.variableIndex_.count(std::string(specialKindName(s->kind))) != 0) {
                fail(ErrorKind::DuplicateName,
                     "cannot have two '" + std::string(specialKindName(s->kind)) + "' special options",
                     d);
            }
            add(VarOption::makeSpecial(s->kind), d);
        }
    }
}

void GraphBuilder::resolveFlags(const std::vector<Directive>& directives) {
    std::unordered_set<std::string> declared;
    for (const auto& d : directives) {
        if (const auto* f = std::get_if<FlagDecl>(&d.payload)) declared.insert(f->name);
        if (const auto* a = std::get_if<AliasDecl>(&d.payload)) declared.insert(a->name);
    }

    for (const auto& d : directives) {
        const auto* decl = std::get_if<FlagDecl>(&d.payload);
        if (!decl) continue;

        VarOption* target = variable(decl->target);
        if (!target) {
            if (declared.count(decl->target) != 0) {
                fail(ErrorKind::TypeMismatch,
                     "flag option '" + decl->name + "' targets '" + decl->target +
                         "', which does not create a variable",
                     d);
            }
            unresolved("flag option '" + decl->name +
                           "' does not target any existing 'bool', 'enum', 'list', 'anything', or 'special' option",
                       decl->target,
                       d);
        }

        const auto& value = decl->value;
        switch (target->type()) {
            case OptionType::Bool:
                if (!isYesNo(value)) {
                    fail(ErrorKind::InvalidFlagValue,
                         "bool '" + value + "' of flag '" + decl->name + "' must be one of the following: no, yes",
                         d);
                }
                break;
            case OptionType::Enum:
                if (!contains(target->values(), value)) {
                    fail(ErrorKind::InvalidFlagValue,
                         "value of flag '" + decl->name + "' to enum '" + target->name() + "' is not a valid value",
                         d);
                }
                break;
            case OptionType::List:
                if (target->elementType() == OptionType::Enum) {
                    const auto items = value.empty() ? std::vector<std::string>{} : utils::split(value, ',');
                    for (const auto& item : items) {
                        if (!contains(target->values(), item)) {
                            fail(ErrorKind::InvalidFlagValue,
                                 "enum list flag option " + decl->name + "'s value ('" + value +
                                     "') must be a subset of its target's values (" + quotedList(target->values()) +
                                     ")",
                                 d);
                        }
                    }
                }
                break;
            case OptionType::Special:
                if (target->specialKind() == SpecialKind::Results) {
                    long long n = 0;
                    if (!tryParseInt(value, n)) {
                        fail(ErrorKind::InvalidFlagValue,
                             "value for special 'results' option must be an integer",
                             d);
                    }
                }
                // Language codes are not checked: there are too many to list.
                break;
            default: break;
        }

        registerNonVariableName(decl->name, d);
        target->addFlag(decl->name);
        graph_.flagIndex_.emplace(decl->name, graph_.flags_.size());
        graph_.flags_.emplace_back(decl->name, target->name(), target->type(), value);
    }
}

void GraphBuilder::resolveAliases(const std::vector<Directive>& directives) {
    // Alias names are collected first so that an alias to an alias is reported as a chain,
    // whichever of the two is declared first.
    std::unordered_set<std::string> aliasNames;
    for (const auto& d : directives) {
        if (const auto* decl = std::get_if<AliasDecl>(&d.payload)) aliasNames.insert(decl->name);
    }

    for (const auto& d : directives) {
        const auto* decl = std::get_if<AliasDecl>(&d.payload);
        if (!decl) continue;

        const std::string typeName(optionTypeName(decl->targetType));
        if (decl->targetType == OptionType::Flag) {
            const auto it = graph_.flagIndex_.find(decl->target);
            if (it == graph_.flagIndex_.end()) {
                if (aliasNames.count(decl->target) != 0) {
                    fail(ErrorKind::InvalidAliasChain,
                         "alias '" + decl->name + "' targets the alias '" + decl->target + "'",
                         d);
                }
                unresolved("alias '" + decl->name + "' does not target any option of matching type ('flag')",
                           decl->target,
                           d);
            }
            registerNonVariableName(decl->name, d);
            graph_.flags_[it->second].addAlias(decl->name);
        } else {
            VarOption* target = variable(decl->target);
            if (!target) {
                if (aliasNames.count(decl->target) != 0) {
                    fail(ErrorKind::InvalidAliasChain,
                         "alias '" + decl->name + "' targets the alias '" + decl->target + "'",
                         d);
                }
                unresolved("alias '" + decl->name + "' does not target any option of matching type ('" + typeName +
                               "')",
                           decl->target,
                           d);
            }
            if (target->type() != decl->targetType) {
                fail(ErrorKind::TypeMismatch,
                     "alias '" + decl->name + "' does not target any option of matching type ('" + typeName +
                         "'); '" + target->name() + "' is a " + std::string(optionTypeName(target->type())) +
                         " option",
                     d);
            }
            registerNonVariableName(decl->name, d);
            target->addAlias(decl->name);
        }
        graph_.aliasIndex_.emplace(decl->name, graph_.aliases_.size());
        graph_.aliases_.emplace_back(decl->name, decl->target, decl->targetType);
    }
}

void GraphBuilder::attachBehaviours(const std::vector<Directive>& directives) {
    for (const auto& d : directives) {
        if (const auto* m = std::get_if<MetavarDecl>(&d.payload)) {
            VarOption* target = variable(m->variable);
            if (!target) {
                unresolved("metavar for '" + m->variable + "' with the value '" + m->metavar +
                               "' targets a non-existent variable",
                           m->variable,
                           d);
            }
            target->setMetavar(m->metavar);
        } else if (const auto* desc = std::get_if<DescribeDecl>(&d.payload)) {
            VarOption* target = variable(desc->variable);
            if (!target) {
                unresolved("description for '" + desc->variable + "' targets a non-existent variable",
                           desc->variable,
                           d);
            }
            target->setDescription(desc->description);
        } else if (const auto* c = std::get_if<CollapseDecl>(&d.payload)) {
            // Collapse values are not checked against enum values.
            if (!variable(c->variable)) {
                unresolved("collapse '" + c->variable + "' does not target any existing variable", c->variable, d);
            }
            graph_.collapses_.push_back(Collapse{c->variable, c->branches});
        } else if (const auto* m = std::get_if<MapDecl>(&d.payload)) {
            const bool list = d.type == DirectiveType::ListMap;
            const VarOption* target = variable(m->variable);
            if (!target) {
                unresolved("URL parameter '" + m->variable + "' does not target any existing variable",
                           m->variable,
                           d);
            }
            if (list && target->type() != OptionType::List) {
                fail(ErrorKind::TypeMismatch,
                     "list URL parameter '" + m->variable + "' must target a list option, not a " +
                         std::string(optionTypeName(target->type())) + " option",
                     d);
            }
            graph_.mappings_.push_back(Mapping{m->variable, m->parameter, m->urlEncode, list});
        } else if (const auto* in = std::get_if<InlineDecl>(&d.payload)) {
            const bool list = d.type == DirectiveType::ListInline;
            const VarOption* target = variable(in->variable);
            if (!target) {
                unresolved("inlining '" + in->variable + "' does not target any existing variable",
                           in->variable,
                           d);
            }
            if (list && target->type() != OptionType::List) {
                fail(ErrorKind::TypeMismatch,
                     "list inlining '" + in->variable + "' must target a list option, not a " +
                         std::string(optionTypeName(target->type())) + " option",
                     d);
            }
            graph_.inlines_.push_back(Inline{in->variable, in->keyword, list});
        }
    }
}

void GraphBuilder::checkDefaults() {
    for (const auto& v : graph_.variables_) {
        if (v.type() == OptionType::Enum && !contains(v.values(), v.defaultValue())) {
            throw CompileError(ErrorKind::InvalidDefault,
                               "enum default value '" + v.defaultValue() + "' of '" + v.name() +
                                   "' must be within " + quotedList(v.values()));
        }
        if (v.type() == OptionType::List && v.elementType() == OptionType::Enum) {
            for (const auto& def : v.defaults()) {
                if (!contains(v.values(), def)) {
                    throw CompileError(ErrorKind::InvalidDefault,
                                       "enum list option " + v.name() + "'s defaults (" + quotedList(v.defaults()) +
                                           ") must be a subset of its valid values (" + quotedList(v.values()) + ")");
                }
            }
        }
    }
}

void GraphBuilder::checkQueryParameter() {
    const auto& cfg = graph_.config_;
    if (!graph_.mappings_.empty() && !cfg.queryParameter.has_value() && cfg.appendSearchArgs) {
        throw CompileError(ErrorKind::MissingQueryParameter,
                           "mapping variables without a defined query parameter is forbidden");
    }
}

void GraphBuilder::resolveUrls() {
    const auto [baseScheme, baseRest] = splitScheme(graph_.config_.baseUrl);
    const auto [searchScheme, searchRest] = splitScheme(graph_.config_.searchUrl);
    if (baseScheme.has_value() && searchScheme.has_value() && *baseScheme != *searchScheme) {
        throw CompileError(ErrorKind::SchemeMismatch, "the schemes of both URLs must be the same");
    }

    if (baseScheme.has_value()) {
        graph_.scheme_ = *baseScheme;
    } else if (searchScheme.has_value()) {
        graph_.scheme_ = *searchScheme;
    } else {
        graph_.scheme_ = graph_.config_.insecure ? "http" : "https";
    }
    graph_.baseUrl_ = graph_.scheme_ + "://" + baseRest;
    graph_.searchUrl_ = graph_.scheme_ + "://" + searchRest;
    graph_.baseUrlDisplay_ = baseRest;
}

void GraphBuilder::checkSpellings() {
    std::unordered_map<std::string, std::string> owners;
    auto claim = [&](const std::string& pattern, std::string owner) {
        const auto [it, inserted] = owners.emplace(pattern, owner);
        if (!inserted) {
            throw CompileError(ErrorKind::DuplicateName,
                               "option '" + pattern.substr(0, pattern.find('=')) + "' is defined by both " +
                                   it->second + " and " + owner);
        }
    };

    for (const auto* v : graph_.bucketedVariables()) {
        const std::string owner = std::string(optionTypeName(v->type())) + " '" + v->name() + "'";
        for (const auto& p : parsePatterns(v->type(), false, v->name())) claim(p, owner);
        for (const auto& alias : v->aliases()) {
            for (const auto& p : parsePatterns(v->type(), false, alias)) claim(p, "alias '" + alias + "'");
        }
    }
    for (const auto* f : graph_.bucketedFlags()) {
        for (const auto& p : parsePatterns(f->targetType(), true, f->name())) claim(p, "flag '" + f->name() + "'");
        for (const auto& alias : f->aliases()) {
            for (const auto& p : parsePatterns(f->targetType(), true, alias)) claim(p, "alias '" + alias + "'");
        }
    }
}

VarOption* GraphBuilder::variable(const std::string& name) {
    const auto it = graph_.variableIndex_.find(name);
    if (it == graph_.variableIndex_.end()) return nullptr;
    return &graph_.variables_[it->second];
}

void GraphBuilder::registerNonVariableName(const std::string& name, const Directive& d) {
    if (!nonVariableNames_.insert(name).second) {
        fail(ErrorKind::DuplicateName, "the non-variable-creating option name '" + name + "' is duplicated", d);
    }
}

void GraphBuilder::unresolved(const std::string& what, const std::string& name, const Directive& d) const {
    fail(ErrorKind::UnresolvedReference, what + suggestion(name, variableNames()), d);
}

std::vector<std::string> GraphBuilder::variableNames() const {
    std::vector<std::string> out;
    out.reserve(graph_.variables_.size());
    for (const auto& v : graph_.variables_) out.push_back(v.name());
    return out;
}

OptionGraph buildGraph(ElvisConfig config, const std::vector<Directive>& directives) {
    GraphBuilder builder(std::move(config));
    return builder.build(directives);
}

} // namespace srelvis
