#ifndef SRELVIS_GRAPH_HPP
#define SRELVIS_GRAPH_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "directive.hpp"
#include "option.hpp"

namespace srelvis {

// Elvis-wide settings. These come from the command line, not from directives.
struct ElvisConfig {
    std::string name;
    std::string baseUrl;    // opened when no search terms are given
    std::string searchUrl;  // search terms are appended to this
    std::optional<std::string> description;
    std::optional<std::string> queryParameter;
    bool appendSearchArgs{true};  // false is the explicit opt-out of the query parameter
    bool enableCompletions{true};
    bool insecure{false};         // default scheme http instead of https
    int numTabs{1};
    std::string generator{"mkelvis"};
};

// The validated, cross-referenced option model of one elvis. Immutable once built.
//
// Variable-creating options and non-variable options (flags, aliases) live in two separate
// registries; they are only joined when the option spellings of the parse hook are checked.
class OptionGraph {
public:
    [[nodiscard]] const ElvisConfig& config() const { return config_; }
    [[nodiscard]] const std::string& name() const { return config_.name; }
    [[nodiscard]] const std::string& scheme() const { return scheme_; }
    [[nodiscard]] const std::string& baseUrl() const { return baseUrl_; }
    [[nodiscard]] const std::string& searchUrl() const { return searchUrl_; }
    // Base URL without its scheme, as shown next to the description.
    [[nodiscard]] const std::string& baseUrlDisplay() const { return baseUrlDisplay_; }
    // "Search NAME (example.com)" unless a description was given.
    [[nodiscard]] std::string description() const;

    [[nodiscard]] const std::vector<VarOption>& variables() const { return variables_; }
    [[nodiscard]] const std::vector<FlagOption>& flags() const { return flags_; }
    [[nodiscard]] const std::vector<AliasOption>& aliases() const { return aliases_; }
    [[nodiscard]] const std::vector<Collapse>& collapses() const { return collapses_; }
    [[nodiscard]] const std::vector<Mapping>& mappings() const { return mappings_; }
    [[nodiscard]] const std::vector<Inline>& inlines() const { return inlines_; }

    [[nodiscard]] const VarOption* findVariable(const std::string& name) const;
    [[nodiscard]] const FlagOption* findFlag(const std::string& name) const;

    // Variable options of one type, in declaration order.
    [[nodiscard]] std::vector<const VarOption*> bucket(OptionType type) const;
    // All variable options: bool, enum, list, anything, special; declaration order inside a bucket.
    [[nodiscard]] std::vector<const VarOption*> bucketedVariables() const;
    // Flags partitioned by the type of their target, in the same bucket order.
    [[nodiscard]] std::vector<const FlagOption*> bucketedFlags() const;

    [[nodiscard]] bool anyOptions() const { return !variables_.empty(); }
    [[nodiscard]] bool hasLists() const;

    // SURFRAW_<elvis>_<name>
    [[nodiscard]] std::string variableName(std::string_view option) const;

private:
    friend class GraphBuilder;

    ElvisConfig config_;
    std::string scheme_;
    std::string baseUrl_;
    std::string searchUrl_;
    std::string baseUrlDisplay_;

    std::vector<VarOption> variables_;
    std::vector<FlagOption> flags_;
    std::vector<AliasOption> aliases_;
    std::vector<Collapse> collapses_;
    std::vector<Mapping> mappings_;
    std::vector<Inline> inlines_;

    std::unordered_map<std::string, std::size_t> variableIndex_;
    std::unordered_map<std::string, std::size_t> flagIndex_;
    std::unordered_map<std::string, std::size_t> aliasIndex_;
};

// Case patterns the generated parse hook accepts for an option called `name`, e.g. "-add-tags=*".
// `isFlag` selects the value-less forms used by flags and their aliases.
std::vector<std::string> parsePatterns(OptionType targetType, bool isFlag, const std::string& name);

// Builds the graph in four passes:
//   1. register variable-creating options;
//   2. resolve flags, then aliases (forward references are fine);
//   3. attach metavars, descriptions, collapses, mappings and inlines;
//   4. check graph-wide invariants.
// The first violation throws CompileError.
class GraphBuilder {
public:
    explicit GraphBuilder(ElvisConfig config);

    OptionGraph build(const std::vector<Directive>& directives);

private:
    void checkSettings();
    void registerVariables(const std::vector<Directive>& directives);
    void resolveFlags(const std::vector<Directive>& directives);
    void resolveAliases(const std::vector<Directive>& directives);
    void attachBehaviours(const std::vector<Directive>& directives);
    void checkDefaults();
    void checkQueryParameter();
    void resolveUrls();
    void checkSpellings();

    VarOption* variable(const std::string& name);
    void registerNonVariableName(const std::string& name, const Directive& d);
    [[noreturn]] void unresolved(const std::string& what, const std::string& name, const Directive& d) const;
    std::vector<std::string> variableNames() const;

    OptionGraph graph_;
    std::unordered_set<std::string> nonVariableNames_;
};

OptionGraph buildGraph(ElvisConfig config, const std::vector<Directive>& directives);

} // namespace srelvis

#endif // SRELVIS_GRAPH_HPP
