#ifndef SRELVIS_GENERATOR_HPP
#define SRELVIS_GENERATOR_HPP

#include <ostream>
#include <string>
#include <vector>

#include "graph.hpp"

namespace srelvis {

// Renders an OptionGraph as a surfraw elvis (POSIX sh, without the shebang line).
//
// The output is a pure function of the graph: the same graph always renders to the same bytes.
// Sections are emitted in a fixed order:
//   header and usage hook, config hook, list-context helpers, parse hook, completion hook,
//   w3_config/w3_parse_args, enum checks, collapses, URL parameters, inlines, dispatch.
class Generator {
public:
    explicit Generator(const OptionGraph& graph) : graph_(graph) {}

    void render(std::ostream& os) const;
    [[nodiscard]] std::string render() const;

private:
    void header(std::ostream& os) const;
    void usageHook(std::ostream& os) const;
    void configHook(std::ostream& os) const;
    void listContextHelpers(std::ostream& os) const;
    void parseHook(std::ostream& os) const;
    void completionHook(std::ostream& os) const;
    void parseArgs(std::ostream& os) const;
    void enumChecks(std::ostream& os) const;
    void collapses(std::ostream& os) const;
    void urlParameters(std::ostream& os) const;
    void inlines(std::ostream& os) const;
    void dispatch(std::ostream& os) const;

    // Emits `body` (a list of lines) wrapped in one enter/leave pair, iterating `value` as _sr_elem.
    void forEachListItem(std::ostream& os,
                         const std::string& value,
                         const std::vector<std::string>& body,
                         const std::string& indent) const;

    [[nodiscard]] std::string var(const std::string& option) const { return graph_.variableName(option); }

    const OptionGraph& graph_;
};

} // namespace srelvis

#endif // SRELVIS_GENERATOR_HPP
