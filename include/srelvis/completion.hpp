#ifndef SRELVIS_COMPLETION_HPP
#define SRELVIS_COMPLETION_HPP

#include <ostream>
#include <string>
#include <vector>

#include "graph.hpp"

namespace srelvis {

// Values completed after any of `patterns` ("-sort=*", "-s=*").
struct ValueCompletion {
    std::vector<std::string> patterns;
    std::vector<std::string> values;
};

// What an elvis can complete. Shared by the w3_complete_hook_opt hook and the bash completion file.
struct Completions {
    std::vector<ValueCompletion> values;
    // Option words without the leading '-': "safe", "safe=", "add-tags=", "clear-tags", ...
    std::vector<std::string> options;
};

// Variables first in bucket order, then flags, each with its aliases.
Completions completionsFor(const OptionGraph& graph);

// A standalone bash completion script for the elvis command, written to NAME.completion.
//
//   _surfraw_ex_complete() { ... }
//   complete -F _surfraw_ex_complete 'ex'
void printBashCompletion(std::ostream& os, const OptionGraph& graph);

} // namespace srelvis

#endif // SRELVIS_COMPLETION_HPP
