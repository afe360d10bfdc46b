#ifndef SRELVIS_HELP_HPP
#define SRELVIS_HELP_HPP

#include <ostream>
#include <string>
#include <vector>

#include "graph.hpp"

namespace srelvis {

// Description of a flag as shown by -local-help.
std::string flagDescription(const OptionGraph& graph, const FlagOption& flag);

// The "Local options" block of `sr ELVIS -local-help`, one entry per line.
//
//   -lang=ISOCODE    Two letter language code (resembles ISO country codes)
//                    Default: $SURFRAW_example_language
//                    Environment: SURFRAW_example_language, SURFRAW_lang
//
// Variable options come first (bool, enum, anything, special, list), then flags grouped by the
// type of their target in the same order. Descriptions are escaped for the heredoc they end up in; `$SURFRAW_...` references
// in the Default lines are left to expand. Empty when the elvis has no options.
std::vector<std::string> localHelpLines(const OptionGraph& graph);

void printLocalHelp(std::ostream& os, const OptionGraph& graph);

} // namespace srelvis

#endif // SRELVIS_HELP_HPP
