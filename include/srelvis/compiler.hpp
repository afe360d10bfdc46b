#ifndef SRELVIS_COMPILER_HPP
#define SRELVIS_COMPILER_HPP

#include <ostream>
#include <string>
#include <vector>

#include "directive.hpp"
#include "graph.hpp"

namespace srelvis {

// Parses, builds and renders in one go. Throws CompileError before writing anything to `os`.
void compile(const ElvisConfig& config, const std::vector<RawDirective>& directives, std::ostream& os);

std::string compile(const ElvisConfig& config, const std::vector<RawDirective>& directives);

// The bash completion file for the same elvis. Fails on the same directives compile() fails on.
std::string compileBashCompletion(const ElvisConfig& config, const std::vector<RawDirective>& directives);

} // namespace srelvis

#endif // SRELVIS_COMPILER_HPP
