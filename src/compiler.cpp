#include "srelvis/compiler.hpp"

#include <sstream>

#include "srelvis/completion.hpp"
#include "srelvis/generator.hpp"

namespace srelvis {

void compile(const ElvisConfig& config, const std::vector<RawDirective>& directives, std::ostream& os) {
    os << compile(config, directives);
}

std::string compile(const ElvisConfig& config, const std::vector<RawDirective>& directives) {
    const auto graph = buildGraph(config, parseDirectives(directives));
    return Generator(graph).render();
}

std::string compileBashCompletion(const ElvisConfig& config, const std::vector<RawDirective>& directives) {
    const auto graph = buildGraph(config, parseDirectives(directives));
    std::ostringstream oss;
    printBashCompletion(oss, graph);
    return oss.str();
}

} // namespace srelvis
