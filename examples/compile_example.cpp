#include <iostream>
#include <string>
#include <vector>

#include "srelvis/compiler.hpp"
#include "srelvis/error.hpp"

int main() {
    srelvis::ElvisConfig config;
    config.name = "wiki";
    config.baseUrl = "en.wikipedia.org";
    config.searchUrl = "en.wikipedia.org/w/index.php?";
    config.description = "Search Wikipedia";
    config.queryParameter = "search";

    const std::vector<srelvis::RawDirective> directives{
        {srelvis::DirectiveType::Enum, "space:main:main,talk,user,help"},
        {srelvis::DirectiveType::Alias, "s:space:enum"},
        {srelvis::DirectiveType::Flag, "talk:space:talk"},
        {srelvis::DirectiveType::Collapse, "space:main,0:talk,1:user,2:help,12"},
        {srelvis::DirectiveType::Map, "space:ns0"},
        {srelvis::DirectiveType::List, "tags:anything:"},
        {srelvis::DirectiveType::ListInline, "tags:incategory"},
    };

    try {
        srelvis::compile(config, directives, std::cout);
    } catch (const srelvis::CompileError& e) {
        std::cerr << "compile_example: " << e.describe() << "\n";
        return 1;
    }
    return 0;
}
