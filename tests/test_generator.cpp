#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "srelvis/compiler.hpp"
#include "srelvis/error.hpp"
#include "srelvis/generator.hpp"

using namespace srelvis;

namespace {

ElvisConfig exampleConfig() {
    ElvisConfig cfg;
    cfg.name = "ex";
    cfg.baseUrl = "example.com";
    cfg.searchUrl = "example.com/search?";
    cfg.queryParameter = "q";
    return cfg;
}

std::string render(const std::vector<RawDirective>& raws, const ElvisConfig& cfg = exampleConfig()) {
    return compile(cfg, raws);
}

bool has(const std::string& script, const std::string& text) { return script.find(text) != std::string::npos; }

std::size_t countLines(const std::string& script, const std::string& trimmed) {
    std::istringstream in(script);
    std::string line;
    std::size_t n = 0;
    while (std::getline(in, line)) {
        const auto first = line.find_first_not_of(' ');
        if (first != std::string::npos && line.substr(first) == trimmed) ++n;
    }
    return n;
}

} // namespace

TEST(GeneratorTest, RendersDeterministically) {
    const std::vector<RawDirective> raws{
        {DirectiveType::Enum, "sort:date:date,rank"},
        {DirectiveType::List, "tags:anything:a,b"},
        {DirectiveType::Map, "sort:order"},
        {DirectiveType::ListMap, "tags:tag"},
    };
    EXPECT_EQ(render(raws), render(raws));
}

TEST(GeneratorTest, Header) {
    auto cfg = exampleConfig();
    cfg.numTabs = 2;
    cfg.description = "Search the\nexample";
    const auto script = render({}, cfg);
    EXPECT_EQ(script.rfind("# elvis: ex\t\t-- Search the example (example.com)\n", 0), 0u);
    EXPECT_TRUE(has(script, "\n. surfraw || exit 1\n"));
    EXPECT_TRUE(has(script, "base_url=\"https://example.com\"\n"));
    EXPECT_TRUE(has(script, "search_url=\"https://example.com/search?\"\n"));
}

TEST(GeneratorTest, ElvisWithoutOptions) {
    const auto script = render({});
    EXPECT_TRUE(has(script, "w3_config_hook () {\n"));
    EXPECT_TRUE(has(script, "    # defyn SURFRAW_ex_NAME yes\n"));
    EXPECT_TRUE(has(script, "    :\n}\n"));
    EXPECT_FALSE(has(script, "Local options:"));
    EXPECT_FALSE(has(script, "w3_complete_hook_opt"));
    EXPECT_FALSE(has(script, "_sr_enter_list_context"));
    EXPECT_FALSE(has(script, "_sr_params"));
    EXPECT_TRUE(has(script, "        *) return 1 ;;\n"));
    EXPECT_TRUE(has(script, "w3_config\nw3_parse_args \"$@\"\n"));
    EXPECT_TRUE(has(script, "    w3_browse_url \"${search_url}q=${escaped_args}\"\n"));
}

TEST(GeneratorTest, ConfigHookUsesBucketOrder) {
    const auto script = render({
        {DirectiveType::Special, "results"},
        {DirectiveType::Anything, "site:$HOME"},
        {DirectiveType::List, "tags:anything:a,,b"},
        {DirectiveType::Enum, "sort:date:date,rank"},
        {DirectiveType::YesNo, "safe:yes"},
    });
    const auto safe = script.find("    defyn SURFRAW_ex_safe 'yes'\n");
    const auto sort = script.find("    def SURFRAW_ex_sort 'date'\n");
    const auto tags = script.find("    def SURFRAW_ex_tags 'a,,b'\n");
    const auto site = script.find("    def SURFRAW_ex_site '$HOME'\n");
    const auto results = script.find("    def SURFRAW_ex_results \"$SURFRAW_results\"\n");
    ASSERT_NE(results, std::string::npos);
    EXPECT_LT(safe, sort);
    EXPECT_LT(sort, tags);
    EXPECT_LT(tags, site);
    EXPECT_LT(site, results);
    EXPECT_FALSE(has(script, "    :\n}\n"));
}

TEST(GeneratorTest, ParseHookArms) {
    const auto script = render({
        {DirectiveType::YesNo, "safe:no"},
        {DirectiveType::Alias, "clean:safe:bool"},
        {DirectiveType::Enum, "sort:date:date,rank"},
        {DirectiveType::Flag, "latest:sort:date"},
        {DirectiveType::List, "tags:anything:"},
        {DirectiveType::Flag, "none:tags:"},
        {DirectiveType::Flag, "two:tags:a,b"},
    });
    EXPECT_TRUE(has(script, "        -safe=*|-clean=*) setoptyn SURFRAW_ex_safe \"$optarg\" ;;\n"));
    EXPECT_TRUE(has(script, "        -safe|-clean) setoptyn SURFRAW_ex_safe yes ;;\n"));
    EXPECT_TRUE(has(script, "        -sort=*) setopt SURFRAW_ex_sort \"$optarg\" ;;\n"));
    EXPECT_TRUE(has(script, "        -add-tags=*) _sr_list_add SURFRAW_ex_tags \"$optarg\" ;;\n"));
    EXPECT_TRUE(has(script, "        -remove-tags=*) _sr_list_remove SURFRAW_ex_tags \"$optarg\" ;;\n"));
    EXPECT_TRUE(has(script, "        -clear-tags) _sr_list_clear SURFRAW_ex_tags ;;\n"));
    EXPECT_TRUE(has(script, "        -latest) setopt SURFRAW_ex_sort 'date' ;;\n"));
    EXPECT_TRUE(has(script, "        -add-none) : ;;\n"));
    EXPECT_TRUE(has(script, "        -remove-none) : ;;\n"));
    EXPECT_TRUE(has(script, "        -add-two) _sr_list_add SURFRAW_ex_tags 'a,b' ;;\n"));
    EXPECT_TRUE(has(script, "        -remove-two) _sr_list_remove SURFRAW_ex_tags 'a,b' ;;\n"));

    // Variables are matched before flags.
    EXPECT_LT(script.find("-clear-tags)"), script.find("-latest)"));
}

TEST(GeneratorTest, CompletionHook) {
    const std::vector<RawDirective> raws{
        {DirectiveType::YesNo, "safe:no"},
        {DirectiveType::Enum, "sort:date:date,rank"},
        {DirectiveType::Anything, "site:"},
    };
    const auto script = render(raws);
    EXPECT_TRUE(has(script, "w3_complete_hook_opt () {\n"));
    EXPECT_TRUE(has(script, "        -safe=*) echo yes no ;;\n"));
    EXPECT_TRUE(has(script, "        -sort=*) echo date rank ;;\n"));
    EXPECT_FALSE(has(script, "-site=*) echo"));
    EXPECT_TRUE(has(script, "        *) mkopts safe safe= sort= site= ;;\n"));

    auto cfg = exampleConfig();
    cfg.enableCompletions = false;
    EXPECT_FALSE(has(render(raws, cfg), "w3_complete_hook_opt"));
}

TEST(GeneratorTest, EnumChecks) {
    const auto script = render({
        {DirectiveType::Enum, "sort:date:date,rank"},
        {DirectiveType::List, "langs:enum:en:en,fr"},
    });
    EXPECT_TRUE(has(script,
                    "case \"$SURFRAW_ex_sort\" in\n"
                    "    'date'|'rank') ;;\n"
                    "    *) err \"invalid value '$SURFRAW_ex_sort' for -sort; must be one of: date, rank\" ;;\n"
                    "esac\n"));
    EXPECT_TRUE(has(script,
                    "_sr_enter_list_context\n"
                    "for _sr_elem in $SURFRAW_ex_langs; do\n"
                    "    case \"$_sr_elem\" in\n"));
    EXPECT_TRUE(has(script, "must be one of: en, fr"));
}

TEST(GeneratorTest, CollapsesKeepGroupOrder) {
    const auto script = render({
        {DirectiveType::Enum, "sort:date:date,rank"},
        {DirectiveType::Collapse, "sort:date,d:date,never:rank,$(echo r)"},
    });
    const auto first = script.find("        'date') printf '%s\\n' \"d\" ;;\n");
    const auto second = script.find("        'date') printf '%s\\n' \"never\" ;;\n");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
    EXPECT_TRUE(has(script, "        'rank') printf '%s\\n' \"$(echo r)\" ;;\n"));
    EXPECT_TRUE(has(script, "        *) printf '%s\\n' \"$1\" ;;\n"));
    EXPECT_TRUE(has(script, "SURFRAW_ex_sort=\"$(_sr_collapse_1 \"$SURFRAW_ex_sort\")\"\n"));
}

TEST(GeneratorTest, CollapseReplacementsCloseTheirQuotes) {
    const auto script = render({
        {DirectiveType::Anything, "kind:"},
        {DirectiveType::Collapse, "kind:x,C\\:y,a\\\"b"},
    });
    EXPECT_TRUE(has(script, "        'x') printf '%s\\n' \"C\\\\\" ;;\n"));
    EXPECT_TRUE(has(script, "        'y') printf '%s\\n' \"a\\\\\\\"b\" ;;\n"));
}

TEST(GeneratorTest, CollapsesOnListsRewriteEachItem) {
    const auto script = render({
        {DirectiveType::List, "tags:anything:"},
        {DirectiveType::Collapse, "tags:x,y"},
    });
    EXPECT_TRUE(has(script, "    _sr_collapsed=\"${_sr_collapsed},$(_sr_collapse_1 \"$_sr_elem\")\"\n"));
    EXPECT_TRUE(has(script, "SURFRAW_ex_tags=\"${_sr_collapsed#,}\"\n"));
}

TEST(GeneratorTest, UrlParametersJoinInOrder) {
    const auto script = render({
        {DirectiveType::Enum, "sort:date:date,rank"},
        {DirectiveType::Anything, "site:"},
        {DirectiveType::Map, "sort:sort order"},
        {DirectiveType::Map, "site:site:no"},
    });
    EXPECT_TRUE(has(script, "_sr_params=\"${_sr_params}sort%20order=$(w3_url_escape \"$SURFRAW_ex_sort\")\"\n"));
    EXPECT_TRUE(has(script, "_sr_params=\"${_sr_params}&site=${SURFRAW_ex_site}\"\n"));
    EXPECT_TRUE(has(script, "    w3_browse_url \"${search_url}q=${escaped_args}&${_sr_params}\"\n"));
}

TEST(GeneratorTest, ListParametersRepeatTheKey) {
    const auto script = render({
        {DirectiveType::Anything, "site:"},
        {DirectiveType::List, "tags:anything:"},
        {DirectiveType::ListMap, "tags:tag"},
        {DirectiveType::Map, "site:site"},
    });
    EXPECT_TRUE(has(script, "    _sr_list_param=\"${_sr_list_param}&tag=$(w3_url_escape \"$_sr_elem\")\"\n"));
    EXPECT_TRUE(has(script, "_sr_params=\"${_sr_params}${_sr_list_param:-tag=}\"\n"));
    EXPECT_TRUE(has(script, "_sr_params=\"${_sr_params}&site=$(w3_url_escape \"$SURFRAW_ex_site\")\"\n"));

    const auto second = render({
        {DirectiveType::Anything, "site:"},
        {DirectiveType::List, "tags:anything:"},
        {DirectiveType::Map, "site:site"},
        {DirectiveType::ListMap, "tags:tag:no"},
    });
    EXPECT_TRUE(has(second, "    _sr_list_param=\"${_sr_list_param}&tag=${_sr_elem}\"\n"));
    EXPECT_TRUE(has(second, "_sr_params=\"${_sr_params}&${_sr_list_param:-tag=}\"\n"));
}

TEST(GeneratorTest, ListContextsAreBalanced) {
    const auto script = render({
        {DirectiveType::List, "tags:enum::a,b"},
        {DirectiveType::List, "more:anything:"},
        {DirectiveType::Collapse, "tags:a,b"},
        {DirectiveType::ListMap, "tags:tag"},
        {DirectiveType::ListInline, "more:more"},
    });
    const auto enters = countLines(script, "_sr_enter_list_context");
    EXPECT_GE(enters, 5u);
    EXPECT_EQ(enters, countLines(script, "_sr_leave_list_context"));
    EXPECT_TRUE(has(script, "_sr_in_list_context=no\n_sr_enter_list_context () {\n"));
}

TEST(GeneratorTest, InlinesAreAppendedToTheSearchTerms) {
    const auto script = render({
        {DirectiveType::Anything, "site:"},
        {DirectiveType::Inline, "site:site"},
        {DirectiveType::List, "tags:anything:"},
        {DirectiveType::ListInline, "tags:tag"},
    });
    EXPECT_TRUE(has(script, "_sr_inline () {\n"));
    EXPECT_TRUE(has(script, "        '') ;;\n"));
    EXPECT_TRUE(has(script, "_sr_inline 'site' \"$SURFRAW_ex_site\"\n"));
    EXPECT_TRUE(has(script, "    _sr_inline 'tag' \"$_sr_elem\"\n"));
    EXPECT_TRUE(has(script, "    escaped_args=$(w3_url_of_arg \"$w3_args$_sr_inlines\")\n"));
}

TEST(GeneratorTest, DispatchVariants) {
    const auto plain = render({});
    EXPECT_TRUE(has(plain, "if [ -z \"$w3_args\" ]; then\n    w3_browse_url \"$base_url\"\nelse\n"));

    auto cfg = exampleConfig();
    cfg.queryParameter.reset();
    EXPECT_TRUE(has(render({}, cfg), "    w3_browse_url \"${search_url}${escaped_args}\"\n"));

    cfg.appendSearchArgs = false;
    const auto noArgs = render({}, cfg);
    EXPECT_TRUE(has(noArgs, "    w3_browse_url \"${search_url}\"\n"));
    EXPECT_FALSE(has(noArgs, "escaped_args"));

    const auto mapped = render({{DirectiveType::Anything, "site:"}, {DirectiveType::Map, "site:site"}}, cfg);
    EXPECT_TRUE(has(mapped, "    w3_browse_url \"${search_url}${_sr_params}\"\n"));
}

TEST(GeneratorTest, UsageHookListsLocalOptions) {
    const auto script = render({{DirectiveType::YesNo, "safe:yes"}});
    EXPECT_TRUE(has(script, "w3_usage_hook () {\n    cat <<EOF\nUsage: $w3_argv0 [options] [search words]...\n"));
    EXPECT_TRUE(has(script, "Description:\n  Search ex (example.com)\nLocal options:\n  -safe"));
    EXPECT_TRUE(has(script, "EOF\n    w3_global_usage\n}\n"));
}

TEST(GeneratorTest, CompileErrorsWriteNothing) {
    std::ostringstream oss;
    EXPECT_THROW(compile(exampleConfig(), {{DirectiveType::Enum, "sort:old:date,rank"}}, oss), CompileError);
    EXPECT_TRUE(oss.str().empty());
}

TEST(GeneratorTest, GeneratorRendersToStream) {
    auto cfg = exampleConfig();
    const auto graph = buildGraph(cfg, parseDirectives({{DirectiveType::YesNo, "safe:yes"}}));
    std::ostringstream oss;
    Generator(graph).render(oss);
    EXPECT_EQ(oss.str(), Generator(graph).render());
}
