#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "srelvis/directive.hpp"
#include "srelvis/graph.hpp"
#include "srelvis/help.hpp"

using namespace srelvis;

namespace {

OptionGraph build(const std::vector<RawDirective>& raws) {
    ElvisConfig cfg;
    cfg.name = "ex";
    cfg.baseUrl = "example.com";
    cfg.searchUrl = "example.com/search?q=";
    return buildGraph(cfg, parseDirectives(raws));
}

std::size_t indexOf(const std::vector<std::string>& lines, const std::string& prefix) {
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].rfind(prefix, 0) == 0) return i;
    }
    return lines.size();
}

} // namespace

TEST(HelpTest, EmptyWithoutOptions) {
    EXPECT_TRUE(localHelpLines(build({})).empty());
}

TEST(HelpTest, AlignsDescriptionsAndEnumValues) {
    const auto lines = localHelpLines(build({
        {DirectiveType::YesNo, "safe:yes"},
        {DirectiveType::Enum, "sort:date:date,rank"},
        {DirectiveType::Alias, "s:sort:enum"},
        {DirectiveType::Flag, "latest:sort:date"},
    }));

    const std::string indent(25, ' ');
    const std::vector<std::string> expected{
        "  -safe=SAFE" + std::string(9, ' ') + "    A bool option for 'safe'",
        indent + "Default: $SURFRAW_ex_safe",
        indent + "Environment: SURFRAW_ex_safe",
        "  -s=SORT, -sort=SORT    An enum option for 'sort'",
        std::string(17, ' ') + "date  | ",
        std::string(17, ' ') + "rank  | ",
        indent + "Default: $SURFRAW_ex_sort",
        indent + "Environment: SURFRAW_ex_sort",
        "  -latest" + std::string(12, ' ') + "    An alias for -sort=date",
    };
    EXPECT_EQ(lines, expected);
}

TEST(HelpTest, BoolsShowTheirMetavar) {
    EXPECT_EQ(localHelpLines(build({{DirectiveType::YesNo, "safe:yes"}}))[0].rfind("  -safe=SAFE    ", 0), 0u);

    const auto lines = localHelpLines(build({
        {DirectiveType::YesNo, "safe:yes"},
        {DirectiveType::Metavar, "safe:answer"},
    }));
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines[0].rfind("  -safe=ANSWER    ", 0), 0u);
}

TEST(HelpTest, ListsShowThreeSpellings) {
    const auto lines = localHelpLines(build({
        {DirectiveType::List, "tags:enum::a,b"},
        {DirectiveType::Flag, "all:tags:a,b"},
    }));
    ASSERT_GE(lines.size(), 7u);
    EXPECT_EQ(lines[0].rfind("  -add-tags=TAGS ", 0), 0u);
    EXPECT_EQ(lines[1].rfind("  -clear-tags ", 0), 0u);
    EXPECT_EQ(lines[2].rfind("  -remove-tags=TAGS", 0), 0u);
    EXPECT_EQ(lines[3].rfind(std::string(15, ' ') + "a ", 0), 0u);
    EXPECT_EQ(lines[4].rfind(std::string(15, ' ') + "b ", 0), 0u);

    const auto flag = indexOf(lines, "  -add-all");
    ASSERT_LT(flag + 1, lines.size());
    EXPECT_NE(lines[flag].find("An alias for the 'enum' list option 'tags' with the values 'a,b'"),
              std::string::npos);
    EXPECT_EQ(lines[flag + 1].rfind("  -remove-all", 0), 0u);
}

TEST(HelpTest, VariablesComeBeforeFlagsInHelpOrder) {
    const auto lines = localHelpLines(build({
        {DirectiveType::List, "tags:anything:"},
        {DirectiveType::Special, "results"},
        {DirectiveType::Anything, "site:"},
        {DirectiveType::Flag, "many:results:100"},
        {DirectiveType::YesNo, "safe:no"},
    }));
    const auto safe = indexOf(lines, "  -safe=SAFE");
    const auto site = indexOf(lines, "  -site=SITE");
    const auto results = indexOf(lines, "  -results=NUM");
    const auto tags = indexOf(lines, "  -add-tags=TAGS");
    const auto many = indexOf(lines, "  -many");
    EXPECT_LT(safe, site);
    EXPECT_LT(site, results);
    EXPECT_LT(results, tags);
    EXPECT_LT(tags, many);
    EXPECT_LT(many, lines.size());
}

TEST(HelpTest, FlagsAreGroupedByTargetType) {
    const auto lines = localHelpLines(build({
        {DirectiveType::List, "tags:anything:"},
        {DirectiveType::YesNo, "safe:yes"},
        {DirectiveType::Anything, "site:"},
        {DirectiveType::Flag, "all:tags:a"},
        {DirectiveType::Flag, "wiki:site:wikipedia.org"},
        {DirectiveType::Flag, "nsfw:safe:no"},
    }));
    const auto nsfw = indexOf(lines, "  -nsfw ");
    const auto wiki = indexOf(lines, "  -wiki ");
    const auto all = indexOf(lines, "  -add-all ");
    EXPECT_LT(nsfw, wiki);
    EXPECT_LT(wiki, all);
    EXPECT_LT(all, lines.size());
}

TEST(HelpTest, SpecialsNameTheirGlobal) {
    const auto lines = localHelpLines(build({{DirectiveType::Special, "language"}}));
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_NE(lines[0].find("Two letter language code"), std::string::npos);
    EXPECT_NE(lines[2].find("Environment: SURFRAW_ex_language, SURFRAW_lang"), std::string::npos);
}

TEST(HelpTest, DescriptionsAreEscapedForTheHeredoc) {
    const auto g = build({
        {DirectiveType::Anything, "site:"},
        {DirectiveType::Describe, "site:Costs $5 `now`"},
    });
    std::ostringstream oss;
    printLocalHelp(oss, g);
    EXPECT_NE(oss.str().find("Costs \\$5 \\`now\\`"), std::string::npos);
    // Default lines expand when the help is shown.
    EXPECT_NE(oss.str().find("Default: $SURFRAW_ex_site"), std::string::npos);
}

TEST(HelpTest, FlagDescriptions) {
    const auto g = build({
        {DirectiveType::List, "tags:anything:"},
        {DirectiveType::Flag, "none:tags:"},
        {DirectiveType::YesNo, "safe:no"},
        {DirectiveType::Flag, "sfw:safe:yes"},
    });
    EXPECT_EQ(flagDescription(g, *g.findFlag("none")),
              "An alias for the 'anything' list option 'tags' with the values ''");
    EXPECT_EQ(flagDescription(g, *g.findFlag("sfw")), "An alias for -safe=yes");
}
