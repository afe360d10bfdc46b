#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "srelvis/flag.hpp"
#include "srelvis/parser.hpp"

using namespace srelvis;

namespace {

std::vector<Flag> testFlags() {
    std::vector<Flag> f;
    f.emplace_back("--enum", "-E", "enum directive", "NAME:...", std::string());
    f.emplace_back("--yes-no", "-Y", "bool directive", "NAME:...", std::string());
    f.emplace_back("--insecure", "", "use http", "", false);
    f.emplace_back("--num-tabs", "", "tabs", "N", 1);
    f.emplace_back("--output", "-o", "output file", "FILE", std::string());
    f.emplace_back("--verbose", "-v", "more output", "", 0);
    f.back().setCount(true);
    f.emplace_back("--quiet", "-q", "less output", "", false);
    return f;
}

Parser parse(const std::vector<std::string>& args) { return Parser(args, testFlags()); }

} // namespace

TEST(ParserTest, KeepsCommandLineOrderAcrossFlags) {
    const auto p = parse({"--enum", "a:x:x,y", "-Y", "b:yes", "--enum=c:z:z", "name"});
    ASSERT_TRUE(p.ok()) << p.error();
    const auto& occ = p.ordered();
    ASSERT_EQ(occ.size(), 3u);
    EXPECT_EQ(occ[0].key, "--enum");
    EXPECT_EQ(occ[0].value, "a:x:x,y");
    EXPECT_EQ(occ[1].key, "--yes-no");
    EXPECT_EQ(occ[1].value, "b:yes");
    EXPECT_EQ(occ[2].key, "--enum");
    EXPECT_EQ(occ[2].value, "c:z:z");
    EXPECT_EQ(p.getFlagValues("-E"), (std::vector<std::string>{"a:x:x,y", "c:z:z"}));
    EXPECT_EQ(p.occurrences("--enum"), 2u);
    EXPECT_EQ(p.positionals(), (std::vector<std::string>{"name"}));
}

TEST(ParserTest, ValuesMayStartWithADash) {
    const auto p = parse({"-o", "-", "--enum", "-odd"});
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_EQ(p.getFlag<std::string>("--output"), "-");
    EXPECT_EQ(p.getFlag<std::string>("--enum"), "-odd");
}

TEST(ParserTest, ShortValuesAndGroups) {
    const auto p = parse({"-ofile", "-vvq"});
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_EQ(p.getFlag<std::string>("-o"), "file");
    EXPECT_EQ(p.getCount("--verbose"), 2);
    EXPECT_TRUE(p.getFlag<bool>("--quiet", false));
}

TEST(ParserTest, DefaultsAndTypedValues) {
    const auto defaults = parse({});
    EXPECT_EQ(defaults.getFlag<int>("--num-tabs"), 1);
    EXPECT_FALSE(defaults.getFlag<bool>("--insecure", true));
    EXPECT_FALSE(defaults.hasFlag("--output"));
    EXPECT_EQ(defaults.getCount("--verbose"), 0);

    const auto set = parse({"--num-tabs", "3", "--insecure"});
    ASSERT_TRUE(set.ok()) << set.error();
    EXPECT_EQ(set.getFlag<int>("--num-tabs"), 3);
    EXPECT_TRUE(set.getFlag<bool>("--insecure"));

    const auto bad = parse({"--num-tabs=many"});
    EXPECT_FALSE(bad.ok());
    EXPECT_EQ(bad.error(), "invalid argument \"many\" for \"--num-tabs\"");
}

TEST(ParserTest, UnknownFlagsSuggestCloseOnes) {
    const auto p = parse({"--enmu", "a:b:b"});
    EXPECT_FALSE(p.ok());
    EXPECT_EQ(p.error().rfind("unknown flag: --enmu", 0), 0u);
    EXPECT_NE(p.error().find("Did you mean this?\n  --enum\n"), std::string::npos);

    const auto far = parse({"--zzzzzzzz"});
    EXPECT_EQ(far.error(), "unknown flag: --zzzzzzzz");
}

TEST(ParserTest, MissingArgument) {
    const auto p = parse({"--output"});
    EXPECT_FALSE(p.ok());
    EXPECT_EQ(p.error(), "flag needs an argument: --output");

    EXPECT_EQ(parse({"-o"}).error(), "flag needs an argument: -o");
}

TEST(ParserTest, CountFlagsTakeNoValue) {
    const auto p = parse({"--verbose=2"});
    EXPECT_FALSE(p.ok());
    EXPECT_EQ(p.error(), "flag does not take a value: --verbose");
}

TEST(ParserTest, DoubleDashEndsFlags) {
    const auto p = parse({"--", "--enum", "-o"});
    ASSERT_TRUE(p.ok()) << p.error();
    EXPECT_EQ(p.positionals(), (std::vector<std::string>{"--enum", "-o"}));
    EXPECT_TRUE(p.ordered().empty());
}

TEST(ParserTest, BuiltinHelpAndVersion) {
    EXPECT_TRUE(parse({"-h"}).getFlag<bool>("--help", false));
    EXPECT_TRUE(parse({"--version"}).getFlag<bool>("--version", false));
    EXPECT_FALSE(parse({}).getFlag<bool>("--help", false));
}
