#include <gtest/gtest.h>
#include "rainbow/effects.hpp"
#include "rainbow/parser.hpp"
#include "test_support.hpp"

using namespace rainbow;

namespace {

script parse(const std::string& src){
    auto r = Parser().parse_string(src);
    EXPECT_TRUE(r.success) << src;
    return r.ast;
}

ScriptResult run(const SignatureTable& table, const std::string& src){
    CheckOptions o;
    o.trace = false;
    o.inputs = {{"url", "string"}, {"who", "[ id=number name=string ]"}};
    return check_script(table, src, o);
}

} // namespace

TEST(Effects, UnionOfEveryCall){
    auto table = test::make_table();
    auto all = collect_effects(*table, parse("[ a=log: \"a\" b=try: { fetch: url } or: { \"\" } ]"));
    EXPECT_EQ(all, (EffectSet{"Log", "Network"}));
}

TEST(Effects, BothArmsOfTryCount){
    auto table = test::make_table();
    auto fx = collect_effects(*table, parse("try: { fetch: url } or: { try: { save: who } or: { false } }"));
    EXPECT_EQ(fx, (EffectSet{"Log", "Network", "Storage"}));
}

TEST(Effects, BlockBodiesCountEvenIfNeverRun){
    auto table = test::make_table();
    auto fx = collect_effects(*table, parse("if: true then: { fetch: url } else: { \"\" }"));
    EXPECT_EQ(fx, EffectSet{"Network"});
    auto nested = collect_effects(*table, parse("[ a={ x => log: x } ]"));
    EXPECT_EQ(nested, EffectSet{"Log"});
}

TEST(Effects, PureScriptsAndUnknownCalls){
    auto table = test::make_table();
    EXPECT_TRUE(collect_effects(*table, parse("sum: countFrom: 1 to: 3")).empty());
    EXPECT_EQ(collect_effects(*table, parse("mystery: { log: \"x\" }")), EffectSet{"Log"});
    EXPECT_TRUE(collect_effects(*table, parse("mystery: 1")).empty());
}

TEST(Effects, DepthLimitStopsTheWalk){
    auto table = test::make_table();
    term_ptr t = t_apply({{"log", t_str("x")}});
    for(int i = 0; i < 10; ++i) t = t_list({t});
    EXPECT_TRUE(collect_effects(*table, t, 5).empty());
    EXPECT_EQ(collect_effects(*table, t, 64), EffectSet{"Log"});
}

TEST(Effects, ReportedOnlyForWellTypedScripts){
    auto table = test::make_table();
    auto ok = run(*table, "try: { fetch: url } or: { \"offline\" }");
    ASSERT_TRUE(ok.success);
    EXPECT_EQ(ok.effects, EffectSet{"Network"});
    EXPECT_EQ(to_string(ok.effects), "{Network}");

    auto bad = run(*table, "fetch: url");
    EXPECT_FALSE(bad.success);
    EXPECT_TRUE(bad.effects.empty());
}

TEST(Effects, Printing){
    EXPECT_EQ(to_string(EffectSet{}), "{}");
    EXPECT_EQ(to_string(EffectSet{"Network", "Log"}), "{Log, Network}");
}
