#include <gtest/gtest.h>
#include "test_support.hpp"
#include <string>

using namespace rainbow;
using rainbow::test::has_code;
using rainbow::test::has_note;
using rainbow::test::has_warning;

namespace {

ScriptResult run(const SignatureTable& table, const std::string& src){
    CheckOptions o;
    o.max_depth = 256;
    o.trace = false;
    o.inputs = {{"url", "string"}};
    return check_script(table, src, o);
}

} // namespace

TEST(Partiality, UnguardedCallIsRejected){
    auto table = test::make_table();
    auto r = run(*table, "divide: 10 by: 2");
    ASSERT_FALSE(r.success);
    ASSERT_TRUE(has_code(r, codes::UnhandledPartiality));
    EXPECT_NE(r.errors[0].hint.find("try:"), std::string::npos);
    EXPECT_TRUE(r.effects.empty());
}

TEST(Partiality, TryArmGuardsItsDirectBody){
    auto table = test::make_table();
    auto r = run(*table, "try: { divide: 10 by: 2 } or: { 0 }");
    ASSERT_TRUE(r.success) << (r.errors.empty() ? "" : r.errors[0].message);
    EXPECT_EQ(r.output_type, "number");
    EXPECT_TRUE(r.warnings.empty());
    // the or: arm is coerced into a block
    EXPECT_TRUE(run(*table, "try: { divide: 10 by: 2 } or: 0").success);
}

TEST(Partiality, GuardDoesNotReachNestedCalls){
    auto table = test::make_table();
    auto r = run(*table, "try: { show: divide: 1 by: 2 } or: { \"none\" }");
    EXPECT_TRUE(has_code(r, codes::UnhandledPartiality));
    // the arm's own call is total
    EXPECT_TRUE(has_warning(r, codes::TryCannotFail));
}

TEST(Partiality, FallbackIsNotGuarded){
    auto table = test::make_table();
    auto bad = run(*table, "try: { divide: 1 by: 2 } or: { divide: 3 by: 4 }");
    EXPECT_TRUE(has_code(bad, codes::UnhandledPartiality));
    auto chained = run(*table, "try: { divide: 1 by: 2 } or: { try: { divide: 3 by: 4 } or: { 0 } }");
    EXPECT_TRUE(chained.success);
    EXPECT_EQ(chained.output_type, "number");
}

TEST(Partiality, GuardedCallsInsideBlocksAndLists){
    auto table = test::make_table();
    auto r = run(*table, "each: [1 2] do: { n => show: try: { divide: n by: 2 } or: { 0 } }");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.output_type, "[ string... ]");
    auto inner = run(*table, "[ try: { fetch: url } or: { \"\" } ]");
    ASSERT_TRUE(inner.success);
    EXPECT_EQ(inner.output_type, "[ string... ]");
}

TEST(Partiality, ArmsMustAgree){
    auto table = test::make_table();
    auto r = run(*table, "try: { divide: 1 by: 2 } or: { \"zero\" }");
    ASSERT_FALSE(r.success);
    ASSERT_TRUE(has_code(r, codes::BranchTypeDivergence));
    const TypeError* e = nullptr;
    for(auto& err : r.errors) if(err.code == codes::BranchTypeDivergence) e = &err;
    ASSERT_NE(e, nullptr);
    EXPECT_TRUE(has_note(*e, "try: number"));
    EXPECT_TRUE(has_note(*e, " or: string"));
}

TEST(Partiality, ArmsCompareStructurally){
    auto table = test::make_table();
    auto same = run(*table, "try: { parseNumbers: url } or: { [] }");
    ASSERT_TRUE(same.success);
    EXPECT_EQ(same.output_type, "[ number... ]");
    auto wider = run(*table, "try: { parseNumbers: url } or: { [\"x\"] }");
    EXPECT_TRUE(has_code(wider, codes::BranchTypeDivergence));
}

TEST(Partiality, OuterExpectationFlowsIntoBothArms){
    auto table = test::make_table();
    auto r = run(*table, "sum: try: { parseNumbers: url } or: { [] }");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.output_type, "number");
    auto mismatch = run(*table, "show: try: { fetch: url } or: { \"x\" }");
    EXPECT_TRUE(has_code(mismatch, codes::Mismatch));
}

TEST(Partiality, MalformedTry){
    auto table = test::make_table();
    auto no_or = run(*table, "try: { divide: 1 by: 2 }");
    ASSERT_TRUE(has_code(no_or, codes::ArityMismatch));
    EXPECT_NE(no_or.errors[0].message.find("missing required keyword `or:`"), std::string::npos);

    auto extra = run(*table, "try: { divide: 1 by: 2 } or: { 0 } finally: { 1 }");
    ASSERT_TRUE(has_code(extra, codes::ArityMismatch));
    EXPECT_NE(extra.errors[0].message.find("unexpected keyword `finally:`"), std::string::npos);
}

TEST(Partiality, TotalTryArmWarns){
    auto table = test::make_table();
    auto r = run(*table, "try: { upperCase: url } or: { \"\" }");
    EXPECT_TRUE(r.success);
    EXPECT_TRUE(has_warning(r, codes::TryCannotFail));
}

TEST(Partiality, TryIsReserved){
    SignatureTable table;
    EXPECT_THROW(table.register_signature("try: string :: string"), config_error);
}
