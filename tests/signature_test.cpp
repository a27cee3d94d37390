#include <gtest/gtest.h>
#include "rainbow/prelude.hpp"
#include "rainbow/rainbow.hpp"
#include "rainbow/signature.hpp"
#include <algorithm>

using namespace rainbow;

TEST(SignatureTable, RegistersFromNotation){
    SignatureTable table;
    TypeId fn = table.register_signature("concat: string [and]: string [then]?: string suffix?: string :: string", false, {"Log", "Audit", "Log"});
    const Type* t = table.lookup("concat");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(table.lookup_id("concat"), fn);
    ASSERT_EQ(t->params.size(), 4u);
    EXPECT_FALSE(t->params[0].variadic);
    EXPECT_TRUE(t->params[1].variadic);
    EXPECT_FALSE(t->params[1].optional);
    EXPECT_TRUE(t->params[2].variadic);
    EXPECT_TRUE(t->params[2].optional);
    EXPECT_FALSE(t->params[3].variadic);
    EXPECT_TRUE(t->params[3].optional);
    EXPECT_EQ(t->effects, (std::vector<std::string>{"Audit", "Log"}));
    EXPECT_EQ(table.describe("concat"), "concat: string [and]: string [then]?: string suffix?: string :: string effects={Audit,Log}");
}

TEST(SignatureTable, ArrowSeparatorIsAccepted){
    SignatureTable table;
    table.register_signature("divide: number by: number => number", true);
    EXPECT_EQ(table.describe("divide"), "divide: number by: number :: number (partial)");
}

TEST(SignatureTable, BlockAndRecordParameters){
    SignatureTable table;
    table.register_signature("map: [ [ id=number tags?=[ string... ] ]... ] do: { [ id=number ] number => string } :: [ string... ]");
    const Type* t = table.lookup("map");
    ASSERT_NE(t, nullptr);
    const Type& block = table.types().at(t->params[1].type);
    ASSERT_EQ(block.kind, Type::Kind::Block);
    EXPECT_EQ(block.inputs.size(), 2u);
    EXPECT_EQ(table.types().to_string(t->output), "[ string... ]");
}

TEST(SignatureTable, BuilderMatchesNotation){
    SignatureTable table;
    TypeContext& ctx = table.types();
    table.define("between", ctx.get_number())
        .required("low", ctx.get_number())
        .optional("high", ctx.get_number())
        .variadic("except", ctx.get_number())
        .returns(ctx.get_boolean())
        .effect("Clock")
        .build();
    EXPECT_EQ(table.describe("between"), "between: number low: number high?: number [except]?: number :: boolean effects={Clock}");
}

TEST(SignatureTable, RejectsBadSignatures){
    SignatureTable table;
    EXPECT_THROW(table.register_signature("show number :: string"), config_error);
    EXPECT_THROW(table.register_signature("show: numbr :: string"), config_error);
    EXPECT_THROW(table.register_signature("show: number"), config_error);
    EXPECT_THROW(table.register_signature("[show]: number :: string"), config_error);
    EXPECT_THROW(table.register_signature("show?: number :: string"), config_error);
    EXPECT_THROW(table.register_signature("show: number as: string as: string :: string"), config_error);
    EXPECT_THROW(table.define("f", 0).returns(table.types().get_number()).build(), config_error);
    EXPECT_THROW(table.define("f", table.types().get_number()).build(), config_error);
    EXPECT_EQ(table.size(), 0u);
}

TEST(SignatureTable, ErrorNamesTheColumn){
    SignatureTable table;
    try {
        table.register_signature("show: number :: strin");
        FAIL() << "expected config_error";
    } catch(const config_error& e){
        std::string msg = e.what();
        EXPECT_NE(msg.find("invalid signature"), std::string::npos) << msg;
        EXPECT_NE(msg.find("column"), std::string::npos) << msg;
    }
}

TEST(SignatureTable, NamesAreUnique){
    SignatureTable table;
    table.register_signature("show: number :: string");
    EXPECT_THROW(table.register_signature("show: string :: string"), config_error);
    TypeContext& ctx = table.types();
    TypeId other = ctx.add_function("other", {{"other", ctx.get_number(), false, false}}, ctx.get_number(), false, {});
    EXPECT_THROW(table.register_function("different", other), config_error);
    EXPECT_THROW(table.register_function("num", ctx.get_number()), config_error);
}

TEST(SignatureTable, RawFunctionTypesAreValidated){
    SignatureTable table;
    TypeContext& ctx = table.types();
    TypeId no_output = ctx.add_function("bad", {{"bad", ctx.get_number(), false, false}}, 0, false, {});
    EXPECT_THROW(table.register_function("bad", no_output), config_error);
    TypeId no_param = ctx.add_function("bad2", {{"bad2", 0, false, false}}, ctx.get_number(), false, {});
    EXPECT_THROW(table.register_function("bad2", no_param), config_error);
    TypeId fn_param = ctx.add_function("bad3", {{"bad3", no_param, false, false}}, ctx.get_number(), false, {});
    EXPECT_THROW(table.register_function("bad3", fn_param), config_error);
    TypeId dup = ctx.add_function("bad4", {{"bad4", ctx.get_number(), false, false}, {"x", ctx.get_number(), false, false}, {"x", ctx.get_string(), false, false}}, ctx.get_number(), false, {});
    EXPECT_THROW(table.register_function("bad4", dup), config_error);
    EXPECT_EQ(table.size(), 0u);

    // a checked script never meets an unregistered signature
    table.freeze();
    auto r = check_script(table, "bad: 1");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errors[0].code, codes::UnknownFunction);
}

TEST(SignatureTable, FrozenTableIsReadOnly){
    SignatureTable table;
    install_prelude(table);
    size_t n = table.size();
    table.freeze();
    EXPECT_TRUE(table.frozen());
    EXPECT_THROW(table.register_signature("extra: number :: number"), config_error);
    EXPECT_THROW(table.types(), config_error);
    EXPECT_EQ(table.size(), n);
    const SignatureTable& view = table;
    EXPECT_EQ(view.types().to_string(view.lookup("sum")->output), "number");
}

TEST(SignatureTable, Prelude){
    SignatureTable table;
    install_prelude(table);
    auto names = table.names();
    for(const char* n : {"not", "compare", "calc", "countFrom", "sum", "upperCase"})
        EXPECT_NE(std::find(names.begin(), names.end(), n), names.end()) << n;
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
    EXPECT_TRUE(table.lookup("calc")->partial);
    EXPECT_FALSE(table.lookup("sum")->partial);
    EXPECT_EQ(table.describe("countFrom"), "countFrom: number to: number by?: number :: [ number... ]");
    EXPECT_EQ(table.lookup("missing"), nullptr);
    EXPECT_EQ(table.describe("missing"), "");
    // installing twice collides
    EXPECT_THROW(install_prelude(table), config_error);
}
