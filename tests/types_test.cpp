#include <gtest/gtest.h>
#include "rainbow/types.hpp"
#include <vector>

using namespace rainbow;

namespace {

std::vector<TypeId> sample_types(TypeContext& ctx){
    TypeId num = ctx.get_number(), str = ctx.get_string(), b = ctx.get_boolean(), tm = ctx.get_time();
    TypeId nums = ctx.get_list(num);
    TypeId person = ctx.get_record({{"name", str, false}, {"age", num, true}});
    TypeId nested = ctx.get_record({{"people", ctx.get_list(person), false}, {"at", tm, false}});
    return {
        num, str, b, tm, nums, ctx.get_list(nums), person, nested,
        ctx.get_record({}),
        ctx.get_block({}, num),
        ctx.get_block({num, str}, b),
        ctx.get_block({person}, ctx.get_block({}, nums)),
    };
}

} // namespace

TEST(TypeAlgebra, SatisfiesIsReflexive){
    TypeContext ctx;
    for(TypeId t : sample_types(ctx)) EXPECT_TRUE(satisfies(ctx, t, t)) << ctx.to_string(t);
}

TEST(TypeAlgebra, StructurallyEqualTypesShareOneId){
    TypeContext ctx;
    TypeId a = ctx.get_record({{"b", ctx.get_number(), false}, {"a", ctx.get_string(), true}});
    TypeId b = ctx.get_record({{"a", ctx.get_string(), true}, {"b", ctx.get_number(), false}});
    EXPECT_EQ(a, b);
    EXPECT_EQ(ctx.get_block({ctx.get_number()}, ctx.get_string()), ctx.get_block({ctx.get_number()}, ctx.get_string()));
    EXPECT_NE(ctx.get_list(ctx.get_number()), ctx.get_list(ctx.get_string()));
}

TEST(TypeAlgebra, PrimitivesNeedTheSameKind){
    TypeContext ctx;
    EXPECT_FALSE(satisfies(ctx, ctx.get_number(), ctx.get_string()));
    EXPECT_FALSE(satisfies(ctx, ctx.get_time(), ctx.get_number()));
    auto why = why_unsatisfied(ctx, ctx.get_number(), ctx.get_boolean());
    ASSERT_TRUE(why.has_value());
    EXPECT_EQ(*why, "expected number, found boolean");
}

TEST(TypeAlgebra, ListsAreCovariant){
    TypeContext ctx;
    TypeId wide = ctx.get_record({{"id", ctx.get_number(), false}});
    TypeId narrow = ctx.get_record({{"id", ctx.get_number(), false}, {"name", ctx.get_string(), false}});
    EXPECT_TRUE(satisfies(ctx, ctx.get_list(wide), ctx.get_list(narrow)));
    EXPECT_FALSE(satisfies(ctx, ctx.get_list(narrow), ctx.get_list(wide)));
}

TEST(TypeAlgebra, RecordWidthSubtyping){
    TypeContext ctx;
    TypeId num = ctx.get_number(), str = ctx.get_string();
    TypeId left = ctx.get_record({{"id", num, false}});
    TypeId right = ctx.get_record({{"id", num, false}, {"name", str, false}, {"extra", str, true}});
    EXPECT_TRUE(satisfies(ctx, left, right));
    EXPECT_FALSE(satisfies(ctx, right, left));
    EXPECT_EQ(*why_unsatisfied(ctx, right, left), "field `name` is missing");
}

TEST(TypeAlgebra, RecordOptionalFields){
    TypeContext ctx;
    TypeId num = ctx.get_number();
    TypeId wants_optional = ctx.get_record({{"age", num, true}});
    TypeId wants_required = ctx.get_record({{"age", num, false}});
    TypeId has_optional = ctx.get_record({{"age", num, true}});
    TypeId has_nothing = ctx.get_record({});
    // optional fields of the expected side impose nothing
    EXPECT_TRUE(satisfies(ctx, wants_optional, has_nothing));
    EXPECT_TRUE(satisfies(ctx, wants_optional, ctx.get_record({{"age", ctx.get_string(), false}})));
    // a required field cannot be served by an optional one
    EXPECT_FALSE(satisfies(ctx, wants_required, has_optional));
    EXPECT_EQ(*why_unsatisfied(ctx, wants_required, has_optional), "field `age` is optional");
}

TEST(TypeAlgebra, BlockArityDirection){
    TypeContext ctx;
    TypeId o = ctx.get_string(), x = ctx.get_number();
    TypeId none = ctx.get_block({}, o);
    TypeId one = ctx.get_block({x}, o);
    // exactly one direction holds: fewer declared inputs may stand in for more
    EXPECT_FALSE(satisfies(ctx, none, one));
    EXPECT_TRUE(satisfies(ctx, one, none));
}

TEST(TypeAlgebra, BlockInputsAndOutputUseTheSameDirection){
    TypeContext ctx;
    TypeId wide = ctx.get_record({{"id", ctx.get_number(), false}});
    TypeId narrow = ctx.get_record({{"id", ctx.get_number(), false}, {"name", ctx.get_string(), false}});
    TypeId s = ctx.get_string();
    EXPECT_TRUE(satisfies(ctx, ctx.get_block({wide}, s), ctx.get_block({narrow}, s)));
    EXPECT_FALSE(satisfies(ctx, ctx.get_block({narrow}, s), ctx.get_block({wide}, s)));
    EXPECT_TRUE(satisfies(ctx, ctx.get_block({}, wide), ctx.get_block({}, narrow)));
    auto why = why_unsatisfied(ctx, ctx.get_block({s}, s), ctx.get_block({s}, ctx.get_number()));
    ASSERT_TRUE(why.has_value());
    EXPECT_EQ(*why, "in block output: expected string, found number");
}

TEST(TypeAlgebra, FunctionsAreNeverValues){
    TypeContext ctx;
    TypeId fn = ctx.add_function("show", {{"show", ctx.get_number(), false, false}}, ctx.get_string(), false, {});
    EXPECT_FALSE(satisfies(ctx, fn, fn));
    EXPECT_FALSE(satisfies(ctx, ctx.get_string(), fn));
}

TEST(TypeAlgebra, PrintsNotation){
    TypeContext ctx;
    TypeId num = ctx.get_number();
    EXPECT_EQ(ctx.to_string(ctx.get_list(num)), "[ number... ]");
    EXPECT_EQ(ctx.to_string(ctx.get_record({})), "[=]");
    EXPECT_EQ(ctx.to_string(ctx.get_record({{"Wat", ctx.get_list(num), true}, {"foo", num, false}})), "[ foo=number Wat?=[ number... ] ]");
    EXPECT_EQ(ctx.to_string(ctx.get_block({}, num)), "{ number }");
    EXPECT_EQ(ctx.to_string(ctx.get_block({num, ctx.get_string()}, ctx.get_boolean())), "{ number string => boolean }");
    TypeId fn = ctx.add_function("calc", {{"calc", num, false, false}, {"plus", num, true, true}, {"by", num, false, true}}, num, true, {});
    EXPECT_EQ(ctx.to_string(fn), "calc: number [plus]?: number by?: number :: number");
}

TEST(TypeAlgebra, ParsesNotation){
    TypeContext ctx;
    EXPECT_EQ(ctx.parse_type("number"), ctx.get_number());
    EXPECT_EQ(ctx.parse_type("  [ string... ] "), ctx.get_list(ctx.get_string()));
    EXPECT_EQ(ctx.parse_type("[=]"), ctx.get_record({}));
    EXPECT_EQ(ctx.parse_type("[ name=string age?=number ]"),
              ctx.get_record({{"name", ctx.get_string(), false}, {"age", ctx.get_number(), true}}));
    EXPECT_EQ(ctx.parse_type("{ time }"), ctx.get_block({}, ctx.get_time()));
    EXPECT_EQ(ctx.parse_type("{ number [ boolean... ] => { string } }"),
              ctx.get_block({ctx.get_number(), ctx.get_list(ctx.get_boolean())}, ctx.get_block({}, ctx.get_string())));
    TypeId printed = ctx.parse_type("[ a=[ number... ] b?={ number => string } ]");
    EXPECT_EQ(ctx.parse_type(ctx.to_string(printed)), printed);
}

TEST(TypeAlgebra, MalformedNotationIsAConfigError){
    TypeContext ctx;
    EXPECT_THROW(ctx.parse_type("numbr"), config_error);
    EXPECT_THROW(ctx.parse_type("[ number ]"), config_error);
    EXPECT_THROW(ctx.parse_type("{ number string }"), config_error);
    EXPECT_THROW(ctx.parse_type("[ a=number a=string ]"), config_error);
    EXPECT_THROW(ctx.parse_type("number number"), config_error);
    EXPECT_THROW(ctx.get_record({{"a", ctx.get_number(), false}, {"a", ctx.get_number(), false}}), std::invalid_argument);
}

TEST(TypeAlgebra, ChildContextReusesParentIds){
    TypeContext root;
    TypeId nums = root.get_list(root.get_number());
    TypeContext child(&root);
    EXPECT_EQ(child.get_number(), root.get_number());
    EXPECT_EQ(child.get_list(child.get_number()), nums);
    TypeId fresh = child.get_list(nums);
    EXPECT_GE(fresh, root.end());
    EXPECT_TRUE(child.valid(fresh));
    EXPECT_FALSE(root.valid(fresh));
    EXPECT_EQ(child.to_string(fresh), "[ [ number... ]... ]");
    EXPECT_TRUE(satisfies(child, fresh, fresh));
}
