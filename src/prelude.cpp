#include "rainbow/prelude.hpp"

namespace rainbow {

void install_prelude(SignatureTable& table){
	TypeContext& t = table.types();
	TypeId num = t.get_number(), str = t.get_string(), boolean = t.get_boolean();

	table.define("not", boolean).returns(boolean).build();

	table.define("compare", num)
		.optional("biggerThan", num)
		.optional("atLeast", num)
		.optional("smallerThan", num)
		.optional("atMost", num)
		.returns(boolean)
		.build();

	// division by zero fails at run time
	table.define("calc", num)
		.variadic("plus", num)
		.variadic("subtract", num)
		.variadic("times", num)
		.variadic("dividedBy", num)
		.returns(num)
		.partial()
		.build();

	table.define("countFrom", num).required("to", num).optional("by", num).returns(t.get_list(num)).build();
	table.define("sum", t.get_list(num)).returns(num).build();
	table.define("upperCase", str).returns(str).build();
}

} // namespace rainbow
