// Parser for the type and signature notation hosts use to describe functions
// and script inputs: "[ number... ]", "[ a=string b?=time ]", "{ number => boolean }",
// "divide: number by: number :: number".
#include "rainbow/types.hpp"
#include "rainbow/signature.hpp"
#include <tao/pegtl.hpp>

namespace rainbow {
namespace type_notation {
using namespace tao::pegtl;

// ---- grammar ----
struct ws : star< space > {};
struct ident : identifier {};
struct lbracket : one<'['> {};
struct rbracket : one<']'> {};
struct lbrace : one<'{'> {};
struct rbrace : one<'}'> {};
struct equals : one<'='> {};
struct colon : one<':'> {};
struct question : one<'?'> {};
struct arrow : string<'=','>'> {};
struct ellipsis : string<'.','.','.'> {};

struct prim_number : keyword<'n','u','m','b','e','r'> {};
struct prim_string : keyword<'s','t','r','i','n','g'> {};
struct prim_boolean : keyword<'b','o','o','l','e','a','n'> {};
struct prim_time : keyword<'t','i','m','e'> {};
struct primitive : sor< prim_number, prim_string, prim_boolean, prim_time > {};

struct type;

struct field_ahead : at< ident, ws, opt< question >, ws, equals > {};
struct field_name : ident {};
struct field_optional : question {};
struct field : seq< field_ahead, field_name, ws, opt< field_optional >, ws, equals, ws, must< type > > {};
struct record_begin : success {};
struct record_type : seq< lbracket, ws, at< sor< field_ahead, seq< equals, ws, rbracket > > >, record_begin,
                          sor< seq< equals, ws >, plus< field, ws > >, must< rbracket > > {};

struct list_type : seq< lbracket, ws, must< type >, ws, must< ellipsis >, ws, must< rbracket > > {};

struct block_begin : success {};
struct block_arrow : arrow {};
struct block_type : seq< lbrace, block_begin, ws, star< type, ws >, opt< block_arrow, ws, must< type >, ws >, must< rbrace > > {};

struct type : sor< primitive, record_type, list_type, block_type > {};

struct param_name : ident {};
struct variadic_name : seq< one<'['>, ident, one<']'> > {};
struct param_optional : question {};
struct param : seq< sor< variadic_name, param_name >, opt< param_optional >, must< colon >, ws, must< type > > {};
struct returns_sep : sor< string<':',':'>, arrow > {};
struct signature : seq< ws, must< param >, star< ws, param >, ws, must< returns_sep >, ws, must< type >, ws, must< eof > > {};
struct type_only : seq< ws, must< type >, ws, must< eof > > {};

// ---- state ----
struct notation_state {
	TypeContext& ctx;
	struct pending_field { std::string name; bool optional; };
	struct mark { size_t types; size_t fields; bool arrow; };
	std::vector<TypeId> types;
	std::vector<pending_field> fields;
	std::vector<mark> marks;
	std::vector<ParamType> params;
	std::string expected;
	std::string semantic_msg;
};

// ---- actions ----
template<typename Rule> struct action : nothing<Rule> {};

template<typename Rule, PrimitiveKind K> struct primitive_action {
	template<typename ActionInput>
	static void apply(const ActionInput&, notation_state& st){ st.types.push_back(st.ctx.get_primitive(K)); }
};
template<> struct action< prim_number > : primitive_action< prim_number, PrimitiveKind::Number > {};
template<> struct action< prim_string > : primitive_action< prim_string, PrimitiveKind::String > {};
template<> struct action< prim_boolean > : primitive_action< prim_boolean, PrimitiveKind::Boolean > {};
template<> struct action< prim_time > : primitive_action< prim_time, PrimitiveKind::Time > {};

template<> struct action< record_begin > {
	template<typename ActionInput>
	static void apply(const ActionInput&, notation_state& st){ st.marks.push_back({st.types.size(), st.fields.size(), false}); }
};
template<> struct action< field_name > {
	template<typename ActionInput>
	static void apply(const ActionInput& in, notation_state& st){ st.fields.push_back({in.string(), false}); }
};
template<> struct action< field_optional > {
	template<typename ActionInput>
	static void apply(const ActionInput&, notation_state& st){ st.fields.back().optional = true; }
};
template<> struct action< record_type > {
	template<typename ActionInput>
	static void apply(const ActionInput& in, notation_state& st){
		auto m = st.marks.back(); st.marks.pop_back();
		std::vector<RecordField> fields;
		for(size_t i = 0; m.fields + i < st.fields.size(); ++i){
			auto& f = st.fields[m.fields + i];
			for(auto& seen : fields)
				if(seen.name == f.name){ st.semantic_msg = "duplicate record field `" + f.name + "`"; throw parse_error(st.semantic_msg, in); }
			fields.push_back(RecordField{f.name, st.types[m.types + i], f.optional});
		}
		st.fields.resize(m.fields);
		st.types.resize(m.types);
		st.types.push_back(st.ctx.get_record(std::move(fields)));
	}
};
template<> struct action< list_type > {
	template<typename ActionInput>
	static void apply(const ActionInput&, notation_state& st){ TypeId elem = st.types.back(); st.types.back() = st.ctx.get_list(elem); }
};
template<> struct action< block_begin > {
	template<typename ActionInput>
	static void apply(const ActionInput&, notation_state& st){ st.marks.push_back({st.types.size(), st.fields.size(), false}); }
};
template<> struct action< block_arrow > {
	template<typename ActionInput>
	static void apply(const ActionInput&, notation_state& st){ st.marks.back().arrow = true; }
};
template<> struct action< block_type > {
	template<typename ActionInput>
	static void apply(const ActionInput& in, notation_state& st){
		auto m = st.marks.back(); st.marks.pop_back();
		std::vector<TypeId> all(st.types.begin() + m.types, st.types.end());
		st.types.resize(m.types);
		if(!m.arrow && all.size() != 1){
			st.semantic_msg = all.empty() ? "block type needs an output type" : "block inputs must be followed by `=>` and an output type";
			throw parse_error(st.semantic_msg, in);
		}
		TypeId output = all.back(); all.pop_back();
		st.types.push_back(st.ctx.get_block(std::move(all), output));
	}
};

template<> struct action< param_name > {
	template<typename ActionInput>
	static void apply(const ActionInput& in, notation_state& st){ st.params.push_back(ParamType{in.string(), 0, false, false}); }
};
template<> struct action< variadic_name > {
	template<typename ActionInput>
	static void apply(const ActionInput& in, notation_state& st){
		std::string raw = in.string();
		st.params.push_back(ParamType{raw.substr(1, raw.size() - 2), 0, true, false});
	}
};
template<> struct action< param_optional > {
	template<typename ActionInput>
	static void apply(const ActionInput&, notation_state& st){ st.params.back().optional = true; }
};
template<> struct action< param > {
	template<typename ActionInput>
	static void apply(const ActionInput&, notation_state& st){ st.params.back().type = st.types.back(); st.types.pop_back(); }
};

template<typename Rule> struct expected_text { static constexpr const char* what = "valid type notation"; };
template<> struct expected_text< type > { static constexpr const char* what = "a type"; };
template<> struct expected_text< rbracket > { static constexpr const char* what = "`]`"; };
template<> struct expected_text< rbrace > { static constexpr const char* what = "`}`"; };
template<> struct expected_text< ellipsis > { static constexpr const char* what = "`...`"; };
template<> struct expected_text< colon > { static constexpr const char* what = "`:`"; };
template<> struct expected_text< param > { static constexpr const char* what = "a keyword parameter"; };
template<> struct expected_text< returns_sep > { static constexpr const char* what = "`::` and a return type"; };
template<> struct expected_text< eof > { static constexpr const char* what = "end of input"; };

template<typename Rule>
struct control : normal<Rule> {
	template<typename ParseInput>
	[[noreturn]] static void raise(const ParseInput& in, notation_state& st){
		st.expected = expected_text<Rule>::what;
		throw parse_error("expected " + st.expected, in);
	}
};

template<typename Rule>
static void run(std::string_view text, notation_state& st, const char* what){
	memory_input in(text.data(), text.size(), what);
	try {
		tao::pegtl::parse< Rule, action, control >(in, st);
	} catch(const parse_error& e){
		const auto& p = e.positions().front();
		std::string msg = !st.semantic_msg.empty() ? st.semantic_msg : (st.expected.empty() ? std::string(e.what()) : "expected " + st.expected);
		throw config_error(std::string("invalid ") + what + " `" + std::string(text) + "`: " + msg + " at column " + std::to_string(p.column));
	} catch(const std::invalid_argument& e){
		throw config_error(std::string("invalid ") + what + " `" + std::string(text) + "`: " + e.what());
	}
}

} // namespace type_notation

TypeId TypeContext::parse_type(std::string_view text){
	type_notation::notation_state st{*this, {}, {}, {}, {}, {}, {}};
	type_notation::run< type_notation::type_only >(text, st, "type");
	return st.types.back();
}

SignatureText parse_signature(TypeContext& ctx, std::string_view text){
	type_notation::notation_state st{ctx, {}, {}, {}, {}, {}, {}};
	type_notation::run< type_notation::signature >(text, st, "signature");
	SignatureText out;
	out.params = std::move(st.params);
	out.output = st.types.back();
	const auto& head = out.params.front();
	if(head.variadic || head.optional)
		throw config_error("invalid signature `" + std::string(text) + "`: dispatch keyword `" + head.name + "` cannot be optional or variadic");
	for(size_t i = 0; i < out.params.size(); ++i)
		for(size_t j = 0; j < i; ++j)
			if(out.params[i].name == out.params[j].name)
				throw config_error("invalid signature `" + std::string(text) + "`: duplicate keyword `" + out.params[i].name + "`");
	return out;
}

} // namespace rainbow
