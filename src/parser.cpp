#include "rainbow/parser.hpp"
#include "parser/state.hpp"
#include "parser/grammar.hpp"
#include "parser/actions.hpp"
#include <tao/pegtl.hpp>
#include <cctype>

namespace rainbow {
namespace pegtl_front {

std::string unescape(const std::string& raw){
	std::string out; out.reserve(raw.size());
	for(size_t i = 0; i < raw.size(); ++i){
		char c = raw[i];
		if(c != '\\' || i + 1 >= raw.size()){ out += c; continue; }
		char n = raw[++i];
		switch(n){
			case 'n': out += '\n'; break;
			case 'r': out += '\r'; break;
			case 't': out += '\t'; break;
			default: out += n; break; // \" \\ and unknown escapes keep the character
		}
	}
	return out;
}

std::vector<std::string> split_path(const std::string& raw){
	std::vector<std::string> out;
	std::string cur;
	for(char c : raw){
		if(c == '.'){ out.push_back(cur); cur.clear(); }
		else if(!std::isspace(static_cast<unsigned char>(c))) cur += c;
	}
	out.push_back(cur);
	return out;
}

} // namespace pegtl_front

using namespace rainbow::pegtl_front;

template<typename Rule>
static ParseResult run_parser(std::string_view src, std::string_view filename, size_t max_depth){
	tao::pegtl::memory_input in(src.data(), src.size(), std::string(filename));
	parse_state st; st.max_depth = max_depth;
	ParseResult r;
	try {
		tao::pegtl::parse< Rule, actions::action, actions::control >(in, st);
		r.success = true;
		r.ast.terms = std::move(st.terms);
	} catch(const tao::pegtl::parse_error& e){
		ParseError err;
		if(!st.semantic_msg.empty()){
			err.message = st.semantic_msg;
			err.line = st.semantic_pos.line; err.col = st.semantic_pos.col; err.offset = st.semantic_pos.offset;
		} else {
			const auto& p = e.positions().front();
			err.expected = st.expected;
			err.message = st.expected.empty() ? std::string(e.what()) : "expected " + st.expected;
			err.line = static_cast<int>(p.line); err.col = static_cast<int>(p.column); err.offset = static_cast<size_t>(p.byte);
		}
		r.success = false;
		r.error = std::move(err);
	}
	return r;
}

ParseResult Parser::parse_string(std::string_view src, std::string_view filename) const {
	return run_parser< grammar::script >(src, filename, max_depth_);
}

ParseResult Parser::parse_term(std::string_view src, std::string_view filename) const {
	return run_parser< grammar::single_term >(src, filename, max_depth_);
}

} // namespace rainbow
