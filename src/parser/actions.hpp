#pragma once
#include "state.hpp"
#include "grammar.hpp"
#include <tao/pegtl.hpp>
#include <algorithm>
#include <stdexcept>

namespace rainbow::pegtl_front::actions {
using namespace tao::pegtl;

// Reject syntactically valid input; the entry point reports semantic_msg verbatim.
template<typename ActionInput>
[[noreturn]] inline void reject(const ActionInput& in, parse_state& st, std::string msg, source_pos where){
	st.semantic_msg = std::move(msg);
	st.semantic_pos = where;
	throw parse_error(st.semantic_msg, in);
}

template<typename Rule>
struct action : nothing<Rule> {};

template<> struct action< grammar::lbracket > {
	template<typename ActionInput>
	static void apply(const ActionInput& in, parse_state& st){ st.open_pos = to_source_pos(in.position()); }
};
template<> struct action< grammar::lbrace > {
	template<typename ActionInput>
	static void apply(const ActionInput& in, parse_state& st){ st.open_pos = to_source_pos(in.position()); }
};

// ---- apply ----
template<> struct action< grammar::apply_begin > {
	template<typename ActionInput>
	static void apply(const ActionInput& in, parse_state& st){ st.open(to_source_pos(in.position())); }
};
template<> struct action< grammar::keyword_name > {
	template<typename ActionInput>
	static void apply(const ActionInput& in, parse_state& st){ st.names.emplace_back(in.string(), to_source_pos(in.position())); }
};
template<> struct action< grammar::apply_end > {
	template<typename ActionInput>
	static void apply(const ActionInput&, parse_state& st){
		auto m = st.close();
		auto names = st.take_names(m.names);
		auto values = st.take_terms(m.terms);
		apply_term a;
		for(size_t i = 0; i < names.size() && i < values.size(); ++i)
			a.args.push_back(keyword_arg{std::move(names[i].first), std::move(values[i]), names[i].second});
		st.terms.push_back(make_term(std::move(a), m.pos));
	}
};

// ---- record ----
template<> struct action< grammar::record_begin > {
	template<typename ActionInput>
	static void apply(const ActionInput&, parse_state& st){ st.open(st.open_pos); }
};
template<> struct action< grammar::entry_name > {
	template<typename ActionInput>
	static void apply(const ActionInput& in, parse_state& st){ st.names.emplace_back(in.string(), to_source_pos(in.position())); }
};
template<> struct action< grammar::record > {
	template<typename ActionInput>
	static void apply(const ActionInput& in, parse_state& st){
		auto m = st.close();
		auto names = st.take_names(m.names);
		auto values = st.take_terms(m.terms);
		record_term r;
		for(size_t i = 0; i < names.size() && i < values.size(); ++i){
			for(auto& e : r.entries)
				if(e.name == names[i].first) reject(in, st, "duplicate record key `" + e.name + "`", names[i].second);
			r.entries.push_back(record_entry{std::move(names[i].first), std::move(values[i])});
		}
		st.terms.push_back(make_term(std::move(r), m.pos));
	}
};

// ---- list ----
template<> struct action< grammar::list_begin > {
	template<typename ActionInput>
	static void apply(const ActionInput&, parse_state& st){ st.open(st.open_pos); }
};
template<> struct action< grammar::list > {
	template<typename ActionInput>
	static void apply(const ActionInput&, parse_state& st){
		auto m = st.close();
		st.terms.push_back(make_term(list_term{st.take_terms(m.terms)}, m.pos));
	}
};

// ---- block ----
template<> struct action< grammar::block_begin > {
	template<typename ActionInput>
	static void apply(const ActionInput&, parse_state& st){ st.open(st.open_pos); }
};
template<> struct action< grammar::block_param > {
	template<typename ActionInput>
	static void apply(const ActionInput& in, parse_state& st){
		auto pos = to_source_pos(in.position());
		std::string name = in.string();
		for(size_t i = st.marks.back().names; i < st.names.size(); ++i)
			if(st.names[i].first == name) reject(in, st, "duplicate block parameter `" + name + "`", pos);
		st.names.emplace_back(std::move(name), pos);
	}
};
template<> struct action< grammar::block > {
	template<typename ActionInput>
	static void apply(const ActionInput&, parse_state& st){
		auto m = st.close();
		auto names = st.take_names(m.names);
		auto body = st.take_terms(m.terms);
		block_term b;
		for(auto& n : names) b.params.push_back(std::move(n.first));
		b.body = body.empty() ? term_ptr{} : body.back();
		st.terms.push_back(make_term(std::move(b), m.pos));
	}
};

// ---- leaves ----
template<> struct action< grammar::string_lit > {
	template<typename ActionInput>
	static void apply(const ActionInput& in, parse_state& st){
		std::string raw = in.string();
		st.terms.push_back(t_str(unescape(raw.substr(1, raw.size() - 2)), to_source_pos(in.position())));
	}
};
template<> struct action< grammar::number > {
	template<typename ActionInput>
	static void apply(const ActionInput& in, parse_state& st){
		std::string text = in.string();
		auto pos = to_source_pos(in.position());
		double v = 0;
		try { v = std::stod(text); }
		catch(const std::out_of_range&){ reject(in, st, "number `" + in.string() + "` is out of range", pos); }
		st.terms.push_back(t_num(v, pos));
	}
};
template<> struct action< grammar::bool_lit > {
	template<typename ActionInput>
	static void apply(const ActionInput& in, parse_state& st){ st.terms.push_back(t_bool(in.string() == "true", to_source_pos(in.position()))); }
};
template<> struct action< grammar::variable > {
	template<typename ActionInput>
	static void apply(const ActionInput& in, parse_state& st){ st.terms.push_back(t_var(split_path(in.string()), to_source_pos(in.position()))); }
};

// ---- error reporting and depth guard ----
template<typename Rule> struct expected_text { static constexpr const char* what = "valid syntax"; };
template<> struct expected_text< grammar::term > { static constexpr const char* what = "a term"; };
template<> struct expected_text< grammar::rbracket > { static constexpr const char* what = "`]`"; };
template<> struct expected_text< grammar::rbrace > { static constexpr const char* what = "`}`"; };
template<> struct expected_text< grammar::close_quote > { static constexpr const char* what = "closing `\"`"; };
template<> struct expected_text< grammar::script_end > { static constexpr const char* what = "a term or end of input"; };
template<> struct expected_text< eof > { static constexpr const char* what = "end of input"; };

template<typename Rule>
struct control_base : normal<Rule> {
	template<typename ParseInput>
	[[noreturn]] static void raise(const ParseInput& in, parse_state& st){
		st.expected = expected_text<Rule>::what;
		throw parse_error("expected " + st.expected, in);
	}
};

template<typename Rule>
struct control : control_base<Rule> {};

// Every nested term passes through here, so counting starts bounds recursion.
template<> struct control< grammar::term > : control_base< grammar::term > {
	template<typename ParseInput>
	static void start(const ParseInput& in, parse_state& st){
		if(++st.depth > st.max_depth){
			st.semantic_msg = "nesting exceeds the maximum depth of " + std::to_string(st.max_depth);
			st.semantic_pos = to_source_pos(in.position());
			throw parse_error(st.semantic_msg, in);
		}
	}
	template<typename ParseInput>
	static void success(const ParseInput&, parse_state& st){ --st.depth; }
	template<typename ParseInput>
	static void failure(const ParseInput&, parse_state& st){ --st.depth; }
};

} // namespace rainbow::pegtl_front::actions
