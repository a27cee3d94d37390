// Syntax printer, structural equality and depth measurement for Rainbow terms.
#include "rainbow/ast.hpp"
#include <sstream>
#include <utility>
#include <vector>

namespace rainbow {

static std::string quote(const std::string& s){
	std::string out = "\"";
	for(char c : s){
		switch(c){
			case '"': out += "\\\""; break;
			case '\\': out += "\\\\"; break;
			case '\n': out += "\\n"; break;
			case '\r': out += "\\r"; break;
			case '\t': out += "\\t"; break;
			default: out += c; break;
		}
	}
	out += '"';
	return out;
}

std::string to_string(const term& t){
	struct V {
		std::string operator()(const apply_term& a) const {
			std::string out; bool first = true;
			for(auto& kv : a.args){ if(!first) out += ' '; first = false; out += kv.keyword + ": " + to_string(kv.value); }
			return out;
		}
		std::string operator()(const variable_term& v) const {
			std::string out;
			for(size_t i = 0; i < v.path.size(); ++i){ if(i) out += '.'; out += v.path[i]; }
			return out;
		}
		std::string operator()(const record_term& r) const {
			if(r.entries.empty()) return "[=]";
			std::string out = "["; bool first = true;
			for(auto& e : r.entries){ if(!first) out += ' '; first = false; out += e.name + '=' + to_string(e.value); }
			return out + ']';
		}
		std::string operator()(const list_term& l) const {
			std::string out = "["; bool first = true;
			for(auto& e : l.elems){ if(!first) out += ' '; first = false; out += to_string(e); }
			return out + ']';
		}
		std::string operator()(const string_term& s) const { return quote(s.value); }
		std::string operator()(const number_term& n) const { std::ostringstream oss; oss << n.value; return oss.str(); }
		std::string operator()(const bool_term& b) const { return b.value ? "true" : "false"; }
		std::string operator()(const block_term& b) const {
			std::string out = "{ ";
			if(!b.params.empty()){ for(auto& p : b.params) out += p + ' '; out += "=> "; }
			return out + to_string(b.body) + " }";
		}
	};
	return std::visit(V{}, t.data);
}

std::string to_string(const script& s){
	std::string out;
	for(size_t i = 0; i < s.terms.size(); ++i){ if(i) out += '\n'; out += to_string(s.terms[i]); }
	return out;
}

static bool equal_impl(const term_ptr& a, const term_ptr& b){
	if(a.get() == b.get()) return true;
	if(!a || !b) return false;
	if(a->data.index() != b->data.index()) return false;

	struct Visitor {
		const term& a; const term& b;
		bool operator()(const apply_term&) const {
			const auto& la = std::get<apply_term>(a.data).args;
			const auto& ra = std::get<apply_term>(b.data).args;
			if(la.size() != ra.size()) return false;
			for(size_t i = 0; i < la.size(); ++i) if(la[i].keyword != ra[i].keyword || !equal_impl(la[i].value, ra[i].value)) return false;
			return true;
		}
		bool operator()(const variable_term&) const { return std::get<variable_term>(a.data).path == std::get<variable_term>(b.data).path; }
		bool operator()(const record_term&) const {
			const auto& le = std::get<record_term>(a.data).entries;
			const auto& re = std::get<record_term>(b.data).entries;
			if(le.size() != re.size()) return false;
			// Entry order is not significant.
			std::vector<bool> used(re.size());
			for(const auto& e : le){
				bool found = false;
				for(size_t j = 0; j < re.size(); ++j){
					if(!used[j] && re[j].name == e.name && equal_impl(e.value, re[j].value)){ used[j] = true; found = true; break; }
				}
				if(!found) return false;
			}
			return true;
		}
		bool operator()(const list_term&) const {
			const auto& le = std::get<list_term>(a.data).elems;
			const auto& re = std::get<list_term>(b.data).elems;
			if(le.size() != re.size()) return false;
			for(size_t i = 0; i < le.size(); ++i) if(!equal_impl(le[i], re[i])) return false;
			return true;
		}
		bool operator()(const string_term&) const { return std::get<string_term>(a.data).value == std::get<string_term>(b.data).value; }
		bool operator()(const number_term&) const { return std::get<number_term>(a.data).value == std::get<number_term>(b.data).value; }
		bool operator()(const bool_term&) const { return std::get<bool_term>(a.data).value == std::get<bool_term>(b.data).value; }
		bool operator()(const block_term&) const {
			const auto& lb = std::get<block_term>(a.data);
			const auto& rb = std::get<block_term>(b.data);
			return lb.params == rb.params && equal_impl(lb.body, rb.body);
		}
	};
	return std::visit(Visitor{*a, *b}, a->data);
}

bool equal(const term_ptr& a, const term_ptr& b){ return equal_impl(a, b); }

size_t depth(const term_ptr& root){
	if(!root) return 0;
	size_t best = 0;
	std::vector<std::pair<const term*, size_t>> work{{root.get(), 1}};
	while(!work.empty()){
		auto [t, d] = work.back(); work.pop_back();
		if(d > best) best = d;
		auto push = [&](const term_ptr& c){ if(c) work.emplace_back(c.get(), d + 1); };
		if(auto* a = std::get_if<apply_term>(&t->data)){ for(auto& kv : a->args) push(kv.value); }
		else if(auto* r = std::get_if<record_term>(&t->data)){ for(auto& e : r->entries) push(e.value); }
		else if(auto* l = std::get_if<list_term>(&t->data)){ for(auto& e : l->elems) push(e); }
		else if(auto* b = std::get_if<block_term>(&t->data)){ push(b->body); }
	}
	return best;
}

} // namespace rainbow
