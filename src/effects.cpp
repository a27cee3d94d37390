#include "rainbow/effects.hpp"

namespace rainbow {

static void collect(const SignatureTable& table, const term_ptr& t, size_t depth, size_t max_depth, EffectSet& out){
	if(!t || depth >= max_depth) return;
	if(auto* a = as_apply(*t)){
		if(const Type* fn = table.lookup(dispatch_name(*a))) out.insert(fn->effects.begin(), fn->effects.end());
		for(auto& kv : a->args) collect(table, kv.value, depth + 1, max_depth, out);
	} else if(auto* b = as_block(*t)){
		collect(table, b->body, depth + 1, max_depth, out);
	} else if(auto* r = std::get_if<record_term>(&t->data)){
		for(auto& e : r->entries) collect(table, e.value, depth + 1, max_depth, out);
	} else if(auto* l = std::get_if<list_term>(&t->data)){
		for(auto& e : l->elems) collect(table, e, depth + 1, max_depth, out);
	}
}

EffectSet collect_effects(const SignatureTable& table, const term_ptr& t, size_t max_depth){
	EffectSet out;
	collect(table, t, 0, max_depth, out);
	return out;
}

EffectSet collect_effects(const SignatureTable& table, const script& s, size_t max_depth){
	EffectSet out;
	for(auto& t : s.terms) collect(table, t, 0, max_depth, out);
	return out;
}

std::string to_string(const EffectSet& effects){
	std::string s = "{";
	bool first = true;
	for(auto& e : effects){ if(!first) s += ", "; first = false; s += e; }
	return s + "}";
}

} // namespace rainbow
