#include "rainbow/coercion.hpp"

namespace rainbow {

namespace {
struct depth_guard {
	size_t& d;
	explicit depth_guard(size_t& depth): d(depth){ ++d; }
	~depth_guard(){ --d; }
};
}

CoercionResolver::Expect CoercionResolver::expectation(const std::string& dispatch, const std::string& keyword) const {
	if(dispatch == kTryKeyword) return (keyword == kTryKeyword || keyword == kOrKeyword) ? Expect::ZeroInputBlock : Expect::Unknown;
	const Type* fn = table_.lookup(dispatch);
	if(!fn) return Expect::Unknown;
	const ParamType* p = fn->param(keyword);
	if(!p) return Expect::Unknown;
	const Type& pt = table_.types().at(p->type);
	if(pt.kind != Type::Kind::Block) return Expect::Value;
	return pt.inputs.empty() ? Expect::ZeroInputBlock : Expect::InputBlock;
}

term_ptr CoercionResolver::resolve_argument(const term_ptr& value, Expect expect){
	term_ptr v = resolve(value);
	if(expect == Expect::ZeroInputBlock && !is_block(*v)){
		++wrapped_;
		return t_block({}, v, v->pos);
	}
	if(expect == Expect::Value){
		while(is_zero_input_block(*v) && as_block(*v)->body){
			++unwrapped_;
			v = as_block(*v)->body;
		}
	}
	return v;
}

term_ptr CoercionResolver::resolve(const term_ptr& t){
	if(!t || depth_ >= max_depth_) return t;
	depth_guard g(depth_);
	struct V {
		CoercionResolver& self; const term& t;
		term_ptr operator()(const apply_term& a){
			apply_term out;
			const std::string& dispatch = dispatch_name(a);
			for(auto& kv : a.args){
				out.args.push_back(keyword_arg{kv.keyword, self.resolve_argument(kv.value, self.expectation(dispatch, kv.keyword)), kv.pos});
			}
			return make_term(std::move(out), t.pos);
		}
		term_ptr operator()(const record_term& r){
			record_term out;
			for(auto& e : r.entries) out.entries.push_back(record_entry{e.name, self.resolve(e.value)});
			return make_term(std::move(out), t.pos);
		}
		term_ptr operator()(const list_term& l){
			list_term out;
			for(auto& e : l.elems) out.elems.push_back(self.resolve(e));
			return make_term(std::move(out), t.pos);
		}
		term_ptr operator()(const block_term& b){
			return make_term(block_term{b.params, self.resolve(b.body)}, t.pos);
		}
		term_ptr operator()(const variable_term&){ return nullptr; }
		term_ptr operator()(const string_term&){ return nullptr; }
		term_ptr operator()(const number_term&){ return nullptr; }
		term_ptr operator()(const bool_term&){ return nullptr; }
	};
	term_ptr out = std::visit(V{*this, *t}, t->data);
	return out ? out : t; // leaves are shared unchanged
}

script CoercionResolver::resolve(const script& s){
	script out;
	for(auto& t : s.terms) out.terms.push_back(resolve(t));
	return out;
}

} // namespace rainbow
