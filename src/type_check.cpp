#include "rainbow/type_check.hpp"
#include <algorithm>
#include <cstdio>

namespace rainbow {

namespace {
struct depth_guard {
	size_t& d;
	explicit depth_guard(size_t& depth): d(depth){ ++d; }
	~depth_guard(){ --d; }
};
std::string keyword_list(const Type& fn){
	std::string s;
	for(size_t i = 0; i < fn.params.size(); ++i){ if(i) s += ' '; s += fn.params[i].name + ':'; }
	return s;
}
}

TypeChecker::TypeChecker(const SignatureTable& table, TypeContext& ctx, CheckerConfig cfg)
	: table_(table), ctx_(ctx), cfg_(cfg), inputs_(scope_factory_.getEmptyMap()) {}

// ---- scopes ----

unsigned TypeChecker::intern(const std::string& name){
	auto ins = symbols_.try_emplace(name, static_cast<unsigned>(symbol_names_.size()));
	if(ins.second) symbol_names_.push_back(name);
	return ins.first->second;
}

TypeChecker::Scope TypeChecker::bind(Scope scope, const std::string& name, TypeId type, source_pos pos, bool input){
	unsigned idx = static_cast<unsigned>(bindings_.size());
	bindings_.push_back(Binding{name, type, pos, false, input});
	return scope_factory_.add(scope, intern(name), idx);
}

TypeChecker::Binding* TypeChecker::lookup(const Scope& scope, const std::string& name){
	auto it = symbols_.find(name);
	if(it == symbols_.end()) return nullptr;
	const unsigned* idx = scope.lookup(it->second);
	return idx ? &bindings_[*idx] : nullptr;
}

std::vector<std::string> TypeChecker::scope_names(const Scope& scope) const {
	std::vector<std::string> out;
	for(auto it = scope.begin(), e = scope.end(); it != e; ++it) out.push_back(symbol_names_[it.getKey()]);
	return out;
}

void TypeChecker::bind_input(const std::string& name, TypeId type){
	inputs_ = bind(inputs_, name, type, source_pos{}, true);
}

// ---- diagnostics ----

void TypeChecker::error_code(TypeCheckResult& r, source_pos pos, std::string code, std::string msg, std::string hint){
	ErrorReporter rep{&r.errors, &r.warnings};
	rep.emit_error(rep.make_error(std::move(code), std::move(msg), std::move(hint), pos.line, pos.col));
	r.success = false;
}

void TypeChecker::warn_code(TypeCheckResult& r, source_pos pos, std::string code, std::string msg, std::string hint){
	ErrorReporter rep{&r.errors, &r.warnings};
	rep.emit_warning(rep.make_warning(std::move(code), std::move(msg), std::move(hint), pos.line, pos.col));
}

void TypeChecker::type_mismatch(TypeCheckResult& r, source_pos pos, const std::string& code, const std::string& role, TypeId expected, TypeId actual){
	ErrorReporter rep{&r.errors, &r.warnings};
	std::string expStr = ctx_.to_string(expected);
	std::string actStr = ctx_.to_string(actual);
	auto err = rep.make_error(code, role + " type mismatch", "ensure " + role + " has type " + expStr, pos.line, pos.col);
	err.notes.push_back(TypeNote{"expected: " + expStr, pos.line, pos.col});
	err.notes.push_back(TypeNote{"   found: " + actStr, pos.line, pos.col});
	if(auto why = why_unsatisfied(ctx_, expected, actual)) err.notes.push_back(TypeNote{"  reason: " + *why, pos.line, pos.col});
	rep.emit_error(err);
	r.success = false;
}

void TypeChecker::trace(const term& t, TypeId ty) const {
	if(!cfg_.trace) return;
	auto* a = as_apply(t);
	std::string what = a ? dispatch_name(*a) + ":" : std::string("term");
	std::fprintf(stderr, "[rainbow][check] %d:%d %s -> %s\n", t.pos.line, t.pos.col, what.c_str(), ty ? ctx_.to_string(ty).c_str() : "<error>");
}

// Levenshtein distance over two rolling rows; identifiers are short.
int TypeChecker::edit_distance(const std::string& a, const std::string& b){
	std::vector<int> prev(b.size() + 1), cur(b.size() + 1);
	for(size_t j = 0; j <= b.size(); ++j) prev[j] = static_cast<int>(j);
	for(size_t i = 1; i <= a.size(); ++i){
		cur[0] = static_cast<int>(i);
		for(size_t j = 1; j <= b.size(); ++j){
			int subst = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
			cur[j] = std::min(subst, std::min(prev[j], cur[j - 1]) + 1);
		}
		std::swap(prev, cur);
	}
	return prev[b.size()];
}

std::vector<std::string> TypeChecker::fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist){
	std::vector<std::string> out;
	for(auto& c : pool){ if(c.empty() || c == target) continue; if(edit_distance(target, c) <= maxDist && std::find(out.begin(), out.end(), c) == out.end()) out.push_back(c); }
	std::sort(out.begin(), out.end());
	if(out.size() > 5) out.resize(5);
	return out;
}

void TypeChecker::append_suggestions(TypeError& err, const std::vector<std::string>& suggs) const {
	if(suggs.empty() || !cfg_.suggest) return;
	std::string msg = "did you mean ";
	for(size_t i = 0; i < suggs.size(); ++i){ msg += "`" + suggs[i] + "`"; if(i + 1 < suggs.size()) msg += i + 2 == suggs.size() ? " or " : ", "; }
	err.notes.push_back(TypeNote{msg, err.line, err.col});
}

// ---- entry points ----

TypeCheckResult TypeChecker::check(const script& s){
	TypeCheckResult r{true, {}, {}};
	depth_ = 0; depth_reported_ = false; result_type_ = 0;
	for(auto& t : s.terms) result_type_ = check_term(r, t, 0, inputs_);
	r.success = r.errors.empty();
	if(!r.success) result_type_ = 0;
	return r;
}

TypeCheckResult TypeChecker::check(const term_ptr& t){
	script s; s.terms.push_back(t);
	return check(s);
}

// ---- terms ----

TypeId TypeChecker::check_term(TypeCheckResult& r, const term_ptr& t, TypeId expected, const Scope& scope, bool guarded){
	if(!t) return 0;
	if(depth_ >= cfg_.max_depth){
		if(!depth_reported_){
			error_code(r, t->pos, codes::NestingTooDeep, "term nesting exceeds the maximum depth of " + std::to_string(cfg_.max_depth), "split the script into smaller pieces");
			depth_reported_ = true;
		}
		return 0;
	}
	depth_guard g(depth_);
	struct V {
		TypeChecker& self; TypeCheckResult& r; const term& t; TypeId expected; const Scope& scope; bool guarded;
		TypeId operator()(const string_term&){ return self.ctx_.get_string(); }
		TypeId operator()(const number_term&){ return self.ctx_.get_number(); }
		TypeId operator()(const bool_term&){ return self.ctx_.get_boolean(); }
		TypeId operator()(const variable_term& v){ return self.check_variable(r, t, v, scope); }
		TypeId operator()(const list_term& l){ return self.check_list(r, t, l, expected, scope); }
		TypeId operator()(const record_term& rec){ return self.check_record(r, t, rec, expected, scope); }
		TypeId operator()(const block_term& b){ return self.check_block(r, t, b, expected, scope, guarded); }
		TypeId operator()(const apply_term& a){
			TypeId ty = dispatch_name(a) == kTryKeyword ? self.check_try(r, t, a, expected, scope) : self.check_apply(r, t, a, scope, guarded);
			self.trace(t, ty);
			return ty;
		}
	};
	return std::visit(V{*this, r, *t, expected, scope, guarded}, t->data);
}

TypeId TypeChecker::check_variable(TypeCheckResult& r, const term& t, const variable_term& v, const Scope& scope){
	if(v.path.empty()){
		error_code(r, t.pos, codes::UnknownIdentifier, "variable without a name", "build variables with at least one path segment");
		return 0;
	}
	const std::string& head = v.path.front();
	Binding* b = lookup(scope, head);
	if(!b){
		ErrorReporter rep{&r.errors, &r.warnings};
		auto err = rep.make_error(codes::UnknownIdentifier, "unknown identifier `" + head + "`", "bind `" + head + "` as a block parameter or a script input", t.pos.line, t.pos.col);
		append_suggestions(err, fuzzy_candidates(head, scope_names(scope)));
		rep.emit_error(err); r.success = false;
		return 0;
	}
	b->used = true;
	TypeId cur = b->type;
	std::string path = head;
	for(size_t i = 1; i < v.path.size(); ++i){
		const std::string& seg = v.path[i];
		const Type& T = ctx_.at(cur);
		ErrorReporter rep{&r.errors, &r.warnings};
		if(T.kind != Type::Kind::Record){
			auto err = rep.make_error(codes::FieldMissing, "`" + path + "` has no field `" + seg + "`", "only records have fields", t.pos.line, t.pos.col);
			err.notes.push_back(TypeNote{"type of `" + path + "`: " + ctx_.to_string(cur), t.pos.line, t.pos.col});
			rep.emit_error(err); r.success = false;
			return 0;
		}
		const RecordField* f = T.field(seg);
		if(!f || f->optional){
			auto err = f ? rep.make_error(codes::FieldMissing, "field `" + seg + "` of `" + path + "` is optional", "optional fields cannot be read directly", t.pos.line, t.pos.col)
			             : rep.make_error(codes::FieldMissing, "`" + path + "` has no field `" + seg + "`", "", t.pos.line, t.pos.col);
			err.notes.push_back(TypeNote{"type of `" + path + "`: " + ctx_.to_string(cur), t.pos.line, t.pos.col});
			if(!f){
				std::vector<std::string> pool;
				for(auto& fld : T.fields) if(!fld.optional) pool.push_back(fld.name);
				append_suggestions(err, fuzzy_candidates(seg, pool));
			}
			rep.emit_error(err); r.success = false;
			return 0;
		}
		cur = f->type;
		path += "." + seg;
	}
	return cur;
}

TypeId TypeChecker::check_list(TypeCheckResult& r, const term& t, const list_term& l, TypeId expected, const Scope& scope){
	TypeId expected_elem = 0;
	if(ctx_.valid(expected) && ctx_.at(expected).kind == Type::Kind::List) expected_elem = ctx_.at(expected).elem;
	if(l.elems.empty()){
		if(expected_elem) return expected;
		error_code(r, t.pos, codes::EmptyListType, "cannot infer the element type of an empty list", "use the empty list where a list type is expected");
		return 0;
	}
	TypeId first = check_term(r, l.elems.front(), expected_elem, scope);
	bool ok = first != 0;
	for(size_t i = 1; i < l.elems.size(); ++i){
		TypeId ty = check_term(r, l.elems[i], expected_elem ? expected_elem : first, scope);
		if(!ty){ ok = false; continue; }
		if(first && !satisfies(ctx_, first, ty)){
			type_mismatch(r, l.elems[i]->pos, codes::ElementTypeMismatch, "list element " + std::to_string(i + 1), first, ty);
			ok = false;
		}
	}
	return ok ? ctx_.get_list(first) : 0;
}

TypeId TypeChecker::check_record(TypeCheckResult& r, const term&, const record_term& rec, TypeId expected, const Scope& scope){
	const Type* et = (ctx_.valid(expected) && ctx_.at(expected).kind == Type::Kind::Record) ? &ctx_.at(expected) : nullptr;
	std::vector<RecordField> fields;
	bool ok = true;
	for(auto& e : rec.entries){
		const RecordField* ef = et ? et->field(e.name) : nullptr;
		TypeId ty = check_term(r, e.value, ef ? ef->type : 0, scope);
		if(!ty){ ok = false; continue; }
		fields.push_back(RecordField{e.name, ty, false});
	}
	return ok ? ctx_.get_record(std::move(fields)) : 0;
}

TypeId TypeChecker::check_block(TypeCheckResult& r, const term& t, const block_term& b, TypeId expected, const Scope& scope, bool guard_body){
	const Type* et = ctx_.valid(expected) ? &ctx_.at(expected) : nullptr;
	std::vector<TypeId> inputs;
	TypeId expected_out = 0;
	if(et && et->kind == Type::Kind::Block){
		if(b.params.size() > et->inputs.size()){
			ErrorReporter rep{&r.errors, &r.warnings};
			auto err = rep.make_error(codes::BlockArityMismatch,
				"block declares " + std::to_string(b.params.size()) + " parameter(s) but only " + std::to_string(et->inputs.size()) + " input(s) are supplied here",
				"remove the extra parameters", t.pos.line, t.pos.col);
			err.notes.push_back(TypeNote{"expected: " + ctx_.to_string(expected), t.pos.line, t.pos.col});
			rep.emit_error(err); r.success = false;
			return 0;
		}
		inputs.assign(et->inputs.begin(), et->inputs.begin() + b.params.size());
		expected_out = et->output;
	} else if(!b.params.empty()){
		if(et){
			ErrorReporter rep{&r.errors, &r.warnings};
			auto err = rep.make_error(codes::Mismatch, "block with parameters where a value is expected", "pass a plain value instead of a block", t.pos.line, t.pos.col);
			err.notes.push_back(TypeNote{"expected: " + ctx_.to_string(expected), t.pos.line, t.pos.col});
			err.notes.push_back(TypeNote{"   found: a block taking " + std::to_string(b.params.size()) + " input(s)", t.pos.line, t.pos.col});
			rep.emit_error(err); r.success = false;
		} else {
			error_code(r, t.pos, codes::BlockArityMismatch, "cannot infer the parameter types of this block", "pass the block where a block type with inputs is expected");
		}
		return 0;
	} else if(!et){
		error_code(r, t.pos, codes::Mismatch, "block used as a value", "blocks are only accepted as call arguments and try:/or: arms");
		return 0;
	}

	Scope inner = scope;
	size_t first_binding = bindings_.size();
	for(size_t i = 0; i < b.params.size(); ++i) inner = bind(inner, b.params[i], inputs[i], t.pos, false);
	TypeId out = check_term(r, b.body, expected_out, inner, guard_body && b.body && is_apply(*b.body));
	for(size_t i = first_binding; i < first_binding + b.params.size(); ++i){
		const Binding& pb = bindings_[i];
		if(!pb.used && pb.name.rfind("_", 0) != 0)
			warn_code(r, t.pos, codes::UnusedBlockParam, "unused block parameter `" + pb.name + "`", "rename it to `_" + pb.name + "` to silence this warning");
	}
	if(!out) return 0;
	return ctx_.get_block(std::move(inputs), out);
}

std::vector<const ParamType*> TypeChecker::match_arguments(TypeCheckResult& r, const term& t, const apply_term& a, const Type& fn){
	std::vector<const ParamType*> out(a.args.size(), nullptr);
	std::vector<size_t> seen(fn.params.size(), 0);
	out[0] = &fn.params[0]; seen[0] = 1;
	size_t last = 0;
	auto variadic_run = [&](size_t lo, size_t hi){ for(size_t i = lo; i <= hi; ++i) if(!fn.params[i].variadic) return false; return true; };
	for(size_t k = 1; k < a.args.size(); ++k){
		const auto& kv = a.args[k];
		size_t j = 0;
		while(j < fn.params.size() && fn.params[j].name != kv.keyword) ++j;
		if(j == fn.params.size()){
			ErrorReporter rep{&r.errors, &r.warnings};
			auto err = rep.make_error(codes::ArityMismatch, "unexpected keyword `" + kv.keyword + ":` in call to `" + fn.name + "`", "`" + fn.name + "` accepts " + keyword_list(fn), kv.pos.line, kv.pos.col);
			std::vector<std::string> pool; for(auto& p : fn.params) pool.push_back(p.name);
			append_suggestions(err, fuzzy_candidates(kv.keyword, pool));
			rep.emit_error(err); r.success = false;
			continue;
		}
		const ParamType& p = fn.params[j];
		bool ok = j > last || (j == last && p.variadic) || (j < last && variadic_run(j, last));
		if(!ok){
			if(seen[j] && !p.variadic)
				error_code(r, kv.pos, codes::ArityMismatch, "keyword `" + kv.keyword + ":` is given more than once in call to `" + fn.name + "`", "remove the repeated argument");
			else
				error_code(r, kv.pos, codes::ArityMismatch, "keyword `" + kv.keyword + ":` is out of order in call to `" + fn.name + "`", "expected order: " + keyword_list(fn));
			continue;
		}
		++seen[j];
		last = std::max(last, j);
		out[k] = &p;
	}
	for(size_t j = 1; j < fn.params.size(); ++j){
		const ParamType& p = fn.params[j];
		if(!p.optional && !seen[j])
			error_code(r, t.pos, codes::ArityMismatch, "missing required keyword `" + p.name + ":` in call to `" + fn.name + "`", "add `" + p.name + ": <" + ctx_.to_string(p.type) + ">`");
	}
	return out;
}

TypeId TypeChecker::check_apply(TypeCheckResult& r, const term& t, const apply_term& a, const Scope& scope, bool guarded){
	const std::string& name = dispatch_name(a);
	const Type* fn = table_.lookup(name);
	if(!fn){
		ErrorReporter rep{&r.errors, &r.warnings};
		auto err = rep.make_error(codes::UnknownFunction, "unknown function `" + name + "`", "register `" + name + "` with the host before checking", t.pos.line, t.pos.col);
		auto pool = table_.names(); pool.push_back(kTryKeyword);
		append_suggestions(err, fuzzy_candidates(name, pool));
		rep.emit_error(err); r.success = false;
		for(size_t i = 1; i < a.args.size(); ++i) check_unmatched(r, a.args[i].value, scope);
		return 0;
	}
	if(fn->partial && !guarded)
		error_code(r, t.pos, codes::UnhandledPartiality, "call to partial function `" + name + "` is not guarded", "wrap the call: try: { " + name + ": ... } or: { <fallback> }");
	auto params = match_arguments(r, t, a, *fn);
	for(size_t i = 0; i < a.args.size(); ++i){
		const auto& kv = a.args[i];
		if(!params[i]){ check_unmatched(r, kv.value, scope); continue; }
		TypeId actual = check_term(r, kv.value, params[i]->type, scope);
		if(actual && !satisfies(ctx_, params[i]->type, actual))
			type_mismatch(r, kv.value->pos, codes::Mismatch, "argument `" + kv.keyword + ":` of `" + name + "`", params[i]->type, actual);
	}
	return fn->output;
}

// Arguments with no declared type still have their own errors; a zero-input
// block is checked through its body, a block with parameters is skipped.
void TypeChecker::check_unmatched(TypeCheckResult& r, const term_ptr& value, const Scope& scope){
	if(!value) return;
	if(const block_term* b = as_block(*value)){
		if(b->params.empty() && b->body) check_term(r, b->body, 0, scope);
		return;
	}
	check_term(r, value, 0, scope);
}

TypeId TypeChecker::check_arm(TypeCheckResult& r, const term_ptr& arm, TypeId expected, const Scope& scope, bool guarded){
	if(!arm) return 0;
	if(!is_block(*arm)) return check_term(r, arm, expected, scope, guarded && is_apply(*arm));
	const block_term* b = as_block(*arm);
	if(!ctx_.valid(expected) && b->params.empty()){
		// nothing to infer the block from; its value is the body's
		return check_term(r, b->body, 0, scope, guarded && b->body && is_apply(*b->body));
	}
	TypeId block_expected = ctx_.valid(expected) ? ctx_.get_block({}, expected) : 0;
	TypeId bt = check_term(r, arm, block_expected, scope, guarded);
	if(!bt) return 0;
	const Type& T = ctx_.at(bt);
	return T.kind == Type::Kind::Block ? T.output : 0;
}

bool TypeChecker::can_fail(const term_ptr& arm) const {
	term_ptr body = arm;
	if(body && is_block(*body)) body = as_block(*body)->body;
	if(!body) return false;
	const apply_term* a = as_apply(*body);
	if(!a) return false;
	const Type* fn = table_.lookup(dispatch_name(*a));
	return fn && fn->partial;
}

TypeId TypeChecker::check_try(TypeCheckResult& r, const term& t, const apply_term& a, TypeId expected, const Scope& scope){
	const keyword_arg& try_arg = a.args.front();
	const keyword_arg* or_arg = nullptr;
	for(size_t k = 1; k < a.args.size(); ++k){
		const auto& kv = a.args[k];
		if(k == 1 && kv.keyword == kOrKeyword){ or_arg = &kv; continue; }
		if(kv.keyword == kOrKeyword) error_code(r, kv.pos, codes::ArityMismatch, "keyword `or:` is given more than once in try:/or:", "remove the repeated argument");
		else error_code(r, kv.pos, codes::ArityMismatch, "unexpected keyword `" + kv.keyword + ":` in try:/or:", "write try: { <partial call> } or: { <fallback> }");
		check_unmatched(r, kv.value, scope);
	}
	if(!or_arg) error_code(r, t.pos, codes::ArityMismatch, "missing required keyword `or:` in try:/or:", "add `or: { <fallback> }`");

	TypeId tried = check_arm(r, try_arg.value, expected, scope, true);
	if(tried && !can_fail(try_arg.value))
		warn_code(r, t.pos, codes::TryCannotFail, "`try:` arm cannot fail", "only calls to partial functions need try:/or:");
	if(!or_arg) return tried;
	TypeId fallback = check_arm(r, or_arg->value, ctx_.valid(expected) ? expected : tried, scope, false);
	if(tried && fallback && !mutually_satisfy(ctx_, tried, fallback)){
		ErrorReporter rep{&r.errors, &r.warnings};
		source_pos p = or_arg->pos;
		auto err = rep.make_error(codes::BranchTypeDivergence, "`try:` and `or:` arms have different types", "make both arms produce the same type", p.line, p.col);
		err.notes.push_back(TypeNote{"try: " + ctx_.to_string(tried), try_arg.pos.line, try_arg.pos.col});
		err.notes.push_back(TypeNote{" or: " + ctx_.to_string(fallback), p.line, p.col});
		auto why = why_unsatisfied(ctx_, tried, fallback);
		if(!why) why = why_unsatisfied(ctx_, fallback, tried);
		if(why) err.notes.push_back(TypeNote{"reason: " + *why, p.line, p.col});
		rep.emit_error(err); r.success = false;
	}
	return tried;
}

} // namespace rainbow
