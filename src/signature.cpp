#include "rainbow/signature.hpp"

namespace rainbow {

// ---- FunctionBuilder ----

FunctionBuilder::FunctionBuilder(SignatureTable& table, std::string name, TypeId type): table_(table){
	params_.push_back(ParamType{std::move(name), type, false, false});
}
FunctionBuilder& FunctionBuilder::required(std::string name, TypeId type){ params_.push_back(ParamType{std::move(name), type, false, false}); return *this; }
FunctionBuilder& FunctionBuilder::optional(std::string name, TypeId type){ params_.push_back(ParamType{std::move(name), type, false, true}); return *this; }
FunctionBuilder& FunctionBuilder::variadic(std::string name, TypeId type){ params_.push_back(ParamType{std::move(name), type, true, true}); return *this; }
FunctionBuilder& FunctionBuilder::required_variadic(std::string name, TypeId type){ params_.push_back(ParamType{std::move(name), type, true, false}); return *this; }
FunctionBuilder& FunctionBuilder::returns(TypeId type){ output_ = type; return *this; }
FunctionBuilder& FunctionBuilder::partial(bool is_partial){ partial_ = is_partial; return *this; }
FunctionBuilder& FunctionBuilder::effect(std::string tag){ effects_.push_back(std::move(tag)); return *this; }

TypeId FunctionBuilder::build(){
	const std::string& name = params_.front().name;
	TypeId fn = table_.types().add_function(name, params_, output_, partial_, effects_);
	table_.register_function(name, fn);
	return fn;
}

// ---- SignatureTable ----

void SignatureTable::check_mutable(const char* what) const {
	if(frozen_) throw config_error(std::string("signature table is frozen: cannot ") + what);
}

TypeContext& SignatureTable::types(){
	check_mutable("create types");
	return ctx_;
}

void SignatureTable::register_function(const std::string& name, TypeId fn){
	check_mutable(("register `" + name + "`").c_str());
	if(name == kTryKeyword) throw config_error("`try` is reserved for the built-in try/or construct");
	if(!ctx_.valid(fn) || ctx_.at(fn).kind != Type::Kind::Function)
		throw config_error("register `" + name + "`: not a function type");
	const Type& t = ctx_.at(fn);
	if(t.params.empty() || t.params.front().name != name)
		throw config_error("register `" + name + "`: first keyword of the signature must be `" + name + "`");
	if(t.params.front().variadic || t.params.front().optional)
		throw config_error("register `" + name + "`: dispatch keyword cannot be optional or variadic");
	auto is_value_type = [&](TypeId ty){ return ctx_.valid(ty) && ctx_.at(ty).kind != Type::Kind::Function; };
	if(!is_value_type(t.output)) throw config_error("register `" + name + "`: return type must be defined");
	for(size_t i = 0; i < t.params.size(); ++i){
		if(!is_value_type(t.params[i].type)) throw config_error("register `" + name + "`: keyword `" + t.params[i].name + "` has no valid type");
		for(size_t j = 0; j < i; ++j)
			if(t.params[i].name == t.params[j].name) throw config_error("register `" + name + "`: duplicate keyword `" + t.params[i].name + "`");
	}
	if(functions_.count(name)) throw config_error("function `" + name + "` is already registered");
	functions_.emplace(name, fn);
}

TypeId SignatureTable::register_signature(std::string_view text, bool partial, std::vector<std::string> effects){
	check_mutable("register signatures");
	SignatureText sig = parse_signature(ctx_, text);
	std::string name = sig.params.front().name;
	TypeId fn = ctx_.add_function(name, std::move(sig.params), sig.output, partial, std::move(effects));
	register_function(name, fn);
	return fn;
}

const Type* SignatureTable::lookup(std::string_view name) const {
	auto it = functions_.find(name);
	return it == functions_.end() ? nullptr : &ctx_.at(it->second);
}

TypeId SignatureTable::lookup_id(std::string_view name) const {
	auto it = functions_.find(name);
	return it == functions_.end() ? 0 : it->second;
}

std::vector<std::string> SignatureTable::names() const {
	std::vector<std::string> out; out.reserve(functions_.size());
	for(auto& kv : functions_) out.push_back(kv.first);
	return out;
}

std::string SignatureTable::describe(std::string_view name) const {
	TypeId fn = lookup_id(name);
	if(!fn) return {};
	const Type& t = ctx_.at(fn);
	std::string s = ctx_.to_string(fn);
	if(t.partial) s += " (partial)";
	if(!t.effects.empty()){
		s += " effects={";
		for(size_t i = 0; i < t.effects.size(); ++i){ if(i) s += ','; s += t.effects[i]; }
		s += '}';
	}
	return s;
}

} // namespace rainbow
