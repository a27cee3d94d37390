#include "rainbow/types.hpp"
#include <algorithm>

namespace rainbow {

const char* primitive_name(PrimitiveKind k){
	switch(k){
		case PrimitiveKind::Number: return "number";
		case PrimitiveKind::String: return "string";
		case PrimitiveKind::Boolean: return "boolean";
		case PrimitiveKind::Time: return "time";
	}
	return "<bad-primitive>";
}

TypeContext::TypeContext(){
	// seed primitives (order matters only for stable ids across runs)
	get_primitive(PrimitiveKind::Number);
	get_primitive(PrimitiveKind::String);
	get_primitive(PrimitiveKind::Boolean);
	get_primitive(PrimitiveKind::Time);
}

TypeContext::TypeContext(const TypeContext* parent): parent_(parent){
	if(parent_){ base_ = parent_->end(); end_ = base_; }
	else { get_primitive(PrimitiveKind::Number); get_primitive(PrimitiveKind::String); get_primitive(PrimitiveKind::Boolean); get_primitive(PrimitiveKind::Time); }
}

TypeId TypeContext::add_type(Type t){
	types_.push_back(std::move(t));
	return end_++;
}

const Type& TypeContext::at(TypeId id) const {
	if(id >= base_ && id < end_) return types_[id - base_];
	if(parent_ && id != 0 && id < base_) return parent_->at(id);
	throw std::out_of_range("invalid TypeId " + std::to_string(id));
}

std::optional<TypeId> TypeContext::find_primitive(int key) const {
	if(parent_) if(auto id = parent_->find_primitive(key)) return id;
	auto it = prim_cache_.find(key); if(it == prim_cache_.end()) return std::nullopt; return it->second;
}
std::optional<TypeId> TypeContext::find_list(TypeId elem) const {
	if(parent_) if(auto id = parent_->find_list(elem)) return id;
	auto it = list_cache_.find(elem); if(it == list_cache_.end()) return std::nullopt; return it->second;
}
std::optional<TypeId> TypeContext::find_record(const RecordKey& key) const {
	if(parent_) if(auto id = parent_->find_record(key)) return id;
	auto it = record_cache_.find(key); if(it == record_cache_.end()) return std::nullopt; return it->second;
}
std::optional<TypeId> TypeContext::find_block(const BlockKey& key) const {
	if(parent_) if(auto id = parent_->find_block(key)) return id;
	auto it = block_cache_.find(key); if(it == block_cache_.end()) return std::nullopt; return it->second;
}

TypeId TypeContext::get_primitive(PrimitiveKind k){
	int key = static_cast<int>(k);
	if(auto id = find_primitive(key)) return *id;
	Type t{}; t.kind = Type::Kind::Primitive; t.prim = k;
	TypeId id = add_type(std::move(t));
	prim_cache_[key] = id;
	return id;
}

TypeId TypeContext::get_list(TypeId elem){
	if(auto id = find_list(elem)) return *id;
	Type t{}; t.kind = Type::Kind::List; t.elem = elem;
	TypeId id = add_type(std::move(t));
	list_cache_[elem] = id;
	return id;
}

TypeId TypeContext::get_record(std::vector<RecordField> fields){
	std::sort(fields.begin(), fields.end(), [](const RecordField& a, const RecordField& b){ return a.name < b.name; });
	for(size_t i = 1; i < fields.size(); ++i)
		if(fields[i].name == fields[i-1].name) throw std::invalid_argument("duplicate record field `" + fields[i].name + "`");
	RecordKey key; key.reserve(fields.size());
	for(auto& f : fields) key.emplace_back(f.name, f.type, f.optional);
	if(auto id = find_record(key)) return *id;
	Type t{}; t.kind = Type::Kind::Record; t.fields = std::move(fields);
	TypeId id = add_type(std::move(t));
	record_cache_[key] = id;
	return id;
}

TypeId TypeContext::get_block(std::vector<TypeId> inputs, TypeId output){
	BlockKey key{inputs, output};
	if(auto id = find_block(key)) return *id;
	Type t{}; t.kind = Type::Kind::Block; t.inputs = std::move(inputs); t.output = output;
	TypeId id = add_type(std::move(t));
	block_cache_[key] = id;
	return id;
}

TypeId TypeContext::add_function(std::string name, std::vector<ParamType> params, TypeId output, bool partial, std::vector<std::string> effects){
	std::sort(effects.begin(), effects.end());
	effects.erase(std::unique(effects.begin(), effects.end()), effects.end());
	Type t{}; t.kind = Type::Kind::Function; t.name = std::move(name); t.params = std::move(params);
	t.output = output; t.partial = partial; t.effects = std::move(effects);
	return add_type(std::move(t));
}

std::string TypeContext::to_string(TypeId id) const {
	if(!valid(id)) return "<unknown>";
	const Type& t = at(id);
	switch(t.kind){
		case Type::Kind::Primitive:
			return primitive_name(t.prim);
		case Type::Kind::List:
			return "[ " + to_string(t.elem) + "... ]";
		case Type::Kind::Record: {
			if(t.fields.empty()) return "[=]";
			// required fields first, then optional, each group by name
			std::vector<const RecordField*> order;
			for(auto& f : t.fields) if(!f.optional) order.push_back(&f);
			for(auto& f : t.fields) if(f.optional) order.push_back(&f);
			std::string s = "[";
			for(auto* f : order){ s += ' ' + f->name; if(f->optional) s += '?'; s += '=' + to_string(f->type); }
			return s + " ]";
		}
		case Type::Kind::Block: {
			std::string s = "{ ";
			if(!t.inputs.empty()){ for(auto in : t.inputs) s += to_string(in) + ' '; s += "=> "; }
			return s + to_string(t.output) + " }";
		}
		case Type::Kind::Function: {
			std::string s;
			for(size_t i = 0; i < t.params.size(); ++i){
				const auto& p = t.params[i];
				if(i) s += ' ';
				if(p.variadic) s += '[' + p.name + ']'; else s += p.name;
				if(p.optional) s += '?';
				s += ": " + to_string(p.type);
			}
			return s + " :: " + to_string(t.output);
		}
	}
	return "<bad-type>";
}

std::optional<std::string> why_unsatisfied(const TypeContext& ctx, TypeId left, TypeId right){
	const Type& L = ctx.at(left);
	const Type& R = ctx.at(right);
	if(L.kind == Type::Kind::Function || R.kind == Type::Kind::Function) return std::optional<std::string>("functions are not values");
	if(left == right) return std::nullopt;
	auto incompatible = [&]{ return std::optional<std::string>("expected " + ctx.to_string(left) + ", found " + ctx.to_string(right)); };
	if(L.kind != R.kind) return incompatible();
	switch(L.kind){
		case Type::Kind::Primitive:
			if(L.prim != R.prim) return incompatible();
			return std::nullopt;
		case Type::Kind::List:
			if(auto why = why_unsatisfied(ctx, L.elem, R.elem)) return "in list element: " + *why;
			return std::nullopt;
		case Type::Kind::Record:
			for(auto& f : L.fields){
				if(f.optional) continue;
				const RecordField* rf = R.field(f.name);
				if(!rf) return "field `" + f.name + "` is missing";
				if(rf->optional) return "field `" + f.name + "` is optional";
				if(auto why = why_unsatisfied(ctx, f.type, rf->type)) return "in field `" + f.name + "`: " + *why;
			}
			return std::nullopt;
		case Type::Kind::Block:
			if(R.inputs.size() > L.inputs.size())
				return "block takes " + std::to_string(R.inputs.size()) + " input(s), at most " + std::to_string(L.inputs.size()) + " allowed";
			for(size_t i = 0; i < R.inputs.size(); ++i)
				if(auto why = why_unsatisfied(ctx, L.inputs[i], R.inputs[i])) return "in block input " + std::to_string(i + 1) + ": " + *why;
			if(auto why = why_unsatisfied(ctx, L.output, R.output)) return "in block output: " + *why;
			return std::nullopt;
		case Type::Kind::Function:
			break;
	}
	return incompatible();
}

bool satisfies(const TypeContext& ctx, TypeId left, TypeId right){
	return !why_unsatisfied(ctx, left, right).has_value();
}

} // namespace rainbow
