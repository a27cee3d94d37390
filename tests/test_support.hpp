#pragma once
#include "rainbow/rainbow.hpp"
#include "rainbow/prelude.hpp"
#include <algorithm>
#include <memory>
#include <string>

namespace rainbow::test {

// Prelude plus a handful of host functions used across the suites.
inline std::unique_ptr<SignatureTable> make_table(){
    auto t = std::make_unique<SignatureTable>();
    install_prelude(*t);
    t->register_signature("divide: number by: number :: number", true);
    t->register_signature("fetch: string :: string", true, {"Network"});
    t->register_signature("parseNumbers: string :: [ number... ]", true);
    t->register_signature("log: string :: boolean", false, {"Log"});
    t->register_signature("save: [ id=number name=string ] :: boolean", true, {"Storage", "Log"});
    t->register_signature("if: boolean then: { string } else?: { string } :: string");
    t->register_signature("max: [ number... ] or: number :: number");
    t->register_signature("show: number :: string");
    t->register_signature("each: [ number... ] do: { number => string } :: [ string... ]");
    t->register_signature("concat: string [and]: string [then]?: string suffix?: string :: string");
    t->freeze();
    return t;
}

inline bool has_code(const ScriptResult& r, const std::string& code){
    return std::any_of(r.errors.begin(), r.errors.end(), [&](const TypeError& e){ return e.code == code; });
}

inline bool has_warning(const ScriptResult& r, const std::string& code){
    return std::any_of(r.warnings.begin(), r.warnings.end(), [&](const TypeWarning& w){ return w.code == code; });
}

inline bool has_note(const TypeError& e, const std::string& fragment){
    return std::any_of(e.notes.begin(), e.notes.end(), [&](const TypeNote& n){ return n.message.find(fragment) != std::string::npos; });
}

} // namespace rainbow::test
