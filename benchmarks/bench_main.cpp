#include "rainbow/rainbow.hpp"
#include "rainbow/prelude.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_check; size_t source_bytes; size_t errors; };

static RunResult bench_case(const char* name, const rainbow::SignatureTable& table, const std::string &script, const rainbow::CheckOptions& opts){
    auto t0 = Clock::now();
    auto r = rainbow::check_script(table, script, opts);
    auto t1 = Clock::now();
    if(r.parse_error){
        std::cerr << "[bench] case '" << name << "' failed to parse: " << r.parse_error->message << "\n";
        return {0.0, script.size(), 0};
    }
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    return { ms, script.size(), r.errors.size() };
}

int main(){
    rainbow::SignatureTable table;
    rainbow::install_prelude(table);
    table.register_signature("fetch: string :: string", true, {"Network"});
    table.register_signature("each: [ number... ] do: { number => string } :: [ string... ]");
    table.freeze();

    rainbow::CheckOptions opts;
    opts.max_depth = 4096;
    opts.trace = false;
    opts.inputs = {{"url", "string"}};

    struct Case { const char* name; std::string script; };
    std::vector<Case> cases;

    // Case 1: many independent guarded calls
    {
        std::string s = "[";
        for(int i = 0; i < 2000; ++i) s += " c" + std::to_string(i) + "=try: { fetch: url } or: { \"\" }";
        cases.push_back({"wide_calls", s + " ]"});
    }

    // Case 2: wide record literal
    {
        std::string s = "[";
        for(int i = 0; i < 2000; ++i) s += " f" + std::to_string(i) + "=upperCase: \"" + std::to_string(i) + "\"";
        cases.push_back({"wide_record", s + " ]"});
    }

    // Case 3: deeply nested calls
    {
        std::string s = "1";
        for(int i = 0; i < 1000; ++i) s = "sum: [ " + s + " ]";
        cases.push_back({"deep_calls", s});
    }

    // Case 4: block parameters in a chain
    {
        std::string s = "each: { countFrom: 1 to: 1000 } do: { _n => upperCase: \"x\" }";
        cases.push_back({"block_params", s});
    }

    std::cout << "name,ms_check,source_bytes,errors\n";
    for(const auto &c : cases){
        auto r = bench_case(c.name, table, c.script, opts);
        std::cout << c.name << "," << r.ms_check << "," << r.source_bytes << "," << r.errors << "\n";
    }
    return 0;
}
