#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "rainbow/rainbow.hpp"
#include "rainbow/prelude.hpp"

using namespace rainbow;

static bool read_file(const std::string& path, std::string& out){ std::ifstream ifs(path); if(!ifs) return false; std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str(); return true; }

static std::string trim(const std::string& s){
    size_t b = s.find_first_not_of(" \t\r\n"); if(b==std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n"); return s.substr(b, e-b+1);
}

// One signature per line: `<signature> [| partial] [| effects=A,B]`; `#` starts a comment line.
static void load_signatures(SignatureTable& table, const std::string& text){
    std::istringstream in(text); std::string line; int lineno = 0;
    while(std::getline(in, line)){
        ++lineno;
        std::string l = trim(line);
        if(l.empty() || l[0]=='#') continue;
        std::vector<std::string> parts; size_t start = 0, bar;
        while((bar = l.find('|', start)) != std::string::npos){ parts.push_back(trim(l.substr(start, bar-start))); start = bar+1; }
        parts.push_back(trim(l.substr(start)));
        bool partial = false; std::vector<std::string> effects;
        for(size_t i=1;i<parts.size();++i){
            if(parts[i]=="partial") partial = true;
            else if(parts[i].rfind("effects=",0)==0){
                std::string list = parts[i].substr(8); size_t s = 0, c;
                while((c = list.find(',', s)) != std::string::npos){ if(!trim(list.substr(s, c-s)).empty()) effects.push_back(trim(list.substr(s, c-s))); s = c+1; }
                if(!trim(list.substr(s)).empty()) effects.push_back(trim(list.substr(s)));
            }
            else throw config_error("line " + std::to_string(lineno) + ": unknown annotation `" + parts[i] + "`");
        }
        table.register_signature(parts[0], partial, effects);
    }
}

static void print_diagnostics(const ScriptResult& r){
    for(auto &e : r.errors){
        std::cerr << "error"; if(!e.code.empty()) std::cerr << "["<<e.code<<"]"; std::cerr << ": " << e.message; if(e.line>=0) std::cerr << " (line "<<e.line<<":"<<e.col<<")"; std::cerr << "\n"; if(!e.hint.empty()) std::cerr << "  hint: " << e.hint << "\n"; for(auto &n : e.notes){ std::cerr << "  note: " << n.message; if(n.line>=0) std::cerr << " (line "<<n.line<<":"<<n.col<<")"; std::cerr << "\n"; } }
    for(auto &w : r.warnings){
        std::cerr << "warning"; if(!w.code.empty()) std::cerr << "["<<w.code<<"]"; std::cerr << ": " << w.message; if(w.line>=0) std::cerr << " (line "<<w.line<<":"<<w.col<<")"; std::cerr << "\n"; if(!w.hint.empty()) std::cerr << "  hint: " << w.hint << "\n"; for(auto &n : w.notes){ std::cerr << "  note: " << n.message; if(n.line>=0) std::cerr << " (line "<<n.line<<":"<<n.col<<")"; std::cerr << "\n"; } }
}

int main(int argc, char** argv){
    const char* usage = "usage: rainbow_check <script-file> [--signatures <file>] [--no-prelude] [--input name=type]... [--list]\n";
    std::string script_path, sig_path; bool prelude = true, list = false;
    CheckOptions opts;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--signatures" && i+1<argc) sig_path = argv[++i];
        else if(a=="--input" && i+1<argc){
            std::string kv = argv[++i]; auto eq = kv.find('=');
            if(eq==std::string::npos || eq==0){ std::cerr << "malformed --input `" << kv << "` (expected name=type)\n"; return 1; }
            opts.inputs.emplace_back(kv.substr(0, eq), kv.substr(eq+1));
        }
        else if(a=="--no-prelude") prelude = false;
        else if(a=="--list") list = true;
        else if(!a.empty() && a[0]=='-'){ std::cerr << usage; return 1; }
        else if(script_path.empty()) script_path = a;
        else { std::cerr << usage; return 1; }
    }
    if(script_path.empty()){ std::cerr << usage; return 1; }
    std::string src; if(!read_file(script_path, src)){ std::cerr << "failed to read file " << script_path << "\n"; return 1; }
    opts.filename = script_path;

    SignatureTable table;
    try {
        if(prelude) install_prelude(table);
        if(!sig_path.empty()){
            std::string sigs; if(!read_file(sig_path, sigs)){ std::cerr << "failed to read file " << sig_path << "\n"; return 1; }
            load_signatures(table, sigs);
        }
    } catch(const config_error& e){ std::cerr << "configuration error: " << e.what() << "\n"; return 1; }
    table.freeze();
    if(list){ for(auto &n : table.names()) std::cout << table.describe(n) << "\n"; }

    ScriptResult r;
    try { r = check_script(table, src, opts); }
    catch(const config_error& e){ std::cerr << "configuration error: " << e.what() << "\n"; return 1; }

    if(r.parse_error){
        const auto& p = *r.parse_error;
        std::cerr << "parse error: " << p.message << " (line " << p.line << ":" << p.col << ")\n";
        return 2;
    }
    if(!r.success){ std::cerr << "Type check failed:\n"; print_diagnostics(r); return 3; }
    if(!r.warnings.empty()) print_diagnostics(r);
    std::cout << "type: " << r.output_type << "\n";
    std::cout << "effects: " << to_string(r.effects) << "\n";
    return 0;
}
