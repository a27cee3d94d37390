#include "rainbow/diagnostics_json.hpp"
#include <cstdio>
#include <ostream>
#include <sstream>
#include <string_view>

namespace rainbow {

namespace {

void write_json_string(std::ostream& os, std::string_view s){
    os<<'"';
    for(char c: s){
        if(c=='"' || c=='\\'){ os<<'\\'<<c; continue; }
        if(c=='\n'){ os<<"\\n"; continue; }
        if(c=='\t'){ os<<"\\t"; continue; }
        if(static_cast<unsigned char>(c) < 0x20){
            char buf[8]; std::snprintf(buf,sizeof(buf),"\\u%04X", static_cast<unsigned>(static_cast<unsigned char>(c)));
            os<<buf;
            continue;
        }
        os<<c;
    }
    os<<'"';
}

// "line":L,"col":C shared by notes, diagnostics and parse errors
void write_position(std::ostream& os, int line, int col){
    os<<"\"line\":"<<line<<",\"col\":"<<col;
}

void append_notes_json(std::ostream& os, const std::vector<TypeNote>& notes){
    os<<"[";
    const char* sep="";
    for(const auto& n : notes){
        os<<sep<<"{\"message\":"; write_json_string(os,n.message);
        os<<","; write_position(os,n.line,n.col); os<<"}";
        sep=",";
    }
    os<<"]";
}

} // namespace

std::string json_escape(const std::string& s){
    std::ostringstream o;
    write_json_string(o,s);
    return o.str();
}

namespace {

template<typename Diag>
void append_diags_json(std::ostringstream& os, const std::vector<Diag>& diags){
    os<<"[";
    for(size_t i=0;i<diags.size(); ++i){
        const auto &d=diags[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(d.code)
            <<",\"message\":"<<json_escape(d.message)
            <<",\"hint\":"<<json_escape(d.hint)<<",";
        write_position(os,d.line,d.col);
        os<<",\"notes\":";
        append_notes_json(os,d.notes);
        os<<"}";
    }
    os<<"]";
}

} // namespace

std::string diagnostics_to_json(const TypeCheckResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"errors\":";
    append_diags_json(os,r.errors);
    os<<",\"warnings\":";
    append_diags_json(os,r.warnings);
    os<<"}";
    return os.str();
}

std::string diagnostics_to_json(const ScriptResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false");
    if(r.parse_error){
        const auto &p=*r.parse_error;
        os<<",\"parse_error\":{\"message\":"<<json_escape(p.message)
          <<",\"expected\":"<<json_escape(p.expected)<<",";
        write_position(os,p.line,p.col);
        os<<",\"offset\":"<<p.offset
          <<"}";
    }
    if(r.success){
        os<<",\"type\":"<<json_escape(r.output_type)<<",\"effects\":[";
        bool first=true;
        for(auto &e : r.effects){ if(!first) os<<","; first=false; os<<json_escape(e); }
        os<<"]";
    }
    os<<",\"errors\":";
    append_diags_json(os,r.errors);
    os<<",\"warnings\":";
    append_diags_json(os,r.warnings);
    os<<"}";
    return os.str();
}

void maybe_print_json(const ScriptResult& r){
    if(detect_env().diag_json){
        auto js=diagnostics_to_json(r);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace rainbow
