#include "sapio/diagnostics_json.hpp"
#include <sstream>
#include <cstdio>

namespace sapio {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string diagnostics_to_json(const std::vector<Reason>& reasons){
    std::ostringstream os;
    os<<"{\"success\":"<<(reasons.empty()?"true":"false")<<",\"errors\":[";
    for(size_t i=0;i<reasons.size(); ++i){
        const auto &r=reasons[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(error_code(r.kind))
            <<",\"kind\":"<<json_escape(to_string(r.kind))
            <<",\"branch\":"<<json_escape(r.branch)
            <<",\"message\":"<<json_escape(r.message)
            <<"}";
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const std::vector<Reason>& reasons, const CompileEnv& env){
    if(!env.diagJson) return;
    auto js=diagnostics_to_json(reasons);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace sapio
