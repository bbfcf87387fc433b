#include "sapio/context.hpp"
#include <cstdlib>
#include <string>
#include <algorithm>
#include <cctype>

namespace sapio {

// Reads process env vars and constructs a CompileEnv.
// Note: Context::set_env / apply_env store it for the compiler to consult.
CompileEnv detect_env(){
    CompileEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };
    auto flag = [&](const char* k){ const char* v = get(k); return v && (v[0]=='1'||v[0]=='t'||v[0]=='T'||v[0]=='y'||v[0]=='Y'); };

    e.trace = flag("SAPIO_TRACE");
    e.diagJson = flag("SAPIO_DIAG_JSON");
    e.failFast = flag("SAPIO_FAIL_FAST");
    e.skipSkippable = flag("SAPIO_SKIP_SKIPPABLE");

    if (const char* v = get("SAPIO_NETWORK")) {
        e.network = v;
        std::transform(e.network.begin(), e.network.end(), e.network.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    }
    return e;
}

void apply_env(Context& ctx, const CompileEnv& env){
    if(!env.network.empty()){
        // unknown names leave the network untouched
        if(auto n = parse_network(env.network)) ctx.set_network(*n);
    }
    ctx.set_env(env);
}

} // namespace sapio
