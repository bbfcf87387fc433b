#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include "sapio/edn.hpp"
#include "sapio/args.hpp"
#include "sapio/compiler.hpp"
#include "sapio/diagnostics_json.hpp"
#include "escrow.hpp"

using namespace sapio;

static std::string read_file(const std::string& path){ std::ifstream ifs(path); std::stringstream ss; ss<<ifs.rdbuf(); return ss.str(); }

static int usage(){
    std::cerr << "usage: sapio_driver <instance.edn> [--args <args.edn>] [--continuation NAME] [--api]\n";
    return 1;
}

int main(int argc, char** argv){
    if(argc<2) return usage();
    std::string file, args_file, continuation; bool api = false;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--args" && i+1<argc) args_file = argv[++i];
        else if(a=="--continuation" && i+1<argc) continuation = argv[++i];
        else if(a=="--api") api = true;
        else if(!a.empty() && a[0]=='-') return usage();
        else if(file.empty()) file = a;
        else return usage();
    }
    if(file.empty()) return usage();
    const auto& decl = escrow::escrow_contract();
    if(api){ std::cout << edn::to_string(decl.api()) << "\n"; return 0; }

    std::string src = read_file(file); if(src.empty()){ std::cerr << "failed to read file\n"; return 1; }
    edn::value_ptr instance, args = edn::map_of({});
    try {
        instance = edn::parse(src);
        if(!args_file.empty()){
            std::string asrc = read_file(args_file); if(asrc.empty()){ std::cerr << "failed to read args file\n"; return 1; }
            args = edn::parse(asrc);
        }
    } catch(const edn::parse_error& e){ std::cerr << "error: " << e.what() << "\n"; return 1; }

    CompileEnv env = detect_env();
    // compile failures already printed their JSON inside the session
    auto report=[&](llvm::Error err, bool json){
        auto reasons = take_reasons(std::move(err), ErrorKind::ArgumentCoercionFailure, {});
        if(json) maybe_print_json(reasons, env);
        std::cerr << "Compilation failed:\n" << format_reasons(reasons);
        return 2;
    };

    auto self = escrow::escrow_from_edn(instance);
    if(!self) return report(self.takeError(), true);
    // :funds defaults to the escrowed amount, :network to regtest
    Amount funds = self->amount;
    if(auto f = edn::get_if<int64_t>(edn::get(instance, "funds"))) funds = *f;
    Network net = Network::Regtest;
    if(auto n = edn::get_if<std::string>(edn::get(instance, "network"))){
        auto parsed = parse_network(*n);
        if(!parsed){ std::cerr << "error: unknown network " << *n << "\n"; return 1; }
        net = *parsed;
    }
    Context ctx(net, funds);
    if(arg_optional(instance, "height")){
        auto h = arg_u32(instance, "height");
        if(!h) return report(h.takeError(), true);
        ctx.set_clock(*h, 0);
    }
    apply_env(ctx, env);

    Session session;
    auto result = continuation.empty() ? session.compile(decl, *self, ctx, args)
                                       : session.call_continuation(decl, *self, ctx, continuation, args);
    if(!result) return report(result.takeError(), false);
    std::cout << edn::to_string(result->to_edn()) << "\n";
    if(env.trace){
        auto& st = session.stats();
        llvm::errs() << "[sapio][driver] included=" << st.included << " pruned=" << st.pruned << " excluded=" << st.excluded << "\n";
    }
    return 0;
}
