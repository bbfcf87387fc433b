// Escrow example: declare the contract in code, compile two instances, then call
// the cooperative-close continuation with caller arguments.
#include <iostream>
#include <string>
#include "escrow.hpp"

using namespace sapio;

static void print_result(const char* title, llvm::Expected<Compiled> r){
    std::cout << "== " << title << "\n";
    if(!r){
        auto reasons = take_reasons(r.takeError(), ErrorKind::ProductionFailure, {});
        std::cout << format_reasons(reasons);
        return;
    }
    std::cout << edn::to_string(r->to_edn()) << "\n";
    std::cout << "policy: " << r->policy().to_string() << "\n";
}

int main(){
    Context ctx(Network::Regtest, 100000);
    ctx.set_clock(800000, 1700000000);
    apply_env(ctx, detect_env());

    escrow::Escrow open{"02aa", "02bb", "02cc", 100000, 800144, true};
    escrow::Escrow closed = open;
    closed.allow_arbitration = false;

    const auto& decl = escrow::escrow_contract();
    std::cout << "api: " << edn::to_string(decl.api()) << "\n";

    Session session;
    auto args = edn::parse("{:to-seller 60000 :to-buyer 40000}");
    print_result("arbitration allowed", session.compile(decl, open, ctx, args));
    print_result("arbitration disabled", session.compile(decl, closed, ctx, args));
    print_result("cooperative-close", session.call_continuation(decl, open, ctx, "cooperative-close", args));

    auto greedy = edn::parse("{:to-seller 90000 :to-buyer 40000}");
    print_result("cooperative-close overspend", session.call_continuation(decl, open, ctx, "cooperative-close", greedy));

    std::cout << "guard cache: " << session.cache().size() << " entries, " << session.cache().hits() << " hits\n";
    return 0;
}
