// Environment flag detection
#include <cassert>
#include <iostream>
#include "sapio/context.hpp"
#include "test_env.hpp"

using namespace sapio;

static void clear_env(){
    _putenv("SAPIO_TRACE=");
    _putenv("SAPIO_DIAG_JSON=");
    _putenv("SAPIO_FAIL_FAST=");
    _putenv("SAPIO_SKIP_SKIPPABLE=");
    _putenv("SAPIO_NETWORK=");
}

void run_env_tests(){
    clear_env();
    auto e = detect_env();
    assert(!e.trace && !e.diagJson && !e.failFast && !e.skipSkippable && e.network.empty());

    _putenv("SAPIO_TRACE=1");
    _putenv("SAPIO_DIAG_JSON=yes");
    _putenv("SAPIO_FAIL_FAST=0");
    _putenv("SAPIO_SKIP_SKIPPABLE=T");
    _putenv("SAPIO_NETWORK=Signet");
    e = detect_env();
    assert(e.trace && e.diagJson && !e.failFast && e.skipSkippable);
    assert(e.network == "signet");

    Context ctx(Network::Regtest, 0);
    apply_env(ctx, e);
    assert(ctx.network() == Network::Signet);
    assert(ctx.env().skipSkippable);
    // derived contexts carry the env
    assert(ctx.derive("c").env().trace);

    // unknown network names leave the context alone
    _putenv("SAPIO_NETWORK=moonnet");
    Context other(Network::Testnet, 0);
    apply_env(other, detect_env());
    assert(other.network() == Network::Testnet);

    assert(parse_network("mainnet") == Network::Bitcoin);
    assert(!parse_network("nope"));
    assert(std::string(to_string(Network::Regtest)) == "regtest");

    clear_env();
    std::cout << "Env tests passed\n";
}
