// Policy clause tests
#include <cassert>
#include <iostream>
#include "sapio/clause.hpp"

using namespace sapio;

void run_clause_tests(){
    auto k = Clause::key("02aa");
    auto t = Clause::after(100);
    assert(k.to_string() == "(pk \"02aa\")");
    assert(Clause::older(6).to_string() == "(older 6)");
    assert(Clause::sha256("ff").to_string() == "(sha256 \"ff\")");

    assert(Clause().is_trivial());
    assert(Clause::all({}).is_trivial());
    assert(Clause::any({}).is_unsatisfiable());
    assert(Clause::same(Clause::all({k}), k));
    assert(Clause::all({k, Clause::trivial(), t}).to_string() == "(and (pk \"02aa\") (after 100))");
    assert(Clause::all({k, Clause::unsatisfiable()}).is_unsatisfiable());
    assert(Clause::any({k, t}).to_string() == "(or (pk \"02aa\") (after 100))");
    assert(Clause::any({k, Clause::trivial()}).is_trivial());

    auto b = Clause::key("02bb");
    assert(Clause::threshold(0, {k, b, t}).is_trivial());
    assert(Clause::threshold(4, {k, b, t}).is_unsatisfiable());
    assert(Clause::threshold(3, {k, b, t}) == Clause::all({k, b, t}));
    assert(Clause::threshold(1, {k, b}) == Clause::any({k, b}));
    assert(Clause::threshold(2, {k, b, t}).to_string() == "(thresh 2 (pk \"02aa\") (pk \"02bb\") (after 100))");

    // structural equality vs identity
    auto k2 = Clause::key("02aa");
    assert(k == k2);
    assert(!Clause::same(k, k2));
    auto copy = k;
    assert(Clause::same(copy, k));
    assert(k != b);

    std::cout << "Clause tests passed\n";
}
