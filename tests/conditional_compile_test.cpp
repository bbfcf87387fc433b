// Inclusion verdict merge algebra
#include <cassert>
#include <iostream>
#include <vector>
#include "sapio/conditional_compile.hpp"

using namespace sapio;
using CCT = ConditionalCompileType;

static std::vector<CCT> non_fail(){
    return {CCT::no_constraint(), CCT::skippable(), CCT::nullable(), CCT::required(), CCT::never()};
}

static bool is_conflict(const CCT& v){
    return v.is(CCT::Kind::Fail) && v.reasons() == std::vector<std::string>{"Never and Required incompatible"};
}

void run_conditional_compile_tests(){
    // identity
    for(auto& x : non_fail()) assert(merge(CCT::no_constraint(), x) == x && merge(x, CCT::no_constraint()) == x);
    assert(merge(CCT::no_constraint(), CCT::fail("f")) == CCT::fail("f"));

    // commutative over non-Fail pairs
    for(auto& a : non_fail()) for(auto& b : non_fail()) assert(merge(a, b) == merge(b, a));

    // idempotent tiers
    for(auto& x : {CCT::never(), CCT::required(), CCT::skippable(), CCT::nullable()}) assert(merge(x, x) == x);

    // Never / Required conflict in both argument orders
    assert(is_conflict(merge(CCT::required(), CCT::never())));
    assert(is_conflict(merge(CCT::never(), CCT::required())));

    // dominance
    assert(merge(CCT::never(), CCT::skippable()) == CCT::never());
    assert(merge(CCT::nullable(), CCT::never()) == CCT::never());
    assert(merge(CCT::required(), CCT::skippable()) == CCT::required());
    assert(merge(CCT::nullable(), CCT::required()) == CCT::required());
    assert(merge(CCT::skippable(), CCT::nullable()) == CCT::skippable());
    assert(merge(CCT::nullable(), CCT::skippable()) == CCT::skippable());

    // Fail concatenates in argument order and wins unchanged otherwise
    auto ab = merge(CCT::fail("a"), CCT::fail("b"));
    assert(ab.reasons() == (std::vector<std::string>{"a", "b"}));
    auto ba = merge(CCT::fail("b"), CCT::fail("a"));
    assert(ba.reasons() == (std::vector<std::string>{"b", "a"}));
    for(auto& x : non_fail()){
        assert(merge(CCT::fail("v"), x) == CCT::fail("v"));
        assert(merge(x, CCT::fail("v")) == CCT::fail("v"));
    }

    // fold is left to right from NoConstraint
    assert(fold({}) == CCT::no_constraint());
    assert(fold({CCT::nullable(), CCT::skippable()}) == CCT::skippable());
    auto folded = fold({CCT::fail("x incompatible"), CCT::required(), CCT::never(), CCT::fail("y")});
    assert(folded.reasons() == (std::vector<std::string>{"x incompatible", "y"}));
    auto conflict = fold({CCT::required(), CCT::never(), CCT::fail("later")});
    assert(conflict.reasons() == (std::vector<std::string>{"Never and Required incompatible", "later"}));

    assert(std::string(to_string(CCT::Kind::Nullable)) == "Nullable");
    assert(to_string(CCT::fail(std::vector<std::string>{"a", "b"})) == "Fail[\"a\", \"b\"]");
    assert(to_string(CCT::required()) == "Required");

    std::cout << "Conditional compile tests passed\n";
}
