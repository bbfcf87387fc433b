// EDN reader/printer tests
#include <cassert>
#include <iostream>
#include <string>
#include "sapio/edn.hpp"

using namespace sapio::edn;

static bool throws_parse_error(const char* src){
    try{ (void)parse(src); }catch(const parse_error&){ return true; }
    return false;
}

void run_edn_tests(){
    auto v = parse("[1 -2 +3 4.5 \"s\" :kw sym nil true false]");
    assert(to_string(v) == "[1 -2 3 4.5 \"s\" :kw sym nil true false]");
    auto* elems = get_if<vec>(v);
    assert(elems && elems->elems.size() == 10);
    assert(*get_if<int64_t>(elems->elems[1]) == -2);
    assert(is_nil(elems->elems[7]));

    // commas are whitespace, comments run to end of line
    auto m = parse("{:a 1, :b \"two\" ; trailing comment\n :c (x y)}");
    assert(*get_if<int64_t>(get(m, "a")) == 1);
    assert(*get_if<std::string>(get(m, "b")) == "two");
    assert(head(get(m, "c")) == "x");
    assert(get(m, "missing") == nullptr);
    assert(get(parse("[1 2]"), "a") == nullptr);

    // lone sign characters are symbols
    assert(get_if<symbol>(parse("-"))->name == "-");
    assert(get_if<symbol>(parse("-x"))->name == "-x");

    // positions
    auto nested = parse("(a\n  b)");
    auto* l = get_if<list>(nested);
    assert(l->elems[1]->pos.line == 2 && l->elems[1]->pos.col == 3);

    // escapes survive a print/parse cycle
    auto s = parse("\"a\\\"b\\nc\"");
    assert(*get_if<std::string>(s) == "a\"b\nc");
    assert(equal(parse(to_string(s)), s));

    // structural equality ignores positions; null equals nil
    assert(equal(parse("(f [1 2] {:k v})"), list_of({sym("f"), vec_of({i64(1), i64(2)}), map_of({{kw("k"), sym("v")}})})));
    assert(!equal(parse("[1 2]"), parse("(1 2)")));
    assert(!equal(parse("1"), parse("1.0")));
    assert(equal(nullptr, nil()));

    assert(throws_parse_error("(1 2"));
    assert(throws_parse_error("{:a}"));
    assert(throws_parse_error("1 2"));
    assert(throws_parse_error("#{1}"));
    assert(throws_parse_error("\"open"));
    assert(throws_parse_error(""));
    try{ (void)parse("[1\n  )"); assert(false); }
    catch(const parse_error& e){ assert(std::string(e.what()).find("line 2") != std::string::npos); }

    std::cout << "EDN tests passed\n";
}
