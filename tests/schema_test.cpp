// Argument schema parsing and printing
#include <cassert>
#include <iostream>
#include <string>
#include "sapio/schema.hpp"

using namespace sapio;

static bool throws_schema_error(const char* src){
    try{ (void)parse_schema(src); }catch(const schema_error&){ return true; }
    return false;
}

void run_schema_tests(){
    auto amt = parse_schema("amount");
    assert(amt->kind == Schema::Kind::Base && amt->base == BaseType::Amount);
    assert(schema_to_string(*amt) == "amount");

    auto opt = parse_schema("(optional (vector hex))");
    assert(opt->kind == Schema::Kind::Optional);
    assert(opt->inner->kind == Schema::Kind::Vector && opt->inner->inner->base == BaseType::Hex);

    auto st = parse_schema("(struct :name Sale :doc \"sell it\" :fields [(field :name price :type amount :doc \"sats\") (field :name to :type hex)])");
    assert(st->kind == Schema::Kind::Struct && st->name == "Sale" && st->doc == "sell it");
    assert(st->fields.size() == 2);
    assert(st->field("price")->doc == "sats");
    assert(st->field("to")->type->base == BaseType::Hex);
    assert(st->field("nope") == nullptr);
    assert(schema_to_string(*st) ==
           "(struct :name Sale :doc \"sell it\" :fields [(field :name price :type amount :doc \"sats\") (field :name to :type hex)])");

    auto en = parse_schema("(enum :name Action :variants [(variant :name hold) (variant :name sell :type (struct :name Price :fields [(field :name sats :type u64)]))])");
    assert(en->kind == Schema::Kind::Enum && en->variants.size() == 2);
    assert(en->variant("hold")->type == nullptr);
    assert(en->variant("sell")->type->field("sats")->type->base == BaseType::U64);
    // printing is stable through a reparse
    assert(schema_to_string(*parse_schema(schema_to_string(*en))) == schema_to_string(*en));

    assert(throws_schema_error("float"));
    assert(throws_schema_error("(optional)"));
    assert(throws_schema_error("(vector i64 i64)"));
    assert(throws_schema_error("(struct :fields [])"));
    assert(throws_schema_error("(struct :name S :fields [(field :name a)])"));
    assert(throws_schema_error("(struct :name S :fields [(field :name a :type i64) (field :name a :type bool)])"));
    assert(throws_schema_error("(struct :name S :color red)"));
    assert(throws_schema_error("(struct :name S :fields)"));
    assert(throws_schema_error("(enum :name E :variants [])"));
    assert(throws_schema_error("(tuple i64)"));
    assert(throws_schema_error("(i64"));
    assert(throws_schema_error("42"));

    std::cout << "Schema tests passed\n";
}
