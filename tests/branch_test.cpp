#include <gtest/gtest.h>
#include <string>
#include "sapio/args.hpp"
#include "sapio/contract.hpp"

using namespace sapio;

namespace {

Template labelled(std::string label){
    Template t;
    t.label = std::move(label);
    return t;
}

std::vector<Reason> reasons_of(llvm::Error err){
    return take_reasons(std::move(err), ErrorKind::ProductionFailure, {});
}

struct Sale { Amount price = 0; };
struct Shop { std::string owner; };

llvm::Expected<Sale> coerce_sale(const edn::value_ptr& args){
    auto price = arg_amount(args, "price");
    if(!price) return price.takeError();
    return Sale{*price};
}

FinishOrFunc<Shop, edn::value_ptr, Sale> sell(SchemaPtr schema = nullptr){
    return FinishOrFunc<Shop, edn::value_ptr, Sale>(
        "sell", {}, {}, coerce_sale,
        [](const Shop&, const Context& ctx, Sale s) -> llvm::Expected<TxTmplIt> {
            auto t = ctx.template_builder().add_output(s.price, edn::str("buyer")).build();
            if(!t) return t.takeError();
            return TxTmplIt::single(std::move(*t));
        },
        std::move(schema));
}

} // namespace

TEST(TxTmplIt, EmptyIsExhausted){
    TxTmplIt it;
    EXPECT_TRUE(it.exhausted());
    auto n = it.next();
    ASSERT_TRUE(static_cast<bool>(n));
    EXPECT_FALSE(n->has_value());
}

TEST(TxTmplIt, FromVectorYieldsInOrder){
    auto it = TxTmplIt::from({labelled("a"), labelled("b")});
    auto all = it.collect();
    ASSERT_TRUE(static_cast<bool>(all));
    ASSERT_EQ(all->size(), 2u);
    EXPECT_EQ((*all)[0].label, "a");
    EXPECT_EQ((*all)[1].label, "b");
    EXPECT_TRUE(it.exhausted());
    auto again = it.collect();
    ASSERT_TRUE(static_cast<bool>(again));
    EXPECT_TRUE(again->empty());
}

TEST(TxTmplIt, GeneratorIsLazyAndStopsAtFirstFailure){
    int produced = 0;
    TxTmplIt it([&]() -> llvm::Expected<std::optional<Template>> {
        ++produced;
        if(produced == 2) return compilation_error(ErrorKind::ProductionFailure, "second item broke");
        if(produced > 3) return std::nullopt;
        return labelled("t" + std::to_string(produced));
    });
    EXPECT_EQ(produced, 0);
    auto first = it.next();
    ASSERT_TRUE(static_cast<bool>(first));
    EXPECT_EQ((*first)->label, "t1");
    EXPECT_EQ(produced, 1);
    auto rest = it.collect();
    ASSERT_FALSE(static_cast<bool>(rest));
    auto rs = reasons_of(rest.takeError());
    EXPECT_EQ(rs[0].message, "second item broke");
    // not restartable after a failure
    EXPECT_TRUE(it.exhausted());
    auto after = it.next();
    ASSERT_TRUE(static_cast<bool>(after));
    EXPECT_FALSE(after->has_value());
    EXPECT_EQ(produced, 2);
}

TEST(FinishOrFunc, CoercesThenProduces){
    Shop shop{"02aa"};
    Context ctx(Network::Regtest, 500);
    auto f = sell();
    auto it = f.call(shop, ctx, edn::parse("{:price 300}"));
    ASSERT_TRUE(static_cast<bool>(it));
    auto ts = it->collect();
    ASSERT_TRUE(static_cast<bool>(ts));
    ASSERT_EQ(ts->size(), 1u);
    EXPECT_EQ((*ts)[0].total_amount(), 300);
}

TEST(FinishOrFunc, CoercionFailureNamesBranch){
    Shop shop{"02aa"};
    Context ctx(Network::Regtest, 500);
    auto f = sell();
    auto it = f.call(shop, ctx, edn::parse("{:price \"cheap\"}"));
    ASSERT_FALSE(static_cast<bool>(it));
    auto rs = reasons_of(it.takeError());
    ASSERT_EQ(rs.size(), 1u);
    EXPECT_EQ(rs[0].kind, ErrorKind::ArgumentCoercionFailure);
    EXPECT_EQ(rs[0].branch, "sell");
    EXPECT_NE(rs[0].message.find(":price"), std::string::npos);
}

TEST(FinishOrFunc, ForeignCoercionErrorsBecomeCoercionFailures){
    FinishOrFunc<Shop, edn::value_ptr, int> f(
        "odd", {}, {},
        [](const edn::value_ptr&) -> llvm::Expected<int> { return llvm::createStringError(llvm::inconvertibleErrorCode(), "nope"); },
        [](const Shop&, const Context&, int) -> llvm::Expected<TxTmplIt> { return TxTmplIt(); });
    auto it = f.call(Shop{}, Context(Network::Regtest, 0), edn::nil());
    ASSERT_FALSE(static_cast<bool>(it));
    auto rs = reasons_of(it.takeError());
    EXPECT_EQ(rs[0].kind, ErrorKind::ArgumentCoercionFailure);
    EXPECT_EQ(rs[0].message, "nope");
    EXPECT_TRUE(f.get_schema() == nullptr);
}

TEST(ContractDecl, HeterogeneousContinuationsDispatchUniformly){
    ContractDecl<Shop> decl("shop");
    decl.finish_or(sell(parse_schema("(struct :name Sale :fields [(field :name price :type amount)])")))
        .finish_or(std::make_unique<FinishOrFunc<Shop, edn::value_ptr, bool>>(
            "close", GuardList<Shop>{}, ConditionallyCompileIfList<Shop>{},
            [](const edn::value_ptr& a) { return arg_bool(a, "now"); },
            [](const Shop&, const Context&, bool) -> llvm::Expected<TxTmplIt> { return TxTmplIt(); }));
    ASSERT_EQ(decl.finish_or_fns().size(), 2u);
    EXPECT_EQ(decl.finish_or_fns()[1]->get_name(), "close");
    ASSERT_TRUE(decl.find_continuation("sell") != nullptr);
    EXPECT_TRUE(decl.find_continuation("buy") == nullptr);
    EXPECT_EQ(edn::to_string(decl.api()),
              "{\"sell\" (struct :name Sale :fields [(field :name price :type amount)]) \"close\" nil}");
}
