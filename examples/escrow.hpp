// escrow.hpp - a two-party escrow with timeout refund, optional arbitration and a
// cooperative close that takes caller arguments.
#pragma once
#include "sapio/args.hpp"
#include "sapio/compiler.hpp"
#include "sapio/contract.hpp"
#include "sapio/schema.hpp"
#include <string>

namespace escrow {

using namespace sapio;

struct Escrow {
    std::string buyer;   // key hex
    std::string seller;  // key hex
    std::string arbiter; // key hex
    Amount amount = 0;
    uint32_t timeout = 0; // absolute height after which the buyer may reclaim
    bool allow_arbitration = true;
};

struct CloseArgs {
    Amount to_seller = 0;
    Amount to_buyer = 0;
};

inline llvm::Expected<Escrow> escrow_from_edn(const edn::value_ptr& form) {
    Escrow e;
    auto buyer = arg_string(form, "buyer");
    if (!buyer) return buyer.takeError();
    auto seller = arg_string(form, "seller");
    if (!seller) return seller.takeError();
    auto arbiter = arg_string(form, "arbiter");
    if (!arbiter) return arbiter.takeError();
    auto amount = arg_amount(form, "amount");
    if (!amount) return amount.takeError();
    auto timeout = arg_u32(form, "timeout");
    if (!timeout) return timeout.takeError();
    e.buyer = *buyer;
    e.seller = *seller;
    e.arbiter = *arbiter;
    e.amount = *amount;
    e.timeout = *timeout;
    if (arg_optional(form, "allow-arbitration")) {
        auto allow = arg_bool(form, "allow-arbitration");
        if (!allow) return allow.takeError();
        e.allow_arbitration = *allow;
    }
    return e;
}

inline llvm::Expected<CloseArgs> coerce_close(const edn::value_ptr& args) {
    auto to_seller = arg_amount(args, "to-seller");
    if (!to_seller) return to_seller.takeError();
    auto to_buyer = arg_amount(args, "to-buyer");
    if (!to_buyer) return to_buyer.takeError();
    return CloseArgs{*to_seller, *to_buyer};
}

inline SchemaPtr close_schema() {
    static const SchemaPtr s = parse_schema(
        "(struct :name CloseArgs :doc \"split agreed by both parties\""
        " :fields [(field :name to-seller :type amount)"
        "          (field :name to-buyer :type amount)])");
    return s;
}

inline llvm::Expected<TxTmplIt> pay_to(const Context& ctx, const std::string& key, Amount amount, uint32_t lock_time,
                                       const char* label) {
    auto tmpl = ctx.template_builder()
                    .add_output(amount, Clause::key(key).form())
                    .set_lock_time(lock_time)
                    .set_label(ctx.path_string() + "#" + label)
                    .build();
    if (!tmpl) return tmpl.takeError();
    return TxTmplIt::single(std::move(*tmpl));
}

inline const ContractDecl<Escrow>& escrow_contract() {
    static const ContractDecl<Escrow> decl = [] {
        ContractDecl<Escrow> d("escrow");
        d.then({"refund-after-timeout",
                {Guard<Escrow>::cache("timeout", [](const Escrow& e, const Context&) { return Clause::after(e.timeout); })},
                {},
                [](const Escrow& e, const Context& ctx) { return pay_to(ctx, e.buyer, e.amount, e.timeout, "refund"); }});
        d.then({"arbitrate",
                {Guard<Escrow>::fresh("arbiter", [](const Escrow& e, const Context&) { return Clause::key(e.arbiter); })},
                {ConditionallyCompileIf<Escrow>::fresh("arbitration-allowed",
                                                       [](const Escrow& e, const Context&) {
                                                           return e.allow_arbitration ? ConditionalCompileType::nullable()
                                                                                      : ConditionalCompileType::never();
                                                       })},
                [](const Escrow& e, const Context& ctx) -> llvm::Expected<TxTmplIt> {
                    std::vector<Template> out;
                    for (auto& [key, label] : {std::make_pair(e.seller, "to-seller"), std::make_pair(e.buyer, "to-buyer")}) {
                        auto t = ctx.template_builder()
                                     .add_output(e.amount, Clause::key(key).form())
                                     .set_label(ctx.path_string() + "#" + label)
                                     .build();
                        if (!t) return t.takeError();
                        out.push_back(std::move(*t));
                    }
                    return TxTmplIt::from(std::move(out));
                }});
        d.finish_or(FinishOrFunc<Escrow, edn::value_ptr, CloseArgs>(
            "cooperative-close",
            {Guard<Escrow>::fresh("buyer", [](const Escrow& e, const Context&) { return Clause::key(e.buyer); }),
             Guard<Escrow>::fresh("seller", [](const Escrow& e, const Context&) { return Clause::key(e.seller); })},
            {ConditionallyCompileIf<Escrow>::fresh("cooperative",
                                                   [](const Escrow&, const Context&) { return ConditionalCompileType::skippable(); })},
            coerce_close,
            [](const Escrow& e, const Context& ctx, CloseArgs a) -> llvm::Expected<TxTmplIt> {
                TemplateBuilder b = ctx.template_builder();
                if (a.to_seller) b.add_output(a.to_seller, Clause::key(e.seller).form());
                if (a.to_buyer) b.add_output(a.to_buyer, Clause::key(e.buyer).form());
                auto t = b.build();
                if (!t) return t.takeError();
                return TxTmplIt::single(std::move(*t));
            },
            close_schema()));
        d.finish({"both-sign",
                  {Guard<Escrow>::cache("buyer", [](const Escrow& e, const Context&) { return Clause::key(e.buyer); }),
                   Guard<Escrow>::cache("seller", [](const Escrow& e, const Context&) { return Clause::key(e.seller); })},
                  {}});
        return d;
    }();
    return decl;
}

} // namespace escrow
