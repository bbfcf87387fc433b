#include "sapio/template.hpp"
#include "sapio/error.hpp"
#include <limits>

#include <llvm/Support/MathExtras.h>

namespace sapio {

// Saturates at the Amount range instead of wrapping.
Amount Template::total_amount() const {
    Amount total = 0;
    for (auto& o : outputs) {
        Amount sum;
        if (llvm::AddOverflow(total, o.amount, sum))
            return o.amount < 0 ? std::numeric_limits<Amount>::min() : std::numeric_limits<Amount>::max();
        total = sum;
    }
    return total;
}

edn::value_ptr Template::to_edn() const {
    std::vector<edn::value_ptr> outs;
    for (auto& o : outputs) {
        std::vector<std::pair<edn::value_ptr, edn::value_ptr>> kv{
            {edn::kw("amount"), edn::i64(o.amount)},
            {edn::kw("to"), o.destination ? o.destination : edn::nil()}};
        if (o.metadata) kv.emplace_back(edn::kw("metadata"), o.metadata);
        outs.push_back(edn::map_of(std::move(kv)));
    }
    std::vector<std::pair<edn::value_ptr, edn::value_ptr>> kv{
        {edn::kw("label"), edn::str(label)},
        {edn::kw("lock-time"), edn::i64(lock_time)},
        {edn::kw("sequence"), edn::i64(sequence)},
        {edn::kw("outputs"), edn::vec_of(std::move(outs))}};
    if (metadata) kv.emplace_back(edn::kw("metadata"), metadata);
    return edn::map_of(std::move(kv));
}

TemplateBuilder::TemplateBuilder(const Context& ctx) : funds_(ctx.funds()), path_(ctx.path_string()) {
    tmpl_.label = path_;
}

TemplateBuilder& TemplateBuilder::add_output(Amount amount, edn::value_ptr destination, edn::value_ptr metadata) {
    tmpl_.outputs.push_back(Output{amount, std::move(destination), std::move(metadata)});
    return *this;
}

llvm::Expected<Template> TemplateBuilder::build() const {
    // each output is checked against what is left before it is counted
    Amount left = funds_;
    for (auto& o : tmpl_.outputs) {
        if (o.amount < 0)
            return compilation_error(ErrorKind::OutOfFunds, "negative output amount " + std::to_string(o.amount) + " in " + path_);
        if (o.amount > left)
            return compilation_error(ErrorKind::OutOfFunds, "outputs spend more than the " + std::to_string(funds_) + " sats available at " + path_);
        left -= o.amount;
    }
    return tmpl_;
}

} // namespace sapio
