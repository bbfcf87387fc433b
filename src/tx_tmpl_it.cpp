#include "sapio/branch.hpp"

namespace sapio {

TxTmplIt TxTmplIt::from(std::vector<Template> templates) {
    auto state = std::make_shared<std::pair<std::vector<Template>, size_t>>(std::move(templates), 0);
    return TxTmplIt([state]() -> llvm::Expected<std::optional<Template>> {
        if (state->second >= state->first.size()) return std::nullopt;
        return std::move(state->first[state->second++]);
    });
}

TxTmplIt TxTmplIt::single(Template t) {
    std::vector<Template> one;
    one.push_back(std::move(t));
    return from(std::move(one));
}

llvm::Expected<std::optional<Template>> TxTmplIt::next() {
    if (exhausted()) return std::nullopt;
    auto item = next_();
    if (!item || !*item) done_ = true;
    return item;
}

llvm::Expected<std::vector<Template>> TxTmplIt::collect() {
    std::vector<Template> out;
    for (;;) {
        auto item = next();
        if (!item) return item.takeError();
        if (!*item) break;
        out.push_back(std::move(**item));
    }
    return out;
}

} // namespace sapio
