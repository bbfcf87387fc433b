#include "sapio/context.hpp"
#include "sapio/template.hpp"

namespace sapio {

const char* to_string(Network n) {
    switch (n) {
    case Network::Bitcoin: return "bitcoin";
    case Network::Testnet: return "testnet";
    case Network::Signet: return "signet";
    case Network::Regtest: return "regtest";
    }
    return "<bad-network>";
}

std::optional<Network> parse_network(std::string_view name) {
    if (name == "bitcoin" || name == "mainnet") return Network::Bitcoin;
    if (name == "testnet") return Network::Testnet;
    if (name == "signet") return Network::Signet;
    if (name == "regtest") return Network::Regtest;
    return std::nullopt;
}

Context::Context(Network network, Amount funds) : network_(network), funds_(funds) {}

std::string Context::path_string() const {
    std::string out;
    for (auto& seg : path_) out += "/" + seg;
    return out.empty() ? "/" : out;
}

Context& Context::set_clock(uint32_t height, int64_t time) {
    height_ = height;
    time_ = time;
    return *this;
}

Context Context::derive(std::string_view name) const {
    Context child = *this;
    child.path_.emplace_back(name);
    return child;
}

Context Context::with_funds(Amount funds) const {
    Context out = *this;
    out.funds_ = funds;
    return out;
}

TemplateBuilder Context::template_builder() const { return TemplateBuilder(*this); }

} // namespace sapio
