// Structural equality for EDN values.
#include "sapio/edn.hpp"

namespace sapio::edn {

static bool equal_seq(const std::vector<value_ptr>& a, const std::vector<value_ptr>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i)
        if (!equal(a[i], b[i])) return false;
    return true;
}

bool equal(const value_ptr& a, const value_ptr& b) {
    if (a.get() == b.get()) return true;
    if (is_nil(a) || is_nil(b)) return is_nil(a) && is_nil(b);
    if (a->data.index() != b->data.index()) return false;

    struct Visitor {
        const value& b;
        bool operator()(std::monostate) const { return true; }
        bool operator()(bool x) const { return x == std::get<bool>(b.data); }
        bool operator()(int64_t x) const { return x == std::get<int64_t>(b.data); }
        bool operator()(double x) const { return x == std::get<double>(b.data); }
        bool operator()(const std::string& x) const { return x == std::get<std::string>(b.data); }
        bool operator()(const keyword& x) const { return x.name == std::get<keyword>(b.data).name; }
        bool operator()(const symbol& x) const { return x.name == std::get<symbol>(b.data).name; }
        bool operator()(const list& x) const { return equal_seq(x.elems, std::get<list>(b.data).elems); }
        bool operator()(const vec& x) const { return equal_seq(x.elems, std::get<vec>(b.data).elems); }
        // Maps compare entry-wise in order; printed maps keep insertion order.
        bool operator()(const map& x) const {
            auto& y = std::get<map>(b.data);
            if (x.entries.size() != y.entries.size()) return false;
            for (size_t i = 0; i < x.entries.size(); ++i) {
                if (!equal(x.entries[i].first, y.entries[i].first)) return false;
                if (!equal(x.entries[i].second, y.entries[i].second)) return false;
            }
            return true;
        }
    };
    return std::visit(Visitor{*b}, a->data);
}

} // namespace sapio::edn
