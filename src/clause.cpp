#include "sapio/clause.hpp"

namespace sapio {

namespace {
edn::value_ptr form_of(const char* head, std::vector<edn::value_ptr> args) {
    args.insert(args.begin(), edn::sym(head));
    return edn::list_of(std::move(args));
}
const edn::value_ptr& trivial_form() {
    static const edn::value_ptr f = edn::sym("trivial");
    return f;
}
const edn::value_ptr& unsat_form() {
    static const edn::value_ptr f = edn::sym("unsatisfiable");
    return f;
}
} // namespace

Clause::Clause() : form_(trivial_form()) {}

Clause Clause::trivial() { return Clause(trivial_form()); }
Clause Clause::unsatisfiable() { return Clause(unsat_form()); }
Clause Clause::key(std::string hex) { return Clause(form_of("pk", {edn::str(std::move(hex))})); }
Clause Clause::after(uint32_t height) { return Clause(form_of("after", {edn::i64(height)})); }
Clause Clause::older(uint32_t blocks) { return Clause(form_of("older", {edn::i64(blocks)})); }
Clause Clause::sha256(std::string hex) { return Clause(form_of("sha256", {edn::str(std::move(hex))})); }

bool Clause::is_trivial() const {
    auto* s = edn::get_if<edn::symbol>(form_);
    return s && s->name == "trivial";
}

bool Clause::is_unsatisfiable() const {
    auto* s = edn::get_if<edn::symbol>(form_);
    return s && s->name == "unsatisfiable";
}

Clause Clause::all(const std::vector<Clause>& clauses) {
    std::vector<const Clause*> kept;
    for (auto& c : clauses) {
        if (c.is_unsatisfiable()) return unsatisfiable();
        if (!c.is_trivial()) kept.push_back(&c);
    }
    if (kept.empty()) return trivial();
    if (kept.size() == 1) return *kept.front();
    std::vector<edn::value_ptr> args;
    for (auto* c : kept) args.push_back(c->form_);
    return Clause(form_of("and", std::move(args)));
}

Clause Clause::any(const std::vector<Clause>& clauses) {
    std::vector<const Clause*> kept;
    for (auto& c : clauses) {
        if (c.is_trivial()) return trivial();
        if (!c.is_unsatisfiable()) kept.push_back(&c);
    }
    if (kept.empty()) return unsatisfiable();
    if (kept.size() == 1) return *kept.front();
    std::vector<edn::value_ptr> args;
    for (auto* c : kept) args.push_back(c->form_);
    return Clause(form_of("or", std::move(args)));
}

Clause Clause::threshold(size_t k, const std::vector<Clause>& clauses) {
    if (k == 0) return trivial();
    if (k > clauses.size()) return unsatisfiable();
    if (k == clauses.size()) return all(clauses);
    if (k == 1) return any(clauses);
    std::vector<edn::value_ptr> args{edn::i64((int64_t)k)};
    for (auto& c : clauses) args.push_back(c.form_);
    return Clause(form_of("thresh", std::move(args)));
}

} // namespace sapio
