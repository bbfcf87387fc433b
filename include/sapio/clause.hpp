// clause.hpp - unlocking policy conditions produced by guards
#pragma once
#include "sapio/edn.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sapio {

// A Clause is an immutable policy form, e.g. (and (pk "02..") (after 800000)).
// Copies share the underlying form, so a cached clause handed out twice is the
// same object both times.
class Clause {
public:
    Clause(); // trivial
    static Clause trivial();
    static Clause unsatisfiable();
    static Clause key(std::string hex);
    static Clause after(uint32_t height);
    static Clause older(uint32_t blocks);
    static Clause sha256(std::string hex);
    // Conjunction: trivial members are dropped, an unsatisfiable member absorbs the
    // rest, a single member is returned as is.
    static Clause all(const std::vector<Clause>& clauses);
    // Disjunction, the dual of all().
    static Clause any(const std::vector<Clause>& clauses);
    static Clause threshold(size_t k, const std::vector<Clause>& clauses);

    const edn::value_ptr& form() const { return form_; }
    std::string to_string() const { return edn::to_string(form_); }
    bool is_trivial() const;
    bool is_unsatisfiable() const;

    // Identity, not structure.
    static bool same(const Clause& a, const Clause& b) { return a.form_ == b.form_; }

    friend bool operator==(const Clause& a, const Clause& b) { return edn::equal(a.form_, b.form_); }
    friend bool operator!=(const Clause& a, const Clause& b) { return !(a == b); }

private:
    explicit Clause(edn::value_ptr form) : form_(std::move(form)) {}
    edn::value_ptr form_;
};

} // namespace sapio
