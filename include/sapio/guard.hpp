// guard.hpp - guards (clause producers) and conditional-compile-if rules for branches
#pragma once
#include "sapio/clause.hpp"
#include "sapio/conditional_compile.hpp"
#include "sapio/context.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sapio {

enum class GuardPolicy {
    Cache, // evaluated once per contract instance per compile pass, result reused
    Fresh  // evaluated every time it is consulted
};

// A Guard produces a Clause that must be satisfied before a branch's templates may
// execute. Cache guards exist to bound remote effects (e.g. an oracle lookup) to one
// per instance; the function must not depend on anything but its arguments.
// Copies of a Guard share one identity; two guards built separately never do,
// whatever their names. A guard built with an empty function is a compiled-out
// slot and contributes no clause.
template <class Self>
class Guard {
public:
    using Fn = std::function<Clause(const Self&, const Context&)>;

    static Guard cache(std::string name, Fn fn) { return Guard(GuardPolicy::Cache, std::move(name), std::move(fn)); }
    static Guard fresh(std::string name, Fn fn) { return Guard(GuardPolicy::Fresh, std::move(name), std::move(fn)); }

    GuardPolicy policy() const { return policy_; }
    const std::string& name() const { return name_; }
    const void* id() const { return fn_.get(); }
    bool enabled() const { return static_cast<bool>(*fn_); }
    Clause operator()(const Self& self, const Context& ctx) const { return (*fn_)(self, ctx); }

private:
    Guard(GuardPolicy p, std::string name, Fn fn)
        : policy_(p), name_(std::move(name)), fn_(std::make_shared<const Fn>(std::move(fn))) {}
    GuardPolicy policy_;
    std::string name_;
    std::shared_ptr<const Fn> fn_;
};

template <class Self>
using GuardList = std::vector<Guard<Self>>;

// Computes the inclusion verdict of a branch. Re-evaluated on every consultation;
// kept apart from the production function so tools can inspect inclusion without
// producing templates. An empty function is a compiled-out rule and is skipped.
template <class Self>
class ConditionallyCompileIf {
public:
    using Fn = std::function<ConditionalCompileType(const Self&, const Context&)>;

    static ConditionallyCompileIf fresh(std::string name, Fn fn) { return ConditionallyCompileIf(std::move(name), std::move(fn)); }

    const std::string& name() const { return name_; }
    bool enabled() const { return static_cast<bool>(fn_); }
    ConditionalCompileType operator()(const Self& self, const Context& ctx) const { return fn_(self, ctx); }

private:
    ConditionallyCompileIf(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}
    std::string name_;
    Fn fn_;
};

template <class Self>
using ConditionallyCompileIfList = std::vector<ConditionallyCompileIf<Self>>;

// Memo of Cache guard results keyed by (contract instance, Guard::id()). An instance
// is known only by its address, so the memo must not outlive the pass that filled
// it; Session clears it before each pass. Not safe for concurrent use.
class GuardCache {
public:
    const Clause* find(const void* instance, const void* guard) const;
    const Clause& insert(const void* instance, const void* guard, Clause clause);

    template <class F>
    const Clause& get_or_compute(const void* instance, const void* guard, F&& compute) {
        if (const Clause* hit = find(instance, guard)) { ++hits_; return *hit; }
        ++misses_;
        return insert(instance, guard, compute());
    }

    size_t size() const { return memo_.size(); }
    size_t hits() const { return hits_; }
    size_t misses() const { return misses_; }
    void clear();

private:
    std::map<std::pair<const void*, const void*>, Clause> memo_;
    size_t hits_ = 0;
    size_t misses_ = 0;
};

// Evaluate a guard list in declared order, skipping compiled-out slots. The
// returned clauses are implicitly ANDed into the branch's unlocking condition.
template <class Self>
std::vector<Clause> evaluate_guards(const GuardList<Self>& guards, const Self& self, const Context& ctx, GuardCache& cache) {
    std::vector<Clause> out;
    out.reserve(guards.size());
    for (auto& g : guards) {
        if (!g.enabled()) continue;
        if (g.policy() == GuardPolicy::Cache)
            out.push_back(cache.get_or_compute(&self, g.id(), [&] { return g(self, ctx); }));
        else
            out.push_back(g(self, ctx));
    }
    return out;
}

// Fold a branch's conditional-compile-if list into one verdict, in declared order.
template <class Self>
ConditionalCompileType evaluate_conditions(const ConditionallyCompileIfList<Self>& rules, const Self& self, const Context& ctx) {
    ConditionalCompileType verdict;
    for (auto& rule : rules)
        if (rule.enabled()) verdict = merge(std::move(verdict), rule(self, ctx));
    return verdict;
}

} // namespace sapio
