// compiler.hpp - resolve a contract instance's branches into (clause, template) pairs
#pragma once
#include "sapio/branch.hpp"
#include "sapio/clause.hpp"
#include "sapio/conditional_compile.hpp"
#include "sapio/context.hpp"
#include "sapio/contract.hpp"
#include "sapio/error.hpp"
#include "sapio/guard.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <llvm/Support/Error.h>

namespace sapio {

enum class BranchKind { Then, FinishOr, Finish };

const char* to_string(BranchKind k);

struct CompiledBranch {
    std::string name;
    BranchKind kind;
    ConditionalCompileType::Kind verdict;
    std::vector<Clause> guards; // declared order
    Clause clause;              // conjunction of guards
    std::vector<Template> templates;

    // Then templates are the only allowed continuations; finish-or templates are
    // suggestions.
    bool committed() const { return kind == BranchKind::Then; }
};

struct Compiled {
    std::string contract;
    std::vector<CompiledBranch> branches; // included branches, declaration order

    const CompiledBranch* find(std::string_view name) const;
    std::vector<std::pair<Clause, Template>> pairs() const;
    size_t template_count() const;
    // Disjunction of the included branch clauses.
    Clause policy() const;
    edn::value_ptr to_edn() const;
};

struct SessionStats {
    size_t included = 0;
    size_t pruned = 0;   // empty or recovered failure under a lenient verdict
    size_t excluded = 0; // Never, or Skippable with SAPIO_SKIP_SKIPPABLE
    size_t failed = 0;   // contributed a fatal reason
};

namespace detail {

// Bookkeeping for one resolution pass. Decides what each branch becomes and
// collects fatal reasons in declaration order.
class Resolution {
public:
    Resolution(std::string contract, const CompileEnv& env, SessionStats& stats);

    // Step 1: act on the folded verdict. Returns false when the branch must not be
    // evaluated further (Fail, Never, skipped Skippable).
    bool admit(const std::string& branch, const ConditionalCompileType& verdict);

    // Step 4: settle a produced branch.
    void settle(const std::string& branch, BranchKind kind, ConditionalCompileType::Kind verdict, std::vector<Clause> guards,
                llvm::Expected<std::vector<Template>> produced);

    // Finish branches have no production step.
    void include_finish(const std::string& branch, ConditionalCompileType::Kind verdict, std::vector<Clause> guards);

    // True once a fatal reason was recorded under SAPIO_FAIL_FAST.
    bool halted() const { return env_.failFast && !fatal_.empty(); }

    llvm::Expected<Compiled> finish();

private:
    void fatal(std::vector<Reason> reasons);
    void trace(const std::string& branch, const char* what, const std::string& detail = {}) const;
    void include(std::string branch, BranchKind kind, ConditionalCompileType::Kind verdict, std::vector<Clause> guards,
                 std::vector<Template> templates);

    Compiled out_;
    const CompileEnv& env_;
    SessionStats& stats_;
    std::vector<Reason> fatal_;
};

llvm::Expected<std::vector<Template>> drain(llvm::Expected<TxTmplIt> produced);

} // namespace detail

// One compilation session. Owns the Cache guard memo, which is reset at the start
// of every compile()/call_continuation() pass and inspectable after it. Not safe
// to share between threads.
class Session {
public:
    GuardCache& cache() { return cache_; }
    const GuardCache& cache() const { return cache_; }
    const SessionStats& stats() const { return stats_; }

    template <class Self, class StatefulArgs>
    llvm::Expected<Compiled> compile(const ContractDecl<Self, StatefulArgs>& decl, const Self& self, const Context& ctx,
                                     const StatefulArgs& args) {
        cache_.clear();
        detail::Resolution res(decl.name(), ctx.env(), stats_);
        const Context cctx = ctx.derive(decl.name());
        for (auto& t : decl.then_fns()) {
            if (res.halted()) break;
            resolve(res, self, cctx.derive(t.name), t.name, BranchKind::Then, t.guard, t.conditional_compile_if,
                    [&](const Context& bctx) { return t.func(self, bctx); });
        }
        for (auto& f : decl.finish_or_fns()) {
            if (res.halted()) break;
            resolve(res, self, cctx.derive(f->get_name()), f->get_name(), BranchKind::FinishOr, f->get_guard(),
                    f->get_conditional_compile_if(), [&](const Context& bctx) { return f->call(self, bctx, args); });
        }
        for (auto& f : decl.finish_fns()) {
            if (res.halted()) break;
            const Context bctx = cctx.derive(f.name);
            auto verdict = evaluate_conditions(f.conditional_compile_if, self, bctx);
            if (!res.admit(f.name, verdict)) continue;
            res.include_finish(f.name, verdict.kind(), evaluate_guards(f.guard, self, bctx, cache_));
        }
        return res.finish();
    }

    // Resolve the single finish-or branch `name` with `args`, under the same rules
    // as compile().
    template <class Self, class StatefulArgs>
    llvm::Expected<Compiled> call_continuation(const ContractDecl<Self, StatefulArgs>& decl, const Self& self, const Context& ctx,
                                               std::string_view name, const StatefulArgs& args) {
        const auto* f = decl.find_continuation(name);
        if (!f) {
            std::vector<Reason> reasons{Reason{ErrorKind::UnknownContinuation, std::string(name),
                                               "contract " + decl.name() + " has no continuation named " + std::string(name)}};
            maybe_report(reasons, ctx.env());
            return llvm::make_error<CompilationError>(std::move(reasons));
        }
        cache_.clear();
        detail::Resolution res(decl.name(), ctx.env(), stats_);
        resolve(res, self, ctx.derive(decl.name()).derive(f->get_name()), f->get_name(), BranchKind::FinishOr, f->get_guard(),
                f->get_conditional_compile_if(), [&](const Context& bctx) { return f->call(self, bctx, args); });
        return res.finish();
    }

private:
    template <class Self, class Produce>
    void resolve(detail::Resolution& res, const Self& self, const Context& bctx, const std::string& name, BranchKind kind,
                 const GuardList<Self>& guards, const ConditionallyCompileIfList<Self>& rules, Produce&& produce) {
        auto verdict = evaluate_conditions(rules, self, bctx);
        if (!res.admit(name, verdict)) return;
        auto clauses = evaluate_guards(guards, self, bctx, cache_);
        res.settle(name, kind, verdict.kind(), std::move(clauses), detail::drain(produce(bctx)));
    }

    static void maybe_report(const std::vector<Reason>& reasons, const CompileEnv& env);

    GuardCache cache_;
    SessionStats stats_;
};

} // namespace sapio
