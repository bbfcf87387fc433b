#include "sapio/compiler.hpp"
#include "sapio/diagnostics_json.hpp"

#include <llvm/Support/raw_ostream.h>

namespace sapio {

using VKind = ConditionalCompileType::Kind;

const char* to_string(BranchKind k) {
    switch (k) {
    case BranchKind::Then: return "then";
    case BranchKind::FinishOr: return "finish-or";
    case BranchKind::Finish: return "finish";
    }
    return "<bad-branch-kind>";
}

const CompiledBranch* Compiled::find(std::string_view name) const {
    for (auto& b : branches)
        if (b.name == name) return &b;
    return nullptr;
}

std::vector<std::pair<Clause, Template>> Compiled::pairs() const {
    std::vector<std::pair<Clause, Template>> out;
    for (auto& b : branches)
        for (auto& t : b.templates) out.emplace_back(b.clause, t);
    return out;
}

size_t Compiled::template_count() const {
    size_t n = 0;
    for (auto& b : branches) n += b.templates.size();
    return n;
}

Clause Compiled::policy() const {
    std::vector<Clause> clauses;
    clauses.reserve(branches.size());
    for (auto& b : branches) clauses.push_back(b.clause);
    return Clause::any(clauses);
}

edn::value_ptr Compiled::to_edn() const {
    std::vector<edn::value_ptr> bs;
    for (auto& b : branches) {
        std::vector<edn::value_ptr> ts;
        for (auto& t : b.templates) ts.push_back(t.to_edn());
        bs.push_back(edn::map_of({{edn::kw("name"), edn::str(b.name)},
                                  {edn::kw("kind"), edn::kw(to_string(b.kind))},
                                  {edn::kw("verdict"), edn::kw(to_string(b.verdict))},
                                  {edn::kw("clause"), b.clause.form()},
                                  {edn::kw("templates"), edn::vec_of(std::move(ts))}}));
    }
    return edn::map_of({{edn::kw("contract"), edn::str(contract)},
                        {edn::kw("policy"), policy().form()},
                        {edn::kw("branches"), edn::vec_of(std::move(bs))}});
}

void Session::maybe_report(const std::vector<Reason>& reasons, const CompileEnv& env) {
    if (env.trace) llvm::errs() << "[sapio][session] " << format_reasons(reasons);
    maybe_print_json(reasons, env);
}

namespace detail {

Resolution::Resolution(std::string contract, const CompileEnv& env, SessionStats& stats) : env_(env), stats_(stats) {
    out_.contract = std::move(contract);
}

void Resolution::trace(const std::string& branch, const char* what, const std::string& detail) const {
    if (!env_.trace) return;
    llvm::errs() << "[sapio][branch] " << out_.contract << "/" << branch << " " << what;
    if (!detail.empty()) llvm::errs() << ": " << detail;
    llvm::errs() << "\n";
}

void Resolution::fatal(std::vector<Reason> reasons) {
    ++stats_.failed;
    for (auto& r : reasons) fatal_.push_back(std::move(r));
}

bool Resolution::admit(const std::string& branch, const ConditionalCompileType& verdict) {
    switch (verdict.kind()) {
    case VKind::Fail: {
        std::vector<Reason> reasons;
        for (auto& msg : verdict.reasons()) reasons.push_back(Reason{ErrorKind::InclusionConflict, branch, msg});
        if (reasons.empty()) reasons.push_back(Reason{ErrorKind::InclusionConflict, branch, "inclusion rules failed"});
        trace(branch, "fail", to_string(verdict));
        fatal(std::move(reasons));
        return false;
    }
    case VKind::Never:
        ++stats_.excluded;
        trace(branch, "excluded", "Never");
        return false;
    case VKind::Skippable:
        if (env_.skipSkippable) {
            ++stats_.excluded;
            trace(branch, "excluded", "Skippable skipped");
            return false;
        }
        return true;
    default:
        return true;
    }
}

void Resolution::include(std::string branch, BranchKind kind, VKind verdict, std::vector<Clause> guards,
                         std::vector<Template> templates) {
    ++stats_.included;
    trace(branch, "included", std::to_string(templates.size()) + " template(s)");
    CompiledBranch b{std::move(branch), kind, verdict, std::move(guards), Clause(), std::move(templates)};
    b.clause = Clause::all(b.guards);
    out_.branches.push_back(std::move(b));
}

void Resolution::settle(const std::string& branch, BranchKind kind, VKind verdict, std::vector<Clause> guards,
                        llvm::Expected<std::vector<Template>> produced) {
    const bool lenient = verdict == VKind::Skippable || verdict == VKind::Nullable;
    if (!produced) {
        auto reasons = take_reasons(produced.takeError(), ErrorKind::ProductionFailure, branch);
        if (lenient) {
            ++stats_.pruned;
            trace(branch, "pruned", reasons.front().message);
            return;
        }
        trace(branch, "failed");
        fatal(std::move(reasons));
        return;
    }
    if (produced->empty()) {
        if (verdict == VKind::Required) {
            trace(branch, "failed", "Required branch produced no templates");
            fatal({Reason{ErrorKind::EmptyRequiredBranch, branch, "Required branch produced no templates"}});
            return;
        }
        ++stats_.pruned;
        trace(branch, "pruned", "no templates");
        return;
    }
    include(branch, kind, verdict, std::move(guards), std::move(*produced));
}

void Resolution::include_finish(const std::string& branch, VKind verdict, std::vector<Clause> guards) {
    include(branch, BranchKind::Finish, verdict, std::move(guards), {});
}

llvm::Expected<Compiled> Resolution::finish() {
    if (fatal_.empty()) return std::move(out_);
    if (env_.trace) llvm::errs() << "[sapio][branch] " << out_.contract << " failed with " << fatal_.size() << " reason(s)\n";
    maybe_print_json(fatal_, env_);
    return llvm::make_error<CompilationError>(std::move(fatal_));
}

llvm::Expected<std::vector<Template>> drain(llvm::Expected<TxTmplIt> produced) {
    if (!produced) return produced.takeError();
    return produced->collect();
}

} // namespace detail

} // namespace sapio
