// branch.hpp - branch records (then / finish-or / finish) and their template streams
#pragma once
#include "sapio/error.hpp"
#include "sapio/guard.hpp"
#include "sapio/schema.hpp"
#include "sapio/template.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <llvm/Support/Error.h>

namespace sapio {

// Lazy, finite, non-restartable stream of fallible templates. Once it yields an
// error or reports the end it stays exhausted.
class TxTmplIt {
public:
    using NextFn = std::function<llvm::Expected<std::optional<Template>>()>;

    TxTmplIt() = default; // empty
    explicit TxTmplIt(NextFn next) : next_(std::move(next)) {}

    static TxTmplIt from(std::vector<Template> templates);
    static TxTmplIt single(Template t);

    // std::nullopt at the end.
    llvm::Expected<std::optional<Template>> next();
    // Drain; stops at the first failure.
    llvm::Expected<std::vector<Template>> collect();
    bool exhausted() const { return done_ || !next_; }

private:
    NextFn next_;
    bool done_ = false;
};

// A committed continuation: the guard conjunction unlocks exactly the produced
// templates.
template <class Self>
struct ThenFunc {
    using Fn = std::function<llvm::Expected<TxTmplIt>(const Self&, const Context&)>;

    std::string name;
    GuardList<Self> guard;
    ConditionallyCompileIfList<Self> conditional_compile_if;
    Fn func;
};

// A terminal spending path: contributes its clause and no templates.
template <class Self>
struct FinishFunc {
    std::string name;
    GuardList<Self> guard;
    ConditionallyCompileIfList<Self> conditional_compile_if;
};

// Uniform calling convention for argument-taking branches, whatever their
// specific argument type. A contract holds these behind owning pointers.
template <class Self, class StatefulArgs>
class CallableAsFoF {
public:
    virtual ~CallableAsFoF() = default;

    // Coerce `args`, then produce. A coercion failure is an ArgumentCoercionFailure
    // attributed to this branch.
    virtual llvm::Expected<TxTmplIt> call(const Self& self, const Context& ctx, const StatefulArgs& args) const = 0;
    virtual const ConditionallyCompileIfList<Self>& get_conditional_compile_if() const = 0;
    virtual const GuardList<Self>& get_guard() const = 0;
    virtual const std::string& get_name() const = 0;
    // Descriptive only; may be null.
    virtual SchemaPtr get_schema() const = 0;
};

template <class Self, class StatefulArgs, class SpecificArgs>
class FinishOrFunc : public CallableAsFoF<Self, StatefulArgs> {
public:
    using Coerce = std::function<llvm::Expected<SpecificArgs>(const StatefulArgs&)>;
    using Fn = std::function<llvm::Expected<TxTmplIt>(const Self&, const Context&, SpecificArgs)>;

    FinishOrFunc(std::string name, GuardList<Self> guard, ConditionallyCompileIfList<Self> ccif, Coerce coerce, Fn func,
                 SchemaPtr schema = nullptr)
        : name_(std::move(name)), guard_(std::move(guard)), ccif_(std::move(ccif)), coerce_(std::move(coerce)),
          func_(std::move(func)), schema_(std::move(schema)) {}

    llvm::Expected<TxTmplIt> call(const Self& self, const Context& ctx, const StatefulArgs& args) const override {
        auto specific = coerce_(args);
        if (!specific) {
            auto reasons = take_reasons(specific.takeError(), ErrorKind::ArgumentCoercionFailure, name_);
            for (auto& r : reasons) r.kind = ErrorKind::ArgumentCoercionFailure;
            return llvm::make_error<CompilationError>(std::move(reasons));
        }
        return func_(self, ctx, std::move(*specific));
    }
    const ConditionallyCompileIfList<Self>& get_conditional_compile_if() const override { return ccif_; }
    const GuardList<Self>& get_guard() const override { return guard_; }
    const std::string& get_name() const override { return name_; }
    SchemaPtr get_schema() const override { return schema_; }

private:
    std::string name_;
    GuardList<Self> guard_;
    ConditionallyCompileIfList<Self> ccif_;
    Coerce coerce_;
    Fn func_;
    SchemaPtr schema_;
};

} // namespace sapio
