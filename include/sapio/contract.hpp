// contract.hpp - per-type declaration of a contract's branches
#pragma once
#include "sapio/branch.hpp"
#include "sapio/edn.hpp"
#include "sapio/schema.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sapio {

// Declared once per contract type and shared by all its instances. Branches
// resolve in declaration order: then-functions, finish-or functions, finish
// functions.
template <class Self, class StatefulArgs = edn::value_ptr>
class ContractDecl {
public:
    using FinishOr = CallableAsFoF<Self, StatefulArgs>;

    explicit ContractDecl(std::string name) : name_(std::move(name)) {}

    ContractDecl(ContractDecl&&) = default;
    ContractDecl& operator=(ContractDecl&&) = default;

    ContractDecl& then(ThenFunc<Self> fn) { then_.push_back(std::move(fn)); return *this; }
    ContractDecl& finish_or(std::unique_ptr<FinishOr> fn) { finish_or_.push_back(std::move(fn)); return *this; }
    template <class SpecificArgs>
    ContractDecl& finish_or(FinishOrFunc<Self, StatefulArgs, SpecificArgs> fn) {
        return finish_or(std::make_unique<FinishOrFunc<Self, StatefulArgs, SpecificArgs>>(std::move(fn)));
    }
    ContractDecl& finish(FinishFunc<Self> fn) { finish_.push_back(std::move(fn)); return *this; }

    const std::string& name() const { return name_; }
    const std::vector<ThenFunc<Self>>& then_fns() const { return then_; }
    const std::vector<std::unique_ptr<FinishOr>>& finish_or_fns() const { return finish_or_; }
    const std::vector<FinishFunc<Self>>& finish_fns() const { return finish_; }

    const FinishOr* find_continuation(std::string_view name) const {
        for (auto& f : finish_or_)
            if (f->get_name() == name) return f.get();
        return nullptr;
    }

    // {"continuation-name" schema-form-or-nil ...}, the argument shapes a remote
    // caller may send.
    edn::value_ptr api() const {
        std::vector<std::pair<edn::value_ptr, edn::value_ptr>> kv;
        for (auto& f : finish_or_) {
            auto schema = f->get_schema();
            kv.emplace_back(edn::str(f->get_name()), schema ? schema_to_edn(*schema) : edn::nil());
        }
        return edn::map_of(std::move(kv));
    }

private:
    std::string name_;
    std::vector<ThenFunc<Self>> then_;
    std::vector<std::unique_ptr<FinishOr>> finish_or_;
    std::vector<FinishFunc<Self>> finish_;
};

} // namespace sapio
