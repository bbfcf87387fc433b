// conditional_compile.hpp - inclusion verdicts for branches and their merge algebra
#pragma once
#include <string>
#include <vector>

namespace sapio {

// Precedence:
//     Fail > non-Fail                   ==> Fail (reason lists concatenate)
//     forall X. X > NoConstraint        ==> X
//     Required > {Skippable, Nullable}  ==> Required
//     Never > {Skippable, Nullable}     ==> Never
//     Skippable > Nullable              ==> Skippable
//     Never >< Required                 ==> Fail
class ConditionalCompileType {
public:
    enum class Kind {
        NoConstraint, // nothing is changed by this rule
        Skippable,    // may be omitted; an empty or failing branch is dropped
        Nullable,     // an empty or failing branch is pruned silently
        Required,     // must contribute templates; failure is fatal
        Never,        // must not be used
        Fail          // always an error, with reasons
    };

    ConditionalCompileType() = default; // NoConstraint

    static ConditionalCompileType no_constraint() { return ConditionalCompileType(Kind::NoConstraint); }
    static ConditionalCompileType skippable() { return ConditionalCompileType(Kind::Skippable); }
    static ConditionalCompileType nullable() { return ConditionalCompileType(Kind::Nullable); }
    static ConditionalCompileType required() { return ConditionalCompileType(Kind::Required); }
    static ConditionalCompileType never() { return ConditionalCompileType(Kind::Never); }
    static ConditionalCompileType fail(std::vector<std::string> reasons);
    static ConditionalCompileType fail(std::string reason);

    Kind kind() const { return kind_; }
    bool is(Kind k) const { return kind_ == k; }
    // Non-empty only for Fail.
    const std::vector<std::string>& reasons() const { return reasons_; }

    friend bool operator==(const ConditionalCompileType& a, const ConditionalCompileType& b) {
        return a.kind_ == b.kind_ && a.reasons_ == b.reasons_;
    }
    friend bool operator!=(const ConditionalCompileType& a, const ConditionalCompileType& b) { return !(a == b); }

private:
    explicit ConditionalCompileType(Kind k) : kind_(k) {}
    Kind kind_ = Kind::NoConstraint;
    std::vector<std::string> reasons_;
};

// Total over every pair. Reasons of two Fails keep argument order.
ConditionalCompileType merge(ConditionalCompileType a, ConditionalCompileType b);

// Left fold from NoConstraint, in list order.
ConditionalCompileType fold(std::vector<ConditionalCompileType> verdicts);

const char* to_string(ConditionalCompileType::Kind k);
std::string to_string(const ConditionalCompileType& v);

} // namespace sapio
