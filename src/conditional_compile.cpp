#include "sapio/conditional_compile.hpp"

namespace sapio {

using Kind = ConditionalCompileType::Kind;

ConditionalCompileType ConditionalCompileType::fail(std::vector<std::string> reasons) {
    ConditionalCompileType v(Kind::Fail);
    v.reasons_ = std::move(reasons);
    return v;
}

ConditionalCompileType ConditionalCompileType::fail(std::string reason) {
    return fail(std::vector<std::string>{std::move(reason)});
}

ConditionalCompileType merge(ConditionalCompileType a, ConditionalCompileType b) {
    const Kind x = a.kind(), y = b.kind();
    if (x == Kind::NoConstraint) return b;
    if (y == Kind::NoConstraint) return a;
    if (x == Kind::Fail && y == Kind::Fail) {
        std::vector<std::string> all = a.reasons();
        all.insert(all.end(), b.reasons().begin(), b.reasons().end());
        return ConditionalCompileType::fail(std::move(all));
    }
    if (x == Kind::Fail) return a;
    if (y == Kind::Fail) return b;
    if ((x == Kind::Required && y == Kind::Never) || (x == Kind::Never && y == Kind::Required))
        return ConditionalCompileType::fail("Never and Required incompatible");
    // Never and Required each absorb the weaker tiers and themselves.
    if (x == Kind::Never || y == Kind::Never) return ConditionalCompileType::never();
    if (x == Kind::Required || y == Kind::Required) return ConditionalCompileType::required();
    if (x == Kind::Skippable || y == Kind::Skippable) return ConditionalCompileType::skippable();
    return ConditionalCompileType::nullable();
}

ConditionalCompileType fold(std::vector<ConditionalCompileType> verdicts) {
    ConditionalCompileType acc;
    for (auto& v : verdicts) acc = merge(std::move(acc), std::move(v));
    return acc;
}

const char* to_string(Kind k) {
    switch (k) {
    case Kind::NoConstraint: return "NoConstraint";
    case Kind::Skippable: return "Skippable";
    case Kind::Nullable: return "Nullable";
    case Kind::Required: return "Required";
    case Kind::Never: return "Never";
    case Kind::Fail: return "Fail";
    }
    return "<bad-verdict>";
}

std::string to_string(const ConditionalCompileType& v) {
    std::string out = to_string(v.kind());
    if (!v.is(Kind::Fail)) return out;
    out += "[";
    for (size_t i = 0; i < v.reasons().size(); ++i) {
        if (i) out += ", ";
        out += "\"" + v.reasons()[i] + "\"";
    }
    return out + "]";
}

} // namespace sapio
