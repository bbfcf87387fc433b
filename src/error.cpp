#include "sapio/error.hpp"

namespace sapio {

char CompilationError::ID = 0;

const char* to_string(ErrorKind k) {
    switch (k) {
    case ErrorKind::ArgumentCoercionFailure: return "ArgumentCoercionFailure";
    case ErrorKind::ProductionFailure: return "ProductionFailure";
    case ErrorKind::InclusionConflict: return "InclusionConflict";
    case ErrorKind::EmptyRequiredBranch: return "EmptyRequiredBranch";
    case ErrorKind::OutOfFunds: return "OutOfFunds";
    case ErrorKind::UnknownContinuation: return "UnknownContinuation";
    }
    return "<bad-kind>";
}

const char* error_code(ErrorKind k) {
    switch (k) {
    case ErrorKind::ArgumentCoercionFailure: return "S0100";
    case ErrorKind::ProductionFailure: return "S0200";
    case ErrorKind::InclusionConflict: return "S0300";
    case ErrorKind::EmptyRequiredBranch: return "S0400";
    case ErrorKind::OutOfFunds: return "S0500";
    case ErrorKind::UnknownContinuation: return "S0600";
    }
    return "S0000";
}

CompilationError::CompilationError(ErrorKind kind, std::string message, std::string branch)
    : reasons_{Reason{kind, std::move(branch), std::move(message)}} {}

CompilationError::CompilationError(std::vector<Reason> reasons) : reasons_(std::move(reasons)) {
    if (reasons_.empty()) reasons_.push_back(Reason{ErrorKind::ProductionFailure, {}, "unspecified compilation failure"});
}

bool CompilationError::has(ErrorKind k) const {
    for (auto& r : reasons_)
        if (r.kind == k) return true;
    return false;
}

bool CompilationError::mentions(const std::string& text) const {
    for (auto& r : reasons_)
        if (r.message.find(text) != std::string::npos) return true;
    return false;
}

void CompilationError::log(llvm::raw_ostream& os) const {
    for (size_t i = 0; i < reasons_.size(); ++i) {
        if (i) os << "; ";
        auto& r = reasons_[i];
        os << error_code(r.kind) << " ";
        if (!r.branch.empty()) os << r.branch << ": ";
        os << r.message;
    }
}

std::error_code CompilationError::convertToErrorCode() const { return llvm::inconvertibleErrorCode(); }

std::vector<Reason> take_reasons(llvm::Error err, ErrorKind fallback, const std::string& branch) {
    std::vector<Reason> out;
    llvm::handleAllErrors(
        std::move(err),
        [&](const CompilationError& ce) {
            for (auto r : ce.reasons()) {
                if (r.branch.empty()) r.branch = branch;
                out.push_back(std::move(r));
            }
        },
        [&](const llvm::ErrorInfoBase& e) { out.push_back(Reason{fallback, branch, e.message()}); });
    return out;
}

std::string format_reasons(const std::vector<Reason>& reasons) {
    std::string out;
    for (auto& r : reasons) {
        out += std::string("error[") + error_code(r.kind) + "]: " + r.message;
        if (!r.branch.empty()) out += " (branch " + r.branch + ")";
        out += "\n";
    }
    return out;
}

} // namespace sapio
