// error.hpp - compilation errors carried through llvm::Error / llvm::Expected
#pragma once
#include <string>
#include <system_error>
#include <vector>

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

namespace sapio {

enum class ErrorKind {
    ArgumentCoercionFailure, // S0100
    ProductionFailure,       // S0200
    InclusionConflict,       // S0300
    EmptyRequiredBranch,     // S0400
    OutOfFunds,              // S0500
    UnknownContinuation      // S0600
};

const char* to_string(ErrorKind k);
const char* error_code(ErrorKind k);

struct Reason {
    ErrorKind kind;
    std::string branch; // empty when not attributable to one branch
    std::string message;
};

// Ordered, append-only reason list. A compilation that fails surfaces exactly one
// of these, aggregating every fatal reason in branch declaration order.
class CompilationError : public llvm::ErrorInfo<CompilationError> {
public:
    static char ID;

    CompilationError(ErrorKind kind, std::string message, std::string branch = {});
    explicit CompilationError(std::vector<Reason> reasons);

    const std::vector<Reason>& reasons() const { return reasons_; }
    ErrorKind kind() const { return reasons_.front().kind; }
    bool has(ErrorKind k) const;
    bool mentions(const std::string& text) const;

    void log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

private:
    std::vector<Reason> reasons_;
};

inline llvm::Error compilation_error(ErrorKind kind, std::string message, std::string branch = {}) {
    return llvm::make_error<CompilationError>(kind, std::move(message), std::move(branch));
}

// Consume `err` into reasons. CompilationError payloads keep their own kinds (an
// empty branch is filled with `branch`); any other payload becomes one reason of
// kind `fallback`.
std::vector<Reason> take_reasons(llvm::Error err, ErrorKind fallback, const std::string& branch);

// One line per reason, in the driver's "error[S0300]: ..." layout.
std::string format_reasons(const std::vector<Reason>& reasons);

} // namespace sapio
