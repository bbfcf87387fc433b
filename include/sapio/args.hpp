// args.hpp - helpers for coercion functions over EDN stateful arguments
#pragma once
#include "sapio/context.hpp"
#include "sapio/edn.hpp"
#include <cstdint>
#include <string>
#include <string_view>

#include <llvm/Support/Error.h>

namespace sapio {

// Each helper reads `field` from an EDN map of stateful arguments. A missing or
// mistyped field is an ArgumentCoercionFailure naming the field.
llvm::Expected<int64_t> arg_i64(const edn::value_ptr& args, std::string_view field);
llvm::Expected<Amount> arg_amount(const edn::value_ptr& args, std::string_view field); // >= 0
llvm::Expected<uint32_t> arg_u32(const edn::value_ptr& args, std::string_view field);  // heights, lock times
llvm::Expected<std::string> arg_string(const edn::value_ptr& args, std::string_view field);
llvm::Expected<bool> arg_bool(const edn::value_ptr& args, std::string_view field);

// nullptr when the field is absent or nil.
edn::value_ptr arg_optional(const edn::value_ptr& args, std::string_view field);

struct EnumValue {
    std::string tag;
    edn::value_ptr payload; // null for unit variants
};

// An enum value is a keyword (:hold) or a single-entry map ({:make-sale {...}}).
llvm::Expected<EnumValue> variant_of(const edn::value_ptr& v);

} // namespace sapio
