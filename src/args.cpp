#include "sapio/args.hpp"
#include "sapio/error.hpp"

namespace sapio {

namespace {

llvm::Error coercion_error(std::string msg) {
    return compilation_error(ErrorKind::ArgumentCoercionFailure, std::move(msg));
}

llvm::Expected<edn::value_ptr> field_of(const edn::value_ptr& args, std::string_view field) {
    if (!edn::get_if<edn::map>(args)) return coercion_error("stateful arguments must be a map");
    auto v = edn::get(args, field);
    if (edn::is_nil(v)) return coercion_error("missing field :" + std::string(field));
    return v;
}

llvm::Error mistyped(std::string_view field, const char* expected, const edn::value_ptr& got) {
    return coercion_error("field :" + std::string(field) + " expects " + expected + ", got " + edn::to_string(got));
}

} // namespace

llvm::Expected<int64_t> arg_i64(const edn::value_ptr& args, std::string_view field) {
    auto v = field_of(args, field);
    if (!v) return v.takeError();
    if (auto* i = edn::get_if<int64_t>(*v)) return *i;
    return mistyped(field, "an integer", *v);
}

llvm::Expected<Amount> arg_amount(const edn::value_ptr& args, std::string_view field) {
    auto v = arg_i64(args, field);
    if (!v) return v.takeError();
    if (*v < 0) return coercion_error("field :" + std::string(field) + " must be a non-negative amount");
    return *v;
}

llvm::Expected<uint32_t> arg_u32(const edn::value_ptr& args, std::string_view field) {
    auto v = arg_i64(args, field);
    if (!v) return v.takeError();
    if (*v < 0 || *v > 0xffffffffLL) return coercion_error("field :" + std::string(field) + " out of range");
    return static_cast<uint32_t>(*v);
}

llvm::Expected<std::string> arg_string(const edn::value_ptr& args, std::string_view field) {
    auto v = field_of(args, field);
    if (!v) return v.takeError();
    if (auto* s = edn::get_if<std::string>(*v)) return *s;
    return mistyped(field, "a string", *v);
}

llvm::Expected<bool> arg_bool(const edn::value_ptr& args, std::string_view field) {
    auto v = field_of(args, field);
    if (!v) return v.takeError();
    if (auto* b = edn::get_if<bool>(*v)) return *b;
    return mistyped(field, "a boolean", *v);
}

edn::value_ptr arg_optional(const edn::value_ptr& args, std::string_view field) {
    auto v = edn::get(args, field);
    return edn::is_nil(v) ? nullptr : v;
}

llvm::Expected<EnumValue> variant_of(const edn::value_ptr& v) {
    if (auto* k = edn::get_if<edn::keyword>(v)) return EnumValue{k->name, nullptr};
    if (auto* m = edn::get_if<edn::map>(v)) {
        if (m->entries.size() == 1) {
            if (auto* k = edn::get_if<edn::keyword>(m->entries.front().first))
                return EnumValue{k->name, m->entries.front().second};
        }
    }
    return coercion_error("expected enum variant (:tag or {:tag payload}), got " + edn::to_string(v));
}

} // namespace sapio
