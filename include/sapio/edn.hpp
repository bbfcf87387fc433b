// edn.hpp - EDN value model shared by stateful arguments, clauses, templates and schemas
#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sapio::edn {

struct parse_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct keyword { std::string name; };
struct symbol { std::string name; };

struct value;
// Values are immutable once built; sharing a value_ptr shares identity.
using value_ptr = std::shared_ptr<const value>;

struct list { std::vector<value_ptr> elems; };
struct vec { std::vector<value_ptr> elems; };
struct map { std::vector<std::pair<value_ptr, value_ptr>> entries; };

using value_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, symbol, list, vec, map>;

struct position { int line = -1; int col = -1; };

struct value {
    value_data data;
    position pos;
};

// Parse exactly one form; trailing content is an error.
value_ptr parse(std::string_view input);

std::string to_string(const value_ptr& v);

// Structural equality; source positions are ignored. A null pointer equals nil.
bool equal(const value_ptr& a, const value_ptr& b);

// ------ factories ------
inline value_ptr make(value_data d) { return std::make_shared<const value>(value{std::move(d), {}}); }
inline value_ptr nil() { return make(std::monostate{}); }
inline value_ptr boolean(bool b) { return make(b); }
inline value_ptr i64(int64_t v) { return make(v); }
inline value_ptr f64(double v) { return make(v); }
inline value_ptr str(std::string s) { return make(std::move(s)); }
inline value_ptr kw(std::string name) { return make(keyword{std::move(name)}); }
inline value_ptr sym(std::string name) { return make(symbol{std::move(name)}); }
inline value_ptr list_of(std::vector<value_ptr> xs) { return make(list{std::move(xs)}); }
inline value_ptr vec_of(std::vector<value_ptr> xs) { return make(vec{std::move(xs)}); }
inline value_ptr map_of(std::vector<std::pair<value_ptr, value_ptr>> kvs) { return make(map{std::move(kvs)}); }

// ------ accessors ------
template <class T>
inline const T* get_if(const value_ptr& v) { return v ? std::get_if<T>(&v->data) : nullptr; }

inline bool is_nil(const value_ptr& v) { return !v || std::holds_alternative<std::monostate>(v->data); }

// Look up `key` in a map whose keys are keywords (or strings). Returns nullptr when
// `m` is not a map or the key is absent.
value_ptr get(const value_ptr& m, std::string_view key);

// Head symbol of a list form, or empty.
inline std::string_view head(const value_ptr& v) {
    auto* l = get_if<list>(v);
    if (!l || l->elems.empty()) return {};
    auto* s = get_if<symbol>(l->elems.front());
    return s ? std::string_view(s->name) : std::string_view();
}

} // namespace sapio::edn
