// schema.hpp - structural descriptions of continuation argument types
#pragma once
#include "sapio/edn.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sapio {

struct schema_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

enum class BaseType { Bool, I64, U64, Amount, Height, String, Hex };

struct Schema;
using SchemaPtr = std::shared_ptr<const Schema>;

// Descriptive only: published so remote callers know which argument shape a
// continuation accepts. The compiler never validates arguments against it.
struct Schema {
    enum class Kind { Base, Optional, Vector, Struct, Enum } kind;
    BaseType base{};           // Base
    SchemaPtr inner;           // Optional, Vector
    std::string name;          // Struct, Enum
    std::string doc;
    struct Field { std::string name; SchemaPtr type; std::string doc; };
    struct Variant { std::string name; SchemaPtr type; }; // type null = unit variant
    std::vector<Field> fields;     // Struct
    std::vector<Variant> variants; // Enum

    const Field* field(std::string_view n) const;
    const Variant* variant(std::string_view n) const;
};

// Parse an EDN type form:
//   bool i64 u64 amount height string hex
//   (optional T) (vector T)
//   (struct :name N [:doc "..."] :fields [ (field :name f :type T [:doc "..."]) ... ])
//   (enum :name N [:doc "..."] :variants [ (variant :name v [:type T]) ... ])
SchemaPtr parse_schema(std::string_view text);
SchemaPtr schema_from_edn(const edn::value_ptr& form);

edn::value_ptr schema_to_edn(const Schema& s);
std::string schema_to_string(const Schema& s);

const char* base_name(BaseType b);

} // namespace sapio
