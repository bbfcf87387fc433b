#include "sapio/schema.hpp"
#include <utility>

namespace sapio {

namespace {

using kwargs = std::vector<std::pair<std::string, edn::value_ptr>>;

std::string name_of(const edn::value_ptr& v, const char* what) {
    if (auto* s = edn::get_if<edn::symbol>(v)) return s->name;
    if (auto* s = edn::get_if<std::string>(v)) return *s;
    if (auto* k = edn::get_if<edn::keyword>(v)) return k->name;
    throw schema_error(std::string(what) + " expects a name");
}

std::string doc_of(const edn::value_ptr& v) {
    auto* s = edn::get_if<std::string>(v);
    if (!s) throw schema_error(":doc expects a string");
    return *s;
}

// Split (head :k v :k v ...) into keyword/value pairs.
kwargs keyword_args(const std::vector<edn::value_ptr>& l, const std::string& head) {
    kwargs out;
    for (size_t i = 1; i < l.size(); ++i) {
        auto* k = edn::get_if<edn::keyword>(l[i]);
        if (!k) throw schema_error("expected keyword in " + head);
        if (++i >= l.size()) throw schema_error(head + " :" + k->name + " missing value");
        out.emplace_back(k->name, l[i]);
    }
    return out;
}

const std::vector<edn::value_ptr>& vector_elems(const edn::value_ptr& v, const std::string& what) {
    auto* vv = edn::get_if<edn::vec>(v);
    if (!vv) throw schema_error(what + " expects a vector");
    return vv->elems;
}

SchemaPtr make_base(BaseType b) {
    auto s = std::make_shared<Schema>();
    s->kind = Schema::Kind::Base;
    s->base = b;
    return s;
}

SchemaPtr parse_field(const edn::value_ptr& v, Schema::Field& out) {
    auto* l = edn::get_if<edn::list>(v);
    if (!l || edn::head(v) != "field") throw schema_error("struct :fields entries must be (field ...)");
    for (auto& [k, val] : keyword_args(l->elems, "field")) {
        if (k == "name") out.name = name_of(val, "field :name");
        else if (k == "type") out.type = schema_from_edn(val);
        else if (k == "doc") out.doc = doc_of(val);
        else throw schema_error("unknown field keyword :" + k);
    }
    if (out.name.empty() || !out.type) throw schema_error("field requires :name and :type");
    return out.type;
}

} // namespace

const char* base_name(BaseType b) {
    switch (b) {
    case BaseType::Bool: return "bool";
    case BaseType::I64: return "i64";
    case BaseType::U64: return "u64";
    case BaseType::Amount: return "amount";
    case BaseType::Height: return "height";
    case BaseType::String: return "string";
    case BaseType::Hex: return "hex";
    }
    return "<bad-base>";
}

const Schema::Field* Schema::field(std::string_view n) const {
    for (auto& f : fields)
        if (f.name == n) return &f;
    return nullptr;
}

const Schema::Variant* Schema::variant(std::string_view n) const {
    for (auto& v : variants)
        if (v.name == n) return &v;
    return nullptr;
}

SchemaPtr parse_schema(std::string_view text) {
    edn::value_ptr form;
    try {
        form = edn::parse(text);
    } catch (const edn::parse_error& e) {
        throw schema_error(std::string("malformed schema text: ") + e.what());
    }
    return schema_from_edn(form);
}

SchemaPtr schema_from_edn(const edn::value_ptr& n) {
    if (auto* s = edn::get_if<edn::symbol>(n)) {
        static const BaseType bases[] = {BaseType::Bool, BaseType::I64, BaseType::U64, BaseType::Amount, BaseType::Height, BaseType::String, BaseType::Hex};
        for (auto b : bases)
            if (s->name == base_name(b)) return make_base(b);
        throw schema_error("unknown base type: " + s->name);
    }
    auto* l = edn::get_if<edn::list>(n);
    if (!l) throw schema_error("unsupported schema node: " + edn::to_string(n));
    if (l->elems.empty()) throw schema_error("empty schema list");
    std::string head(edn::head(n));
    if (head.empty()) throw schema_error("schema head must be symbol");

    auto out = std::make_shared<Schema>();
    if (head == "optional" || head == "vector") {
        if (l->elems.size() != 2) throw schema_error(head + " takes exactly one type");
        out->kind = head == "optional" ? Schema::Kind::Optional : Schema::Kind::Vector;
        out->inner = schema_from_edn(l->elems[1]);
        return out;
    }
    if (head == "struct") {
        out->kind = Schema::Kind::Struct;
        for (auto& [k, val] : keyword_args(l->elems, head)) {
            if (k == "name") out->name = name_of(val, "struct :name");
            else if (k == "doc") out->doc = doc_of(val);
            else if (k == "fields") {
                for (auto& f : vector_elems(val, "struct :fields")) {
                    Schema::Field field;
                    parse_field(f, field);
                    if (out->field(field.name)) throw schema_error("duplicate field " + field.name);
                    out->fields.push_back(std::move(field));
                }
            } else throw schema_error("unknown struct keyword :" + k);
        }
        if (out->name.empty()) throw schema_error("struct requires :name");
        return out;
    }
    if (head == "enum") {
        out->kind = Schema::Kind::Enum;
        for (auto& [k, val] : keyword_args(l->elems, head)) {
            if (k == "name") out->name = name_of(val, "enum :name");
            else if (k == "doc") out->doc = doc_of(val);
            else if (k == "variants") {
                for (auto& v : vector_elems(val, "enum :variants")) {
                    auto* vl = edn::get_if<edn::list>(v);
                    if (!vl || edn::head(v) != "variant") throw schema_error("enum :variants entries must be (variant ...)");
                    Schema::Variant var;
                    for (auto& [vk, vv] : keyword_args(vl->elems, "variant")) {
                        if (vk == "name") var.name = name_of(vv, "variant :name");
                        else if (vk == "type") var.type = schema_from_edn(vv);
                        else throw schema_error("unknown variant keyword :" + vk);
                    }
                    if (var.name.empty()) throw schema_error("variant requires :name");
                    if (out->variant(var.name)) throw schema_error("duplicate variant " + var.name);
                    out->variants.push_back(std::move(var));
                }
            } else throw schema_error("unknown enum keyword :" + k);
        }
        if (out->name.empty()) throw schema_error("enum requires :name");
        if (out->variants.empty()) throw schema_error("enum requires at least one variant");
        return out;
    }
    throw schema_error("unknown schema form: " + head);
}

edn::value_ptr schema_to_edn(const Schema& s) {
    switch (s.kind) {
    case Schema::Kind::Base:
        return edn::sym(base_name(s.base));
    case Schema::Kind::Optional:
    case Schema::Kind::Vector:
        return edn::list_of({edn::sym(s.kind == Schema::Kind::Optional ? "optional" : "vector"), schema_to_edn(*s.inner)});
    case Schema::Kind::Struct: {
        std::vector<edn::value_ptr> fields;
        for (auto& f : s.fields) {
            std::vector<edn::value_ptr> fl{edn::sym("field"), edn::kw("name"), edn::sym(f.name), edn::kw("type"), schema_to_edn(*f.type)};
            if (!f.doc.empty()) { fl.push_back(edn::kw("doc")); fl.push_back(edn::str(f.doc)); }
            fields.push_back(edn::list_of(std::move(fl)));
        }
        std::vector<edn::value_ptr> l{edn::sym("struct"), edn::kw("name"), edn::sym(s.name)};
        if (!s.doc.empty()) { l.push_back(edn::kw("doc")); l.push_back(edn::str(s.doc)); }
        l.push_back(edn::kw("fields"));
        l.push_back(edn::vec_of(std::move(fields)));
        return edn::list_of(std::move(l));
    }
    case Schema::Kind::Enum: {
        std::vector<edn::value_ptr> variants;
        for (auto& v : s.variants) {
            std::vector<edn::value_ptr> vl{edn::sym("variant"), edn::kw("name"), edn::sym(v.name)};
            if (v.type) { vl.push_back(edn::kw("type")); vl.push_back(schema_to_edn(*v.type)); }
            variants.push_back(edn::list_of(std::move(vl)));
        }
        std::vector<edn::value_ptr> l{edn::sym("enum"), edn::kw("name"), edn::sym(s.name)};
        if (!s.doc.empty()) { l.push_back(edn::kw("doc")); l.push_back(edn::str(s.doc)); }
        l.push_back(edn::kw("variants"));
        l.push_back(edn::vec_of(std::move(variants)));
        return edn::list_of(std::move(l));
    }
    }
    return edn::nil();
}

std::string schema_to_string(const Schema& s) { return edn::to_string(schema_to_edn(s)); }

} // namespace sapio
