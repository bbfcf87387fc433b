// EDN reader and printer.
#include "sapio/edn.hpp"
#include <cctype>
#include <sstream>

namespace sapio::edn {

namespace {

struct reader {
    std::string_view d;
    size_t p = 0;
    int line = 1, col = 1;
    explicit reader(std::string_view s) : d(s) {}
    bool eof() const { return p >= d.size(); }
    char peek() const { return eof() ? '\0' : d[p]; }
    char get() {
        if (eof()) return '\0';
        char c = d[p++];
        if (c == '\n') { ++line; col = 1; }
        else ++col;
        return c;
    }
    void skip_ws() {
        while (!eof()) {
            char c = peek();
            if (c == ';') {
                while (!eof() && get() != '\n') continue;
                continue;
            }
            // commas are whitespace in EDN
            if (c == ' ' || c == ',' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v') {
                get();
                continue;
            }
            break;
        }
    }
    [[noreturn]] void fail(const std::string& what) const {
        throw parse_error(what + " at line " + std::to_string(line) + ":" + std::to_string(col));
    }
};

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_symbol_start(char c) {
    return std::isalpha((unsigned char)c) || c == '*' || c == '!' || c == '_' || c == '?' || c == '-' || c == '+' || c == '/' || c == '<' || c == '>' || c == '=' || c == '$' || c == '%' || c == '&';
}
bool is_symbol_char(char c) { return is_symbol_start(c) || is_digit(c) || c == '.' || c == '#' || c == ':'; }

value_ptr at(value_data d, position pos) { return std::make_shared<const value>(value{std::move(d), pos}); }

value_ptr parse_value(reader& r);

value_ptr parse_seq(reader& r, char end, position pos) {
    std::vector<value_ptr> elems;
    r.skip_ws();
    while (!r.eof() && r.peek() != end) {
        elems.push_back(parse_value(r));
        r.skip_ws();
    }
    if (r.get() != end) r.fail("unterminated collection");
    if (end == ')') return at(list{std::move(elems)}, pos);
    if (end == ']') return at(vec{std::move(elems)}, pos);
    if (elems.size() % 2) r.fail("map requires an even number of forms");
    map m;
    for (size_t i = 0; i < elems.size(); i += 2) m.entries.emplace_back(elems[i], elems[i + 1]);
    return at(std::move(m), pos);
}

value_ptr parse_string(reader& r, position pos) {
    r.get(); // opening quote
    std::string out;
    for (;;) {
        if (r.eof()) r.fail("unterminated string");
        char c = r.get();
        if (c == '"') break;
        if (c != '\\') { out += c; continue; }
        if (r.eof()) r.fail("bad escape");
        char e = r.get();
        switch (e) {
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        default: out += e; break;
        }
    }
    return at(std::move(out), pos);
}

value_ptr parse_number(reader& r, position pos) {
    std::string num;
    if (r.peek() == '+' || r.peek() == '-') num += r.get();
    bool is_float = false;
    while (is_digit(r.peek())) num += r.get();
    if (r.peek() == '.') {
        is_float = true;
        num += r.get();
        while (is_digit(r.peek())) num += r.get();
    }
    if (r.peek() == 'e' || r.peek() == 'E') {
        is_float = true;
        num += r.get();
        if (r.peek() == '+' || r.peek() == '-') num += r.get();
        while (is_digit(r.peek())) num += r.get();
    }
    try {
        if (is_float) return at(std::stod(num), pos);
        return at((int64_t)std::stoll(num), pos);
    } catch (const std::logic_error&) {
        r.fail("invalid number '" + num + "'");
    }
}

value_ptr parse_word(reader& r, position pos) {
    bool kw = false;
    if (r.peek() == ':') { kw = true; r.get(); }
    std::string s;
    while (is_symbol_char(r.peek())) s += r.get();
    if (kw) {
        if (s.empty()) r.fail("empty keyword");
        return at(keyword{std::move(s)}, pos);
    }
    if (s == "nil") return at(std::monostate{}, pos);
    if (s == "true") return at(true, pos);
    if (s == "false") return at(false, pos);
    return at(symbol{std::move(s)}, pos);
}

value_ptr parse_value(reader& r) {
    r.skip_ws();
    position pos{r.line, r.col};
    char c = r.peek();
    switch (c) {
    case '"': return parse_string(r, pos);
    case '(': r.get(); return parse_seq(r, ')', pos);
    case '[': r.get(); return parse_seq(r, ']', pos);
    case '{': r.get(); return parse_seq(r, '}', pos);
    case '#': r.fail("tagged literals and sets are not supported");
    case '\0': r.fail("unexpected end of input");
    default: break;
    }
    // '+'/'-' start a number only when a digit follows; otherwise they are symbols
    if (is_digit(c) || ((c == '+' || c == '-') && r.p + 1 < r.d.size() && is_digit(r.d[r.p + 1])))
        return parse_number(r, pos);
    if (c == ':' || is_symbol_start(c)) return parse_word(r, pos);
    r.fail(std::string("unexpected character '") + c + "'");
}

std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default: out += c; break;
        }
    }
    return out + '"';
}

std::string join(const std::vector<value_ptr>& elems, char open, char close) {
    std::string out(1, open);
    for (size_t i = 0; i < elems.size(); ++i) {
        if (i) out += ' ';
        out += to_string(elems[i]);
    }
    return out + close;
}

} // namespace

value_ptr parse(std::string_view input) {
    reader r(input);
    auto v = parse_value(r);
    r.skip_ws();
    if (!r.eof()) r.fail("unexpected trailing characters");
    return v;
}

std::string to_string(const value_ptr& v) {
    if (!v) return "nil";
    struct V {
        std::string operator()(std::monostate) const { return "nil"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const {
            std::ostringstream oss;
            oss << d;
            return oss.str();
        }
        std::string operator()(const std::string& s) const { return quote(s); }
        std::string operator()(const keyword& k) const { return ':' + k.name; }
        std::string operator()(const symbol& s) const { return s.name; }
        std::string operator()(const list& l) const { return join(l.elems, '(', ')'); }
        std::string operator()(const vec& v) const { return join(v.elems, '[', ']'); }
        std::string operator()(const map& m) const {
            std::string out = "{";
            bool first = true;
            for (auto& kv : m.entries) {
                if (!first) out += ' ';
                first = false;
                out += to_string(kv.first) + ' ' + to_string(kv.second);
            }
            return out + '}';
        }
    };
    return std::visit(V{}, v->data);
}

value_ptr get(const value_ptr& m, std::string_view key) {
    auto* mm = get_if<map>(m);
    if (!mm) return nullptr;
    for (auto& kv : mm->entries) {
        if (auto* k = get_if<keyword>(kv.first); k && k->name == key) return kv.second;
        if (auto* s = get_if<std::string>(kv.first); s && *s == key) return kv.second;
    }
    return nullptr;
}

} // namespace sapio::edn
