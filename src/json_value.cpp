#include "config/json_value.hpp"

#include <cctype>
#include <stdexcept>

namespace qbot {

const JsonValue* JsonValue::find(const std::string& key) const {
    for (const auto& [k, v] : obj) {
        if (k == key) return &v;
    }
    return nullptr;
}

double JsonValue::get_number(const std::string& key, double def) const {
    auto* v = find(key);
    return (v && v->type == Number) ? v->number : def;
}

bool JsonValue::get_bool(const std::string& key, bool def) const {
    auto* v = find(key);
    return (v && v->type == Bool) ? v->boolean : def;
}

std::string JsonValue::get_string(const std::string& key, const std::string& def) const {
    auto* v = find(key);
    return (v && v->type == String) ? v->str : def;
}

const JsonValue* JsonValue::get_array(const std::string& key) const {
    auto* v = find(key);
    return (v && v->type == Array) ? v : nullptr;
}

const JsonValue* JsonValue::get_object(const std::string& key) const {
    auto* v = find(key);
    return (v && v->type == Object) ? v : nullptr;
}

namespace {

// Recursive descent over a single document
class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input), pos_(0) {}

    JsonValue parse() {
        JsonValue v = parse_value();
        skip_ws();
        if (pos_ != input_.size()) fail("trailing characters");
        return v;
    }

private:
    const std::string& input_;
    size_t pos_;

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error("json: " + what + " at offset " + std::to_string(pos_));
    }

    char peek() const { return pos_ < input_.size() ? input_[pos_] : '\0'; }
    char next() { return pos_ < input_.size() ? input_[pos_++] : '\0'; }

    void skip_ws() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) ++pos_;
    }

    void expect(char c) {
        skip_ws();
        if (peek() != c) fail(std::string("expected '") + c + "'");
        ++pos_;
    }

    void expect_literal(const char* lit) {
        for (const char* p = lit; *p; ++p) {
            if (next() != *p) fail(std::string("bad literal, expected ") + lit);
        }
    }

    JsonValue parse_value() {
        skip_ws();
        char c = peek();
        if (c == '"') return parse_string();
        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == 'n') { expect_literal("null"); return JsonValue{}; }
        if (c == 't' || c == 'f') {
            JsonValue v;
            v.type = JsonValue::Bool;
            v.boolean = (c == 't');
            expect_literal(v.boolean ? "true" : "false");
            return v;
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
        if (c == '\0') fail("unexpected end of input");
        fail(std::string("unexpected character '") + c + "'");
    }

    JsonValue parse_string() {
        expect('"');
        JsonValue v;
        v.type = JsonValue::String;
        while (peek() != '"') {
            if (peek() == '\0') fail("unterminated string");
            if (peek() == '\\') {
                next();
                char esc = next();
                switch (esc) {
                    case 'n': v.str += '\n'; break;
                    case 't': v.str += '\t'; break;
                    case 'r': v.str += '\r'; break;
                    case 'b': v.str += '\b'; break;
                    case 'f': v.str += '\f'; break;
                    case 'u': fail("unsupported \\u escape");
                    case '\0': fail("unterminated string");
                    default:  v.str += esc; break;  // \" \\ \/
                }
            } else {
                v.str += next();
            }
        }
        next(); // skip closing "
        return v;
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (peek() == '-') next();
        while (std::isdigit(static_cast<unsigned char>(peek()))) next();
        if (peek() == '.') { next(); while (std::isdigit(static_cast<unsigned char>(peek()))) next(); }
        if (peek() == 'e' || peek() == 'E') {
            next();
            if (peek() == '+' || peek() == '-') next();
            while (std::isdigit(static_cast<unsigned char>(peek()))) next();
        }
        JsonValue v;
        v.type = JsonValue::Number;
        try {
            v.number = std::stod(input_.substr(start, pos_ - start));
        } catch (const std::logic_error&) {
            pos_ = start;
            fail("malformed number");
        }
        return v;
    }

    JsonValue parse_array() {
        expect('[');
        JsonValue v;
        v.type = JsonValue::Array;
        skip_ws();
        if (peek() == ']') { next(); return v; }
        while (true) {
            v.arr.push_back(parse_value());
            skip_ws();
            if (peek() == ',') { next(); continue; }
            expect(']');
            return v;
        }
    }

    JsonValue parse_object() {
        expect('{');
        JsonValue v;
        v.type = JsonValue::Object;
        skip_ws();
        if (peek() == '}') { next(); return v; }
        while (true) {
            skip_ws();
            auto key = parse_string();
            expect(':');
            auto val = parse_value();
            v.obj.emplace_back(std::move(key.str), std::move(val));
            skip_ws();
            if (peek() == ',') { next(); continue; }
            expect('}');
            return v;
        }
    }
};

} // anonymous namespace

JsonValue parse_json(const std::string& input) {
    JsonParser parser(input);
    return parser.parse();
}

int64_t json_to_int64(double value, const std::string& field) {
    // [-2^63, 2^63); NaN fails both comparisons
    if (!(value >= -9223372036854775808.0 && value < 9223372036854775808.0)) {
        throw std::runtime_error(field + " out of range");
    }
    return static_cast<int64_t>(value);
}

uint64_t json_to_uint64(double value, const std::string& field) {
    if (!(value >= 0.0 && value < 18446744073709551616.0)) {
        throw std::runtime_error(field + " out of range");
    }
    return static_cast<uint64_t>(value);
}

} // namespace qbot
