#include "streamgate/core/json.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>

#ifdef STREAMGATE_HAS_SIMDJSON
// Parsers are not thread-safe; one per thread
static thread_local simdjson::ondemand::parser simdjson_parser;
#endif

namespace streamgate {

// ============================================================================
// Object access
// ============================================================================

JsonValue& JsonValue::operator[](std::string_view key) {
    if (!is_object()) {
        value_ = JsonObject{};
    }
    auto& obj = std::get<JsonObject>(value_);
    for (auto& [k, v] : obj) {
        if (k == key) return v;
    }
    obj.emplace_back(std::string(key), JsonValue{});
    return obj.back().second;
}

const JsonValue* JsonValue::get(std::string_view key) const {
    if (!is_object()) return nullptr;
    for (const auto& [k, v] : std::get<JsonObject>(value_)) {
        if (k == key) return &v;
    }
    return nullptr;
}

// ============================================================================
// JSON Serialization
// ============================================================================

namespace {

void escape_string(std::string& out, std::string_view str) {
    out += '"';
    for (char c : str) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

void dump_number(std::string& out, double num) {
    if (!std::isfinite(num)) {
        out += "null";
        return;
    }
    char buf[32];
    if (num == std::floor(num) && std::abs(num) < 1e15) {
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), static_cast<int64_t>(num));
        out.append(buf, end);
    } else {
        int n = std::snprintf(buf, sizeof(buf), "%.17g", num);
        out.append(buf, static_cast<size_t>(n));
    }
}

void dump_impl(std::string& out, const JsonValue& value, int indent, int depth) {
    bool pretty = indent >= 0;
    auto newline = [&](int level) {
        if (!pretty) return;
        out += '\n';
        out.append(static_cast<size_t>(level * indent), ' ');
    };

    if (value.is_null()) {
        out += "null";
    } else if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
    } else if (value.is_number()) {
        dump_number(out, value.as_number());
    } else if (value.is_string()) {
        escape_string(out, value.as_string());
    } else if (value.is_array()) {
        const auto& arr = value.as_array();
        out += '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            newline(depth + 1);
            dump_impl(out, arr[i], indent, depth + 1);
            if (i + 1 < arr.size()) out += ',';
        }
        if (!arr.empty()) newline(depth);
        out += ']';
    } else {
        const auto& obj = value.as_object();
        out += '{';
        for (size_t i = 0; i < obj.size(); ++i) {
            newline(depth + 1);
            escape_string(out, obj[i].first);
            out += pretty ? ": " : ":";
            dump_impl(out, obj[i].second, indent, depth + 1);
            if (i + 1 < obj.size()) out += ',';
        }
        if (!obj.empty()) newline(depth);
        out += '}';
    }
}

} // anonymous namespace

std::string JsonValue::dump(int indent) const {
    std::string out;
    dump_impl(out, *this, indent, 0);
    return out;
}

// ============================================================================
// JSON Parsing
// ============================================================================

namespace {

Error parse_error(std::string msg) {
    return Error::http(HttpError::BadRequest, "JSON parse error: " + std::move(msg));
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Recursive descent over the whole input; depth-limited
class JsonParser {
    static constexpr int max_depth = 128;

    std::string_view input_;
    size_t pos_ = 0;
    int depth_ = 0;

public:
    explicit JsonParser(std::string_view input) : input_(input) {}

    expected<JsonValue, Error> parse() {
        auto result = parse_value();
        if (!result) return result;
        skip_whitespace();
        if (pos_ < input_.size()) {
            return unexpected(parse_error("trailing characters"));
        }
        return result;
    }

private:
    char peek() const {
        return pos_ < input_.size() ? input_[pos_] : '\0';
    }

    bool consume_if(char c) {
        if (peek() == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consume_if(std::string_view s) {
        if (input_.substr(pos_).starts_with(s)) {
            pos_ += s.size();
            return true;
        }
        return false;
    }

    void skip_whitespace() {
        while (pos_ < input_.size()) {
            char c = input_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    static bool is_digit(char c) { return c >= '0' && c <= '9'; }

    expected<JsonValue, Error> parse_value() {
        skip_whitespace();
        char c = peek();
        if (consume_if("null")) return JsonValue(nullptr);
        if (consume_if("true")) return JsonValue(true);
        if (consume_if("false")) return JsonValue(false);
        if (c == '"') {
            auto s = parse_string();
            if (!s) return unexpected(s.error());
            return JsonValue(std::move(*s));
        }
        if (c == '[' || c == '{') {
            if (++depth_ > max_depth) {
                return unexpected(parse_error("nesting too deep"));
            }
            auto nested = c == '[' ? parse_array() : parse_object();
            --depth_;
            return nested;
        }
        if (c == '-' || is_digit(c)) return parse_number();
        if (c == '\0') return unexpected(parse_error("unexpected end of input"));
        return unexpected(parse_error(std::string("unexpected character '") + c + "'"));
    }

    expected<JsonValue, Error> parse_number() {
        size_t start = pos_;
        consume_if('-');
        if (!consume_if('0')) {
            if (!is_digit(peek())) return unexpected(parse_error("invalid number"));
            while (is_digit(peek())) ++pos_;
        }
        if (consume_if('.')) {
            if (!is_digit(peek())) return unexpected(parse_error("invalid number"));
            while (is_digit(peek())) ++pos_;
        }
        if (consume_if('e') || consume_if('E')) {
            if (!consume_if('+')) consume_if('-');
            if (!is_digit(peek())) return unexpected(parse_error("invalid exponent"));
            while (is_digit(peek())) ++pos_;
        }

        double value = 0;
        auto [ptr, ec] = std::from_chars(input_.data() + start, input_.data() + pos_, value);
        if (ec != std::errc{}) {
            return unexpected(parse_error("number out of range"));
        }
        return JsonValue(value);
    }

    expected<uint32_t, Error> parse_hex4() {
        if (pos_ + 4 > input_.size()) {
            return unexpected(parse_error("invalid unicode escape"));
        }
        uint32_t cp = 0;
        auto [ptr, ec] = std::from_chars(input_.data() + pos_, input_.data() + pos_ + 4, cp, 16);
        if (ec != std::errc{} || ptr != input_.data() + pos_ + 4) {
            return unexpected(parse_error("invalid unicode escape"));
        }
        pos_ += 4;
        return cp;
    }

    expected<std::string, Error> parse_string() {
        ++pos_; // opening quote
        std::string result;
        while (true) {
            if (pos_ >= input_.size()) {
                return unexpected(parse_error("unterminated string"));
            }
            char c = input_[pos_++];
            if (c == '"') break;
            if (c != '\\') {
                result += c;
                continue;
            }
            char esc = peek();
            ++pos_;
            switch (esc) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    auto cp = parse_hex4();
                    if (!cp) return unexpected(cp.error());
                    uint32_t code = *cp;
                    // Surrogate pair
                    if (code >= 0xD800 && code <= 0xDBFF && consume_if("\\u")) {
                        auto low = parse_hex4();
                        if (!low) return unexpected(low.error());
                        code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                    }
                    append_utf8(result, code);
                    break;
                }
                default:
                    return unexpected(parse_error(std::string("invalid escape \\") + esc));
            }
        }
        return result;
    }

    expected<JsonValue, Error> parse_array() {
        ++pos_;
        JsonArray arr;
        skip_whitespace();
        if (consume_if(']')) return JsonValue(std::move(arr));

        while (true) {
            auto value = parse_value();
            if (!value) return value;
            arr.push_back(std::move(*value));

            skip_whitespace();
            if (consume_if(']')) break;
            if (!consume_if(',')) return unexpected(parse_error("expected ',' or ']'"));
        }
        return JsonValue(std::move(arr));
    }

    expected<JsonValue, Error> parse_object() {
        ++pos_;
        JsonValue obj = JsonValue::object();
        skip_whitespace();
        if (consume_if('}')) return obj;

        while (true) {
            skip_whitespace();
            if (peek() != '"') return unexpected(parse_error("expected object key"));
            auto key = parse_string();
            if (!key) return unexpected(key.error());

            skip_whitespace();
            if (!consume_if(':')) return unexpected(parse_error("expected ':'"));

            auto value = parse_value();
            if (!value) return value;
            obj[*key] = std::move(*value);

            skip_whitespace();
            if (consume_if('}')) break;
            if (!consume_if(',')) return unexpected(parse_error("expected ',' or '}'"));
        }
        return obj;
    }
};

} // anonymous namespace

namespace json {

#ifdef STREAMGATE_HAS_SIMDJSON

static JsonValue convert_simdjson(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::null:
            return JsonValue(nullptr);
        case simdjson::ondemand::json_type::boolean:
            return JsonValue(bool(val.get_bool()));
        case simdjson::ondemand::json_type::number:
            return JsonValue(double(val.get_double()));
        case simdjson::ondemand::json_type::string:
            return JsonValue(std::string(val.get_string().value()));
        case simdjson::ondemand::json_type::array: {
            JsonArray arr;
            for (auto element : val.get_array()) {
                arr.push_back(convert_simdjson(element.value()));
            }
            return JsonValue(std::move(arr));
        }
        case simdjson::ondemand::json_type::object: {
            JsonValue obj = JsonValue::object();
            for (auto field : val.get_object()) {
                std::string key(field.unescaped_key().value());
                obj[key] = convert_simdjson(field.value());
            }
            return obj;
        }
    }
    return JsonValue(nullptr);
}

expected<JsonValue, Error> parse(std::string_view json) {
    if (json.empty()) {
        return unexpected(parse_error("empty input"));
    }

    simdjson::padded_string padded(json);
    auto doc = simdjson_parser.iterate(padded);
    if (doc.error()) {
        return unexpected(parse_error(simdjson::error_message(doc.error())));
    }

    try {
        return convert_simdjson(doc.get_value().value());
    } catch (const simdjson::simdjson_error& e) {
        return unexpected(parse_error(e.what()));
    }
}

#else

expected<JsonValue, Error> parse(std::string_view json) {
    if (json.empty()) {
        return unexpected(parse_error("empty input"));
    }
    return JsonParser(json).parse();
}

#endif // STREAMGATE_HAS_SIMDJSON

bool using_simdjson() noexcept {
#ifdef STREAMGATE_HAS_SIMDJSON
    return true;
#else
    return false;
#endif
}

} // namespace json

} // namespace streamgate
