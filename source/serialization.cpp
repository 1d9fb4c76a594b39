// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.cpp
/// @brief JSON serialization / deserialization for Value.

#include <sync_tree/serialization.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace sync_tree {

namespace {

// ============================================================
// Writing
// ============================================================

std::string json_escape_string(std::string_view s)
{
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

void write_number(double d, std::ostringstream& oss)
{
    if (!std::isfinite(d)) {
        oss << "null";
        return;
    }
    oss << std::setprecision(15) << d;
}

void write_priority(const Priority& p, std::ostringstream& oss)
{
    if (auto* num = std::get_if<double>(&p)) {
        write_number(*num, oss);
    } else if (auto* str = std::get_if<std::string>(&p)) {
        oss << "\"" << json_escape_string(*str) << "\"";
    } else {
        oss << "null";
    }
}

void write_scalar(const Value& val, std::ostringstream& oss)
{
    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            write_number(arg, oss);
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else {
            oss << "null";
        }
    }, val.data);
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level)
{
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    auto* m = val.get_if<ValueMap>();

    if (!m) {
        if (!has_priority(val.priority) || val.is_null()) {
            write_scalar(val, oss);
            return;
        }
        // Prioritised leaf: {".priority": p, ".value": v}
        oss << "{" << newline
            << child_indent << "\"" << priority_key << "\":" << space_after_colon;
        write_priority(val.priority, oss);
        oss << "," << newline
            << child_indent << "\"" << value_key << "\":" << space_after_colon;
        write_scalar(val, oss);
        oss << newline << indent << "}";
        return;
    }

    if (m->size() == 0 && !has_priority(val.priority)) {
        oss << "{}";
        return;
    }

    std::vector<std::string> keys;
    keys.reserve(m->size());
    for (const auto& [k, v] : *m) {
        keys.push_back(k);
    }
    std::sort(keys.begin(), keys.end());

    oss << "{" << newline;
    bool first = true;
    if (has_priority(val.priority)) {
        oss << child_indent << "\"" << priority_key << "\":" << space_after_colon;
        write_priority(val.priority, oss);
        first = false;
    }
    for (const auto& k : keys) {
        if (!first) oss << "," << newline;
        first = false;
        oss << child_indent << "\"" << json_escape_string(k) << "\":" << space_after_colon;
        to_json_impl(m->find(k)->get(), oss, compact, indent_level + 1);
    }
    oss << newline << indent << "}";
}

// ============================================================
// Simple JSON Parser
// ============================================================

class JsonParser {
public:
    explicit JsonParser(std::string_view json) : json_(json), pos_(0) {}

    Value parse(std::string* error_out) {
        try {
            skip_whitespace();
            if (pos_ >= json_.size()) {
                if (error_out) *error_out = "Empty JSON input";
                return Value{};
            }
            Value result = parse_value();
            skip_whitespace();
            if (pos_ < json_.size()) {
                throw std::runtime_error("Unexpected trailing characters at position " + std::to_string(pos_));
            }
            return result;
        } catch (const std::exception& e) {
            if (error_out) *error_out = e.what();
            return Value{};
        }
    }

private:
    std::string_view json_;
    std::size_t pos_;
    std::size_t depth_ = 0;

    // Bounds recursion for objects and arrays
    class DepthGuard {
    public:
        explicit DepthGuard(std::size_t& depth) : depth_(depth) {
            if (++depth_ > max_json_depth) {
                throw std::runtime_error("JSON nesting too deep (limit " + std::to_string(max_json_depth) + ")");
            }
        }
        ~DepthGuard() { --depth_; }

        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        std::size_t& depth_;
    };

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    void skip_whitespace() {
        while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
            ++pos_;
        }
    }

    void expect(char c) {
        skip_whitespace();
        if (consume() != c) {
            throw std::runtime_error(std::string("Expected '") + c + "' at position " + std::to_string(pos_));
        }
    }

    Value parse_value() {
        skip_whitespace();
        char c = peek();

        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return parse_string();
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();

        if (c == '\0') {
            throw std::runtime_error("Unexpected end of input at position " + std::to_string(pos_));
        }
        throw std::runtime_error("Unexpected character '" + std::string(1, c) + "' at position " + std::to_string(pos_));
    }

    static Priority to_priority(const Value& v) {
        if (v.is_null()) return std::monostate{};
        if (v.is_number()) return v.as_number();
        if (auto* s = v.get_if<std::string>()) return *s;
        throw std::runtime_error("'.priority' must be a number, a string or null");
    }

    Value parse_object() {
        DepthGuard guard(depth_);
        expect('{');
        skip_whitespace();

        if (peek() == '}') {
            consume();
            return Value{ValueMap{}};
        }

        auto transient = ValueMap{}.transient();
        Priority priority;
        std::optional<Value> scalar;

        while (true) {
            skip_whitespace();
            std::string key = parse_string_raw();
            expect(':');
            Value val = parse_value();

            if (key == priority_key) {
                priority = to_priority(val);
            } else if (key == value_key) {
                if (val.is_map()) {
                    throw std::runtime_error("'.value' must hold a scalar");
                }
                scalar = std::move(val);
            } else {
                transient.set(std::move(key), ValueBox{std::move(val)});
            }

            skip_whitespace();
            char c = peek();
            if (c == '}') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or '}' in object at position " + std::to_string(pos_));
            }
            consume();
        }

        if (scalar) {
            if (transient.size() != 0) {
                throw std::runtime_error("'.value' cannot be combined with other children");
            }
            return scalar->with_priority(std::move(priority));
        }
        return Value{transient.persistent()}.with_priority(std::move(priority));
    }

    // Arrays become maps keyed by index
    Value parse_array() {
        DepthGuard guard(depth_);
        expect('[');
        skip_whitespace();

        if (peek() == ']') {
            consume();
            return Value{ValueMap{}};
        }

        auto transient = ValueMap{}.transient();
        std::size_t index = 0;

        while (true) {
            Value val = parse_value();
            transient.set(std::to_string(index++), ValueBox{std::move(val)});

            skip_whitespace();
            char c = peek();
            if (c == ']') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or ']' in array at position " + std::to_string(pos_));
            }
            consume();
        }

        return Value{transient.persistent()};
    }

    static int hex_digit(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::runtime_error("Invalid unicode escape");
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            throw std::runtime_error("Invalid unicode escape");
        }
        unsigned codepoint = 0;
        for (int i = 0; i < 4; ++i) {
            codepoint = (codepoint << 4) | static_cast<unsigned>(hex_digit(json_[pos_++]));
        }
        return codepoint;
    }

    static void append_utf8(std::string& out, unsigned codepoint) {
        if (codepoint < 0x80) {
            out += static_cast<char>(codepoint);
        } else if (codepoint < 0x800) {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else if (codepoint < 0x10000) {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
    }

    std::string parse_string_raw() {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            char c = consume();
            if (c == '"') {
                return result;
            }
            if (c == '\\') {
                if (pos_ >= json_.size()) {
                    throw std::runtime_error("Unexpected end of string escape");
                }
                char escaped = consume();
                switch (escaped) {
                    case '"':  result += '"'; break;
                    case '\\': result += '\\'; break;
                    case '/':  result += '/'; break;
                    case 'b':  result += '\b'; break;
                    case 'f':  result += '\f'; break;
                    case 'n':  result += '\n'; break;
                    case 'r':  result += '\r'; break;
                    case 't':  result += '\t'; break;
                    case 'u': {
                        unsigned codepoint = parse_hex4();
                        if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
                            throw std::runtime_error("Unpaired low surrogate in unicode escape");
                        }
                        // Surrogate pair
                        if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                            if (json_.substr(pos_, 2) != "\\u") {
                                throw std::runtime_error("Unpaired high surrogate in unicode escape");
                            }
                            pos_ += 2;
                            unsigned low = parse_hex4();
                            if (low < 0xDC00 || low > 0xDFFF) {
                                throw std::runtime_error("Invalid low surrogate in unicode escape");
                            }
                            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                        }
                        append_utf8(result, codepoint);
                        break;
                    }
                    default:
                        throw std::runtime_error("Invalid escape sequence: \\" + std::string(1, escaped));
                }
            } else {
                result += c;
            }
        }

        throw std::runtime_error("Unterminated string");
    }

    Value parse_string() {
        return Value{parse_string_raw()};
    }

    Value parse_number() {
        std::size_t start = pos_;
        bool has_decimal = false;
        bool has_exponent = false;

        if (peek() == '-') consume();

        while (pos_ < json_.size()) {
            char c = peek();
            if (std::isdigit(static_cast<unsigned char>(c))) {
                consume();
            } else if (c == '.' && !has_decimal && !has_exponent) {
                has_decimal = true;
                consume();
            } else if ((c == 'e' || c == 'E') && !has_exponent) {
                has_exponent = true;
                consume();
                if (peek() == '+' || peek() == '-') consume();
            } else {
                break;
            }
        }

        std::string num_str{json_.substr(start, pos_ - start)};

        if (!has_decimal && !has_exponent) {
            int64_t val = 0;
            auto [ptr, ec] = std::from_chars(num_str.data(), num_str.data() + num_str.size(), val);
            if (ec == std::errc{} && ptr == num_str.data() + num_str.size()) {
                return Value{val};
            }
        }
        // Out-of-range integers fall through to double
        return Value{std::stod(num_str)};
    }

    Value parse_bool() {
        if (json_.substr(pos_, 4) == "true") {
            pos_ += 4;
            return Value{true};
        }
        if (json_.substr(pos_, 5) == "false") {
            pos_ += 5;
            return Value{false};
        }
        throw std::runtime_error("Expected 'true' or 'false' at position " + std::to_string(pos_));
    }

    Value parse_null() {
        if (json_.substr(pos_, 4) == "null") {
            pos_ += 4;
            return Value{};
        }
        throw std::runtime_error("Expected 'null' at position " + std::to_string(pos_));
    }
};

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

} // anonymous namespace

std::string to_json(const Value& val, bool compact)
{
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

Value from_json(std::string_view json_str, std::string* error_out)
{
    if (error_out) error_out->clear();
    JsonParser parser(json_str);
    return parser.parse(error_out);
}

Value prune_nulls(const Value& val)
{
    auto* m = val.get_if<ValueMap>();
    if (!m) {
        return val;
    }
    auto result = *m;
    for (const auto& [k, v] : *m) {
        if (v->is_null()) {
            result = result.erase(k);
        } else if (v->is_map()) {
            result = result.set(k, ValueBox{prune_nulls(*v)});
        }
    }
    return Value{std::move(result)}.with_priority(val.priority);
}

std::optional<Value> parse_payload(std::string_view raw, std::string* error_out)
{
    std::string_view trimmed = trim(raw);
    if (trimmed.empty() || trimmed.front() != '{') {
        return Value{std::string{raw}};
    }

    std::string error;
    Value parsed = from_json(trimmed, &error);
    if (!error.empty()) {
        detail::log_access_error("parse_payload", error);
        if (error_out) *error_out = std::move(error);
        return std::nullopt;
    }
    return parsed;
}

std::string priority_to_json(const Priority& priority)
{
    std::ostringstream oss;
    write_priority(priority, oss);
    return oss.str();
}

Priority parse_priority(std::string_view text)
{
    std::string_view trimmed = trim(text);
    if (trimmed.empty() || trimmed == "null") {
        return std::monostate{};
    }

    if (trimmed.front() == '"') {
        std::string error;
        Value v = from_json(trimmed, &error);
        if (error.empty()) {
            if (auto* s = v.get_if<std::string>()) return *s;
        }
        return std::string{trimmed};
    }

    std::string num_str{trimmed};
    char* end = nullptr;
    double d = std::strtod(num_str.c_str(), &end);
    if (end == num_str.c_str() + num_str.size() && std::isfinite(d)) {
        return d;
    }
    return std::string{trimmed};
}

} // namespace sync_tree
