#include "restprobe/json/Json.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>
#include <system_error>
#include <utility>

namespace restprobe::json {

namespace {

constexpr std::size_t kMaxDepth = 256;

class Parser {
public:
    explicit Parser(std::string_view input) : input_(input) {}

    Value parse() {
        skip_whitespace();
        Value value = parse_value();
        skip_whitespace();
        if (!eof()) {
            fail("Unexpected trailing data after JSON document");
        }
        return value;
    }

private:
    [[noreturn]] void fail(const std::string& message) const {
        throw ParseError(message, pos_);
    }

    Value parse_value() {
        if (eof()) {
            fail("Unexpected end of JSON input");
        }
        const char ch = peek();
        if (ch == '"') {
            return Value(parse_string());
        }
        if (ch == '{') {
            return parse_object();
        }
        if (ch == '[') {
            return parse_array();
        }
        if (ch == 't' || ch == 'f') {
            return parse_boolean();
        }
        if (ch == 'n') {
            return parse_null();
        }
        if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch)) != 0) {
            return parse_number();
        }
        fail("Invalid JSON token start");
    }

    Value parse_object() {
        DepthGuard guard(*this);
        Value value = Value::make_object();
        expect('{');
        skip_whitespace();
        if (match('}')) {
            return value;
        }
        while (true) {
            skip_whitespace();
            if (eof() || peek() != '"') {
                fail("Expected string key in object");
            }
            std::string key = parse_string();
            skip_whitespace();
            expect(':');
            skip_whitespace();
            value.object_value.insert_or_assign(std::move(key), parse_value());
            skip_whitespace();
            if (match('}')) {
                break;
            }
            expect(',');
        }
        return value;
    }

    Value parse_array() {
        DepthGuard guard(*this);
        Value value = Value::make_array();
        expect('[');
        skip_whitespace();
        if (match(']')) {
            return value;
        }
        while (true) {
            skip_whitespace();
            value.array_value.push_back(parse_value());
            skip_whitespace();
            if (match(']')) {
                break;
            }
            expect(',');
        }
        return value;
    }

    Value parse_boolean() {
        if (match_literal("true")) {
            return Value(true);
        }
        if (match_literal("false")) {
            return Value(false);
        }
        fail("Invalid boolean literal");
    }

    Value parse_null() {
        if (!match_literal("null")) {
            fail("Invalid null literal");
        }
        return Value();
    }

    Value parse_number() {
        const std::size_t start = pos_;
        match('-');
        if (match('0')) {
            // a leading zero stands alone
        } else if (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
            consume_digits();
        } else {
            fail("Invalid number literal");
        }
        bool fractional = false;
        if (match('.')) {
            fractional = true;
            if (eof() || std::isdigit(static_cast<unsigned char>(peek())) == 0) {
                fail("Invalid fractional number");
            }
            consume_digits();
        }
        if (!eof() && (peek() == 'e' || peek() == 'E')) {
            fractional = true;
            ++pos_;
            if (!eof() && (peek() == '+' || peek() == '-')) {
                ++pos_;
            }
            if (eof() || std::isdigit(static_cast<unsigned char>(peek())) == 0) {
                fail("Invalid exponent in number");
            }
            consume_digits();
        }

        const std::string_view token = input_.substr(start, pos_ - start);
        if (!fractional) {
            std::int64_t integer = 0;
            const auto result = std::from_chars(token.data(), token.data() + token.size(), integer);
            if (result.ec == std::errc{} && result.ptr == token.data() + token.size()) {
                return Value(integer);
            }
        }

        const std::string buffer(token);
        char* end = nullptr;
        // strtod maps overflow to +/-HUGE_VAL and underflow to zero or a subnormal.
        const double parsed = std::strtod(buffer.c_str(), &end);
        if (end != buffer.c_str() + buffer.size()) {
            fail("Unable to parse number literal");
        }
        Value value(parsed);
        if (!fractional) {
            value.number_literal = buffer;
        }
        return value;
    }

    std::string parse_string() {
        expect('"');
        std::string output;
        while (true) {
            if (eof()) {
                fail("Unterminated string literal");
            }
            const char ch = get();
            if (ch == '"') {
                break;
            }
            if (ch == '\\') {
                if (eof()) {
                    fail("Unterminated escape sequence");
                }
                const char esc = get();
                switch (esc) {
                    case '"':
                    case '\\':
                    case '/':
                        output.push_back(esc);
                        break;
                    case 'b':
                        output.push_back('\b');
                        break;
                    case 'f':
                        output.push_back('\f');
                        break;
                    case 'n':
                        output.push_back('\n');
                        break;
                    case 'r':
                        output.push_back('\r');
                        break;
                    case 't':
                        output.push_back('\t');
                        break;
                    case 'u':
                        append_utf8(parse_unicode_escape(), output);
                        break;
                    default:
                        fail("Invalid escape sequence in string");
                }
            } else {
                if (static_cast<unsigned char>(ch) < 0x20) {
                    fail("Control characters must be escaped in JSON strings");
                }
                output.push_back(ch);
            }
        }
        return output;
    }

    unsigned int parse_hex_quad() {
        if (pos_ + 4 > input_.size()) {
            fail("Truncated unicode escape");
        }
        unsigned int codepoint = 0;
        for (int i = 0; i < 4; ++i) {
            const char ch = get();
            codepoint <<= 4;
            if (ch >= '0' && ch <= '9') {
                codepoint |= static_cast<unsigned int>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                codepoint |= static_cast<unsigned int>(10 + ch - 'a');
            } else if (ch >= 'A' && ch <= 'F') {
                codepoint |= static_cast<unsigned int>(10 + ch - 'A');
            } else {
                fail("Invalid unicode escape");
            }
        }
        return codepoint;
    }

    unsigned int parse_unicode_escape() {
        const unsigned int high = parse_hex_quad();
        if (high < 0xD800 || high > 0xDBFF) {
            return high;
        }
        // UTF-16 surrogate pair
        if (!match_literal("\\u")) {
            fail("Unpaired surrogate in unicode escape");
        }
        const unsigned int low = parse_hex_quad();
        if (low < 0xDC00 || low > 0xDFFF) {
            fail("Invalid low surrogate in unicode escape");
        }
        return 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00);
    }

    static void append_utf8(unsigned int codepoint, std::string& out) {
        if (codepoint <= 0x7F) {
            out.push_back(static_cast<char>(codepoint));
        } else if (codepoint <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((codepoint >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else if (codepoint <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((codepoint >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((codepoint >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        }
    }

    void consume_digits() {
        while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
            ++pos_;
        }
    }

    void expect(char expected) {
        if (eof() || input_[pos_] != expected) {
            fail(std::string("Expected '") + expected + "' in JSON input");
        }
        ++pos_;
    }

    bool match(char expected) {
        if (!eof() && input_[pos_] == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool match_literal(std::string_view literal) {
        if (input_.substr(pos_, literal.size()) == literal) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    void skip_whitespace() {
        while (!eof()) {
            const char ch = input_[pos_];
            if (ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t') {
                ++pos_;
                continue;
            }
            break;
        }
    }

    bool eof() const {
        return pos_ >= input_.size();
    }

    char peek() const {
        return input_[pos_];
    }

    char get() {
        return input_[pos_++];
    }

    struct DepthGuard {
        explicit DepthGuard(Parser& parser) : parser_(parser) {
            if (++parser_.depth_ > kMaxDepth) {
                parser_.fail("JSON document nested too deeply");
            }
        }
        ~DepthGuard() {
            --parser_.depth_;
        }
        Parser& parser_;
    };

    std::string_view input_;
    std::size_t pos_{0};
    std::size_t depth_{0};
};

}  // namespace

std::map<std::string, Value>& Value::ensure_object() {
    if (type != ValueType::Object) {
        type = ValueType::Object;
        object_value.clear();
        array_value.clear();
        string_value.clear();
    }
    return object_value;
}

const Value* Value::find(std::string_view key) const {
    if (!is_object()) {
        return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    if (it == object_value.end()) {
        return nullptr;
    }
    return &it->second;
}

ParseError::ParseError(const std::string& message, std::size_t offset)
    : std::runtime_error(message + " (offset " + std::to_string(offset) + ")"),
      offset_(offset) {}

Value parse(std::string_view text) {
    Parser parser(text);
    return parser.parse();
}

bool try_parse(std::string_view text, Value& output, std::string& error_message) {
    try {
        output = parse(text);
        return true;
    } catch (const ParseError& ex) {
        error_message = ex.what();
        return false;
    }
}

}  // namespace restprobe::json
