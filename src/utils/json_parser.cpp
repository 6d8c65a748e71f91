#include "../../include/utils/json_parser.hpp"
#include <sstream>
#include <iomanip>
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace rendezvous {

namespace {

constexpr int kMaxDepth = 64;

bool hexToInt(char c, uint32_t& value) {
    if (c >= '0' && c <= '9') {
        value = static_cast<uint32_t>(c - '0');
        return true;
    }
    if (c >= 'a' && c <= 'f') {
        value = static_cast<uint32_t>(10 + (c - 'a'));
        return true;
    }
    if (c >= 'A' && c <= 'F') {
        value = static_cast<uint32_t>(10 + (c - 'A'));
        return true;
    }
    return false;
}

bool parseHex4(const std::string& input, size_t start, uint32_t& codepoint) {
    if (start + 4 > input.size()) {
        return false;
    }
    codepoint = 0;
    for (size_t i = 0; i < 4; i++) {
        uint32_t nibble = 0;
        if (!hexToInt(input[start + i], nibble)) {
            return false;
        }
        codepoint = (codepoint << 4) | nibble;
    }
    return true;
}

void appendUtf8(std::string& out, uint32_t codepoint) {
    if (codepoint <= 0x7F) {
        out += static_cast<char>(codepoint);
    } else if (codepoint <= 0x7FF) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0xFFFF) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += '?';
    }
}

void appendEscapedChar(const std::string& input, size_t& pos, std::string& out) {
    if (pos + 1 >= input.size()) {
        out += '\\';
        pos++;
        return;
    }

    const char esc = input[pos + 1];
    switch (esc) {
        case '"': out += '"'; pos += 2; return;
        case '\\': out += '\\'; pos += 2; return;
        case '/': out += '/'; pos += 2; return;
        case 'n': out += '\n'; pos += 2; return;
        case 'r': out += '\r'; pos += 2; return;
        case 't': out += '\t'; pos += 2; return;
        case 'b': out += '\b'; pos += 2; return;
        case 'f': out += '\f'; pos += 2; return;
        case 'u': {
            uint32_t codepoint = 0;
            if (!parseHex4(input, pos + 2, codepoint)) {
                out += 'u';
                pos += 2;
                return;
            }
            pos += 6;
            if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                if (pos + 1 < input.size() && input[pos] == '\\' && input[pos + 1] == 'u') {
                    uint32_t low = 0;
                    if (parseHex4(input, pos + 2, low) && low >= 0xDC00 && low <= 0xDFFF) {
                        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                        pos += 6;
                    }
                }
            }
            appendUtf8(out, codepoint);
            return;
        }
        default:
            out += esc;
            pos += 2;
            return;
    }
}

// Validating scanner over a JSON document. Every scan* method leaves pos_
// just past the value it consumed.
class Scanner {
public:
    explicit Scanner(const std::string& input) : input_(input), pos_(0) {}

    size_t pos() const { return pos_; }

    void skipWhitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            pos_++;
        }
    }

    bool atEnd() {
        skipWhitespace();
        return pos_ >= input_.size();
    }

    char peek() {
        skipWhitespace();
        if (pos_ >= input_.size()) {
            fail("unexpected end of input");
        }
        return input_[pos_];
    }

    void expect(char c) {
        if (peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        pos_++;
    }

    // Returns the unescaped string contents
    std::string scanString() {
        expect('"');
        std::string out;
        while (pos_ < input_.size() && input_[pos_] != '"') {
            const char c = input_[pos_];
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("control character in string");
            }
            if (c == '\\') {
                appendEscapedChar(input_, pos_, out);
                continue;
            }
            out += c;
            pos_++;
        }
        if (pos_ >= input_.size()) {
            fail("unterminated string");
        }
        pos_++;
        return out;
    }

    // Returns the raw text of the value
    std::string scanValue(int depth = 0) {
        if (depth > kMaxDepth) {
            fail("nesting too deep");
        }
        const char c = peek();
        const size_t start = pos_;
        if (c == '"') {
            scanString();
        } else if (c == '{') {
            pos_++;
            if (peek() == '}') {
                pos_++;
            } else {
                while (true) {
                    scanString();
                    expect(':');
                    scanValue(depth + 1);
                    const char next = peek();
                    pos_++;
                    if (next == '}') break;
                    if (next != ',') fail("expected ',' or '}'");
                }
            }
        } else if (c == '[') {
            pos_++;
            if (peek() == ']') {
                pos_++;
            } else {
                while (true) {
                    scanValue(depth + 1);
                    const char next = peek();
                    pos_++;
                    if (next == ']') break;
                    if (next != ',') fail("expected ',' or ']'");
                }
            }
        } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            scanNumber();
        } else {
            scanLiteral();
        }
        return input_.substr(start, pos_ - start);
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw std::invalid_argument("Malformed JSON at offset " + std::to_string(pos_) + ": " + what);
    }

private:
    const std::string& input_;
    size_t pos_;

    void scanNumber() {
        if (input_[pos_] == '-') pos_++;
        size_t digits = 0;
        while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
            pos_++;
            digits++;
        }
        if (digits == 0) fail("invalid number");
        if (pos_ < input_.size() && input_[pos_] == '.') {
            pos_++;
            digits = 0;
            while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
                pos_++;
                digits++;
            }
            if (digits == 0) fail("invalid fraction");
        }
        if (pos_ < input_.size() && (input_[pos_] == 'e' || input_[pos_] == 'E')) {
            pos_++;
            if (pos_ < input_.size() && (input_[pos_] == '+' || input_[pos_] == '-')) pos_++;
            digits = 0;
            while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
                pos_++;
                digits++;
            }
            if (digits == 0) fail("invalid exponent");
        }
    }

    void scanLiteral() {
        static const char* const kLiterals[] = {"true", "false", "null"};
        for (const char* literal : kLiterals) {
            const std::string word(literal);
            if (input_.compare(pos_, word.size(), word) == 0) {
                pos_ += word.size();
                return;
            }
        }
        fail("unexpected token");
    }
};

} // namespace

std::map<std::string, JsonField> JsonParser::parseObject(const std::string& json) {
    std::map<std::string, JsonField> result;
    Scanner scanner(json);

    scanner.expect('{');
    if (scanner.peek() == '}') {
        scanner.expect('}');
    } else {
        while (true) {
            std::string key = scanner.scanString();
            scanner.expect(':');
            JsonField field;
            if (scanner.peek() == '"') {
                field.value = scanner.scanString();
                field.is_string = true;
            } else {
                field.value = scanner.scanValue(1);
            }
            result[key] = std::move(field);

            const char next = scanner.peek();
            if (next == '}') {
                scanner.expect('}');
                break;
            }
            scanner.expect(',');
        }
    }
    if (!scanner.atEnd()) {
        scanner.fail("trailing characters");
    }
    return result;
}

std::map<std::string, std::string> JsonParser::parse(const std::string& json) {
    std::map<std::string, std::string> result;
    for (auto& pair : parseObject(json)) {
        result[pair.first] = pair.second.value;
    }
    return result;
}

std::vector<std::string> JsonParser::parseArray(const std::string& json) {
    std::vector<std::string> result;
    Scanner scanner(json);

    scanner.expect('[');
    if (scanner.peek() == ']') {
        scanner.expect(']');
    } else {
        while (true) {
            result.push_back(scanner.scanValue(1));
            const char next = scanner.peek();
            if (next == ']') {
                scanner.expect(']');
                break;
            }
            scanner.expect(',');
        }
    }
    if (!scanner.atEnd()) {
        scanner.fail("trailing characters");
    }
    return result;
}

std::vector<std::string> JsonParser::parseStringArray(const std::string& json) {
    std::vector<std::string> result;
    for (const auto& raw : parseArray(json)) {
        if (raw.empty() || raw.front() != '"') {
            throw std::invalid_argument("Expected an array of strings");
        }
        result.push_back(unescapeJson(raw.substr(1, raw.size() - 2)));
    }
    return result;
}

bool JsonParser::isValid(const std::string& json) {
    try {
        Scanner scanner(json);
        scanner.scanValue();
        return scanner.atEnd();
    } catch (const std::invalid_argument&) {
        return false;
    }
}

bool JsonParser::isObject(const std::string& json) {
    try {
        parseObject(json);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

std::string JsonParser::stringify(const std::map<std::string, std::string>& data) {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& pair : data) {
        if (!first) oss << ",";
        first = false;
        oss << quote(pair.first) << ":" << quote(pair.second);
    }

    oss << "}";
    return oss.str();
}

std::string JsonParser::createResponse(bool success, const std::string& message, const std::map<std::string, std::string>& data) {
    std::ostringstream oss;
    oss << "{\"success\":" << (success ? "true" : "false")
        << ",\"message\":" << quote(message);

    if (!data.empty()) {
        oss << ",\"data\":" << stringify(data);
    }

    oss << "}";
    return oss.str();
}

std::string JsonParser::createErrorResponse(const std::string& code, const std::string& message) {
    std::ostringstream oss;
    oss << "{\"success\":false,\"error\":{\"code\":" << quote(code)
        << ",\"message\":" << quote(message) << "}}";
    return oss.str();
}

std::string JsonParser::createSuccessResponse(const std::string& message, const std::map<std::string, std::string>& data) {
    return createResponse(true, message, data);
}

std::string JsonParser::escapeJson(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    result += oss.str();
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

std::string JsonParser::unescapeJson(const std::string& str) {
    std::string result;
    for (size_t i = 0; i < str.length();) {
        if (str[i] == '\\') {
            appendEscapedChar(str, i, result);
            continue;
        }
        result += str[i];
        i++;
    }
    return result;
}

std::string JsonParser::quote(const std::string& str) {
    return "\"" + escapeJson(str) + "\"";
}

std::string JsonParser::getString(const std::map<std::string, JsonField>& fields, const std::string& key,
                                  const std::string& fallback) {
    auto it = fields.find(key);
    if (it == fields.end() || it->second.isNull()) {
        return fallback;
    }
    if (!it->second.is_string) {
        throw std::invalid_argument("Field '" + key + "' must be a string");
    }
    return it->second.value;
}

int64_t JsonParser::getInt(const std::map<std::string, JsonField>& fields, const std::string& key, int64_t fallback) {
    auto it = fields.find(key);
    if (it == fields.end() || it->second.isNull()) {
        return fallback;
    }
    const std::string& text = it->second.value;
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return static_cast<int64_t>(value);
    } catch (const std::exception&) {
        throw std::invalid_argument("Field '" + key + "' must be an integer");
    }
}

bool JsonParser::getBool(const std::map<std::string, JsonField>& fields, const std::string& key, bool fallback) {
    auto it = fields.find(key);
    if (it == fields.end() || it->second.isNull()) {
        return fallback;
    }
    if (!it->second.is_string) {
        if (it->second.value == "true") return true;
        if (it->second.value == "false") return false;
    }
    throw std::invalid_argument("Field '" + key + "' must be a boolean");
}

std::string JsonParser::getRaw(const std::map<std::string, JsonField>& fields, const std::string& key,
                               const std::string& fallback) {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return fallback;
    }
    return it->second.is_string ? quote(it->second.value) : it->second.value;
}

} // namespace rendezvous
