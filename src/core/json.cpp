// Orexa - Game Server Supervisor
// Minimal JSON document model, parser and writer

#include "orexa/core/json.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace orexa {
namespace core {

// =============================================================================
// JsonValue
// =============================================================================

JsonValue JsonValue::makeBool(bool v) {
    JsonValue value;
    value.type = JsonType::Boolean;
    value.boolValue = v;
    return value;
}

JsonValue JsonValue::makeNumber(double v) {
    JsonValue value;
    value.type = JsonType::Number;
    value.numberValue = v;
    return value;
}

JsonValue JsonValue::makeString(std::string v) {
    JsonValue value;
    value.type = JsonType::String;
    value.stringValue = std::move(v);
    return value;
}

JsonValue JsonValue::makeArray() {
    JsonValue value;
    value.type = JsonType::Array;
    return value;
}

JsonValue JsonValue::makeObject() {
    JsonValue value;
    value.type = JsonType::Object;
    return value;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    static const JsonValue nullValue;
    if (!isObject()) return nullValue;
    auto it = objectValue.find(key);
    return it != objectValue.end() ? it->second : nullValue;
}

JsonValue& JsonValue::set(const std::string& key, JsonValue value) {
    if (type == JsonType::Null) {
        type = JsonType::Object;
    }
    objectValue[key] = std::move(value);
    return *this;
}

JsonValue& JsonValue::push(JsonValue value) {
    if (type == JsonType::Null) {
        type = JsonType::Array;
    }
    arrayValue.push_back(std::move(value));
    return *this;
}

namespace {

// =============================================================================
// JSON Parser
// =============================================================================

void appendUtf8(std::string& out, uint32_t cp) {
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

class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input), pos_(0) {}

    Result<JsonValue, JsonError> parse() {
        skipWhitespace();
        if (pos_ >= input_.size()) {
            return fail("Empty document");
        }
        auto result = parseValue(0);
        if (result.isError()) {
            return result;
        }
        skipWhitespace();
        if (pos_ < input_.size()) {
            return fail("Unexpected characters after JSON value");
        }
        return result;
    }

private:
    static constexpr int kMaxDepth = 64;

    const std::string& input_;
    size_t pos_;

    Result<JsonValue, JsonError> fail(const std::string& message) const {
        int line = 1;
        for (size_t i = 0; i < pos_ && i < input_.size(); ++i) {
            if (input_[i] == '\n') line++;
        }
        return Result<JsonValue, JsonError>::error(JsonError(message, line));
    }

    void skipWhitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            pos_++;
        }
    }

    char peek() const {
        return pos_ < input_.size() ? input_[pos_] : '\0';
    }

    char consume() {
        return pos_ < input_.size() ? input_[pos_++] : '\0';
    }

    bool match(char c) {
        if (peek() == c) {
            consume();
            return true;
        }
        return false;
    }

    Result<JsonValue, JsonError> parseValue(int depth) {
        if (depth > kMaxDepth) {
            return fail("Nesting too deep");
        }
        skipWhitespace();
        char c = peek();

        if (c == '"') return parseString();
        if (c == '{') return parseObject(depth);
        if (c == '[') return parseArray(depth);
        if (c == 't' || c == 'f') return parseBool();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();

        return fail(std::string("Unexpected character: ") + (c == '\0' ? std::string("<eof>") : std::string(1, c)));
    }

    bool parseHex4(uint32_t& out) {
        if (pos_ + 4 > input_.size()) return false;
        out = 0;
        for (int i = 0; i < 4; ++i) {
            char h = input_[pos_++];
            out <<= 4;
            if (h >= '0' && h <= '9') out |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') out |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') out |= static_cast<uint32_t>(h - 'A' + 10);
            else return false;
        }
        return true;
    }

    Result<JsonValue, JsonError> parseString() {
        if (!match('"')) {
            return fail("Expected '\"'");
        }

        std::string result;
        while (pos_ < input_.size() && peek() != '"') {
            char c = consume();
            if (c != '\\') {
                result += c;
                continue;
            }
            char escaped = consume();
            switch (escaped) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    uint32_t cp = 0;
                    if (!parseHex4(cp)) {
                        return fail("Invalid \\u escape");
                    }
                    // Surrogate pair
                    if (cp >= 0xD800 && cp <= 0xDBFF && input_.compare(pos_, 2, "\\u") == 0) {
                        pos_ += 2;
                        uint32_t low = 0;
                        if (!parseHex4(low) || low < 0xDC00 || low > 0xDFFF) {
                            return fail("Invalid surrogate pair");
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    appendUtf8(result, cp);
                    break;
                }
                default:
                    return fail(std::string("Invalid escape: \\") + escaped);
            }
        }

        if (!match('"')) {
            return fail("Unterminated string");
        }
        return Result<JsonValue, JsonError>::success(JsonValue::makeString(std::move(result)));
    }

    Result<JsonValue, JsonError> parseNumber() {
        size_t start = pos_;
        if (peek() == '-') consume();

        while (std::isdigit(static_cast<unsigned char>(peek()))) consume();

        if (peek() == '.') {
            consume();
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        if (peek() == 'e' || peek() == 'E') {
            consume();
            if (peek() == '+' || peek() == '-') consume();
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        std::string numStr = input_.substr(start, pos_ - start);
        char* end = nullptr;
        double parsed = std::strtod(numStr.c_str(), &end);
        if (numStr.empty() || end == nullptr || *end != '\0') {
            return fail("Invalid number: " + numStr);
        }
        return Result<JsonValue, JsonError>::success(JsonValue::makeNumber(parsed));
    }

    Result<JsonValue, JsonError> parseBool() {
        if (input_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return Result<JsonValue, JsonError>::success(JsonValue::makeBool(true));
        }
        if (input_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return Result<JsonValue, JsonError>::success(JsonValue::makeBool(false));
        }
        return fail("Expected 'true' or 'false'");
    }

    Result<JsonValue, JsonError> parseNull() {
        if (input_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return Result<JsonValue, JsonError>::success(JsonValue{});
        }
        return fail("Expected 'null'");
    }

    Result<JsonValue, JsonError> parseArray(int depth) {
        consume();  // '['
        JsonValue value = JsonValue::makeArray();

        skipWhitespace();
        if (match(']')) {
            return Result<JsonValue, JsonError>::success(std::move(value));
        }

        while (true) {
            auto element = parseValue(depth + 1);
            if (element.isError()) {
                return element;
            }
            value.arrayValue.push_back(std::move(element).value());

            skipWhitespace();
            if (match(']')) break;
            if (!match(',')) {
                return fail("Expected ',' or ']' in array");
            }
        }

        return Result<JsonValue, JsonError>::success(std::move(value));
    }

    Result<JsonValue, JsonError> parseObject(int depth) {
        consume();  // '{'
        JsonValue value = JsonValue::makeObject();

        skipWhitespace();
        if (match('}')) {
            return Result<JsonValue, JsonError>::success(std::move(value));
        }

        while (true) {
            skipWhitespace();
            if (peek() != '"') {
                return fail("Expected string key in object");
            }
            auto key = parseString();
            if (key.isError()) {
                return key;
            }

            skipWhitespace();
            if (!match(':')) {
                return fail("Expected ':' after key");
            }

            auto member = parseValue(depth + 1);
            if (member.isError()) {
                return member;
            }
            value.objectValue[key.value().stringValue] = std::move(member).value();

            skipWhitespace();
            if (match('}')) break;
            if (!match(',')) {
                return fail("Expected ',' or '}' in object");
            }
        }

        return Result<JsonValue, JsonError>::success(std::move(value));
    }
};

// =============================================================================
// YAML Subset Parser
// =============================================================================

class YamlParser {
public:
    explicit YamlParser(const std::string& input) {
        std::istringstream stream(input);
        std::string line;
        while (std::getline(stream, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines_.push_back(line);
        }
    }

    Result<JsonValue, JsonError> parse() {
        JsonValue root = JsonValue::makeObject();
        std::string err;
        int errLine = -1;
        if (!parseMapping(root, 0, lines_.size(), err, errLine)) {
            return Result<JsonValue, JsonError>::error(JsonError(err, errLine));
        }
        return Result<JsonValue, JsonError>::success(std::move(root));
    }

private:
    std::vector<std::string> lines_;

    static size_t indentOf(const std::string& line) {
        size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') indent++;
        return indent;
    }

    static std::string stripComment(const std::string& s) {
        bool inSingle = false;
        bool inDouble = false;
        for (size_t i = 0; i < s.size(); ++i) {
            char c = s[i];
            if (c == '\'' && !inDouble) inSingle = !inSingle;
            else if (c == '"' && !inSingle) inDouble = !inDouble;
            else if (c == '#' && !inSingle && !inDouble &&
                     (i == 0 || std::isspace(static_cast<unsigned char>(s[i - 1])))) {
                return s.substr(0, i);
            }
        }
        return s;
    }

    static std::string trimmed(const std::string& s) {
        size_t start = 0;
        while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
        size_t end = s.size();
        while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
        return s.substr(start, end - start);
    }

    bool isBlank(size_t i) const {
        return trimmed(stripComment(lines_[i])).empty();
    }

    bool parseMapping(JsonValue& obj, size_t startLine, size_t endLine,
                      std::string& err, int& errLine) {
        size_t i = startLine;
        size_t baseIndent = std::string::npos;
        while (i < endLine) {
            if (isBlank(i)) {
                i++;
                continue;
            }

            size_t indent = indentOf(lines_[i]);
            if (baseIndent == std::string::npos) {
                baseIndent = indent;
            } else if (indent != baseIndent) {
                err = "Inconsistent indentation";
                errLine = static_cast<int>(i + 1);
                return false;
            }

            std::string line = trimmed(stripComment(lines_[i]));
            size_t colonPos = line.find(':');
            if (colonPos == std::string::npos) {
                err = "Expected 'key: value'";
                errLine = static_cast<int>(i + 1);
                return false;
            }

            std::string key = trimmed(line.substr(0, colonPos));
            std::string valueStr = trimmed(line.substr(colonPos + 1));

            if (!valueStr.empty()) {
                obj.set(key, parseScalar(valueStr));
                i++;
                continue;
            }

            size_t nestedEnd = i + 1;
            while (nestedEnd < endLine) {
                if (!isBlank(nestedEnd) && indentOf(lines_[nestedEnd]) <= indent) {
                    break;
                }
                nestedEnd++;
            }

            JsonValue nested = JsonValue::makeObject();
            if (!parseMapping(nested, i + 1, nestedEnd, err, errLine)) {
                return false;
            }
            obj.set(key, std::move(nested));
            i = nestedEnd;
        }
        return true;
    }

    static JsonValue parseScalar(const std::string& value) {
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            return JsonValue::makeString(value.substr(1, value.size() - 2));
        }

        if (value == "true" || value == "True" || value == "TRUE" || value == "yes") {
            return JsonValue::makeBool(true);
        }
        if (value == "false" || value == "False" || value == "FALSE" || value == "no") {
            return JsonValue::makeBool(false);
        }
        if (value == "null" || value == "~") {
            return JsonValue{};
        }

        char* end = nullptr;
        double num = std::strtod(value.c_str(), &end);
        if (end != nullptr && *end == '\0' && end != value.c_str()) {
            return JsonValue::makeNumber(num);
        }

        return JsonValue::makeString(value);
    }
};

// =============================================================================
// Writer
// =============================================================================

void writeNumber(std::ostringstream& out, double v) {
    if (std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 1e15) {
        out << static_cast<int64_t>(v);
        return;
    }
    if (!std::isfinite(v)) {
        out << "null";
        return;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    out << buf;
}

void writeValue(std::ostringstream& out, const JsonValue& value, int indent, int level) {
    auto newline = [&](int lvl) {
        if (indent > 0) {
            out << '\n' << std::string(static_cast<size_t>(indent * lvl), ' ');
        }
    };

    switch (value.type) {
        case JsonType::Null:
            out << "null";
            break;
        case JsonType::Boolean:
            out << (value.boolValue ? "true" : "false");
            break;
        case JsonType::Number:
            writeNumber(out, value.numberValue);
            break;
        case JsonType::String:
            out << '"' << escapeJsonString(value.stringValue) << '"';
            break;
        case JsonType::Array: {
            if (value.arrayValue.empty()) {
                out << "[]";
                break;
            }
            out << '[';
            bool first = true;
            for (const auto& element : value.arrayValue) {
                if (!first) out << ',';
                first = false;
                newline(level + 1);
                writeValue(out, element, indent, level + 1);
            }
            newline(level);
            out << ']';
            break;
        }
        case JsonType::Object: {
            if (value.objectValue.empty()) {
                out << "{}";
                break;
            }
            out << '{';
            bool first = true;
            for (const auto& member : value.objectValue) {
                if (!first) out << ',';
                first = false;
                newline(level + 1);
                out << '"' << escapeJsonString(member.first) << "\":";
                if (indent > 0) out << ' ';
                writeValue(out, member.second, indent, level + 1);
            }
            newline(level);
            out << '}';
            break;
        }
    }
}

} // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

Result<JsonValue, JsonError> parseJson(const std::string& input) {
    JsonParser parser(input);
    return parser.parse();
}

Result<JsonValue, JsonError> parseYaml(const std::string& input) {
    YamlParser parser(input);
    return parser.parse();
}

std::string toJson(const JsonValue& value, int indent) {
    std::ostringstream out;
    writeValue(out, value, indent, 0);
    return out.str();
}

std::string escapeJsonString(const std::string& str) {
    std::string out;
    out.reserve(str.size() + 8);
    for (char c : str) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

} // namespace core
} // namespace orexa
