#include "JsonValue.h"

#include "KeyprintExceptions.h"

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace {
constexpr size_t kMaxNestingDepth = 32;

bool isJsonSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

int hexDigit(char c) {
    if (isDigit(c)) return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void appendUtf8(std::string& out, unsigned int codepoint) {
    if (codepoint < 0x80) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

// Returns one past the end of a JSON number starting at `pos`, or `pos` when
// the text there does not follow the number grammar.
size_t scanNumber(const std::string& text, size_t pos) {
    size_t i = pos;
    auto digits = [&text, &i]() {
        const size_t begin = i;
        while (i < text.size() && isDigit(text[i])) ++i;
        return i - begin;
    };

    if (i < text.size() && text[i] == '-') ++i;
    if (i < text.size() && text[i] == '0') {
        ++i;
    } else if (digits() == 0) {
        return pos;
    }
    if (i < text.size() && text[i] == '.') {
        ++i;
        if (digits() == 0) return pos;
    }
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < text.size() && (text[i] == '+' || text[i] == '-')) ++i;
        if (digits() == 0) return pos;
    }
    return i;
}

// Request bodies are small and parsed once, so the reader builds a full
// JsonValue tree and the codec walks it afterwards.
class JsonReader {
public:
    explicit JsonReader(const std::string& text) : m_text(text) {}

    JsonValue document() {
        JsonValue root = value(0);
        skipSpace();
        if (m_pos != m_text.size()) fail("unexpected content after document");
        return root;
    }

private:
    [[noreturn]] void fail(const std::string& what) const {
        throw Keyprint::RequestException("Malformed JSON at offset " + std::to_string(m_pos) + ": " + what);
    }

    void skipSpace() {
        while (m_pos < m_text.size() && isJsonSpace(m_text[m_pos])) ++m_pos;
    }

    char next() {
        if (m_pos >= m_text.size()) fail("unexpected end of input");
        return m_text[m_pos++];
    }

    bool consumeLiteral(const char* word, size_t length) {
        if (m_text.compare(m_pos, length, word) != 0) return false;
        m_pos += length;
        return true;
    }

    JsonValue value(size_t depth) {
        skipSpace();
        if (m_pos >= m_text.size()) fail("expected a value");

        JsonValue out;
        switch (m_text[m_pos]) {
            case '{':
                out.type = JsonValue::Type::Object;
                sequence('}', depth, [this, &out, depth]() {
                    skipSpace();
                    if (m_pos >= m_text.size() || m_text[m_pos] != '"') fail("object keys must be strings");
                    std::string key = string();
                    skipSpace();
                    if (next() != ':') fail("expected ':' after object key");
                    out.objectValue[std::move(key)] = value(depth + 1);
                });
                return out;
            case '[':
                out.type = JsonValue::Type::Array;
                sequence(']', depth, [this, &out, depth]() { out.arrayValue.push_back(value(depth + 1)); });
                return out;
            case '"':
                out.type = JsonValue::Type::String;
                out.stringValue = string();
                return out;
            default:
                break;
        }

        if (consumeLiteral("null", 4)) return out;
        if (consumeLiteral("true", 4)) {
            out.type = JsonValue::Type::Bool;
            out.booleanValue = true;
            return out;
        }
        if (consumeLiteral("false", 5)) {
            out.type = JsonValue::Type::Bool;
            return out;
        }
        return number();
    }

    // Reads `open item (, item)* close`, the opening bracket at m_pos.
    template <typename ItemReader>
    void sequence(char close, size_t depth, ItemReader readItem) {
        if (depth + 1 > kMaxNestingDepth) {
            fail("nesting deeper than " + std::to_string(kMaxNestingDepth) + " levels");
        }
        ++m_pos;
        skipSpace();
        if (m_pos < m_text.size() && m_text[m_pos] == close) {
            ++m_pos;
            return;
        }
        for (;;) {
            readItem();
            skipSpace();
            const char c = next();
            if (c == close) return;
            if (c != ',') fail(std::string("expected ',' or '") + close + "'");
        }
    }

    std::string string() {
        std::string out;
        ++m_pos; // opening quote
        for (;;) {
            const char c = next();
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character inside string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }

            const char escaped = next();
            switch (escaped) {
                case '"':
                case '\\':
                case '/': out.push_back(escaped); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int codepoint = 0;
                    for (int i = 0; i < 4; ++i) {
                        const int nibble = hexDigit(next());
                        if (nibble < 0) fail("bad \\u escape");
                        codepoint = (codepoint << 4) | static_cast<unsigned int>(nibble);
                    }
                    // Surrogate halves are kept as-is; identifiers and keys are ASCII.
                    appendUtf8(out, codepoint);
                    break;
                }
                default:
                    fail(std::string("unknown escape '\\") + escaped + "'");
            }
        }
    }

    JsonValue number() {
        const size_t end = scanNumber(m_text, m_pos);
        if (end == m_pos) fail("invalid token");

        const std::string token = m_text.substr(m_pos, end - m_pos);
        const double parsed = std::strtod(token.c_str(), nullptr);
        if (!std::isfinite(parsed)) fail("number out of range: " + token);
        m_pos = end;

        JsonValue out;
        out.type = JsonValue::Type::Number;
        out.numberValue = parsed;
        return out;
    }

    const std::string& m_text;
    size_t m_pos = 0;
};
} // namespace

const JsonValue* JsonValue::find(const std::string& key) const {
    if (!isObject()) return nullptr;
    const auto it = objectValue.find(key);
    return it == objectValue.end() ? nullptr : &it->second;
}

bool JsonValue::isInteger() const noexcept {
    return isNumber() && std::floor(numberValue) == numberValue;
}

JsonValue parseJsonText(const std::string& text) {
    return JsonReader(text).document();
}

std::string escapeJsonString(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    for (char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static const char* const kHex = "0123456789abcdef";
                    out += "\\u00";
                    out.push_back(kHex[(c >> 4) & 0x0F]);
                    out.push_back(kHex[c & 0x0F]);
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

std::string formatDouble(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream out;
    out << std::setprecision(15) << value;
    return out.str();
}
