#include "io/json_reader.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace pursuit {

namespace {

// Deeper documents are rejected; episode records nest four levels
constexpr int MAX_DEPTH = 64;

bool is_digit(char c) { return c >= '0' && c <= '9'; }

void append_utf8(std::string& out, unsigned long cp) {
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

/**
 * Single-pass recursive descent over one document. Errors carry the
 * 1-based line and column of the offending character.
 */
class Cursor {
public:
    explicit Cursor(const std::string& text) : text_(text) {}

    JsonValue document() {
        skip_ws();
        if (at_end()) fail("empty document");
        JsonValue root = value(0);
        skip_ws();
        if (!at_end()) fail("unexpected content after the document");
        return root;
    }

private:
    const std::string& text_;
    size_t pos_ = 0;

    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return at_end() ? '\0' : text_[pos_]; }

    [[noreturn]] void fail(const std::string& what) const {
        size_t line = 1, col = 1;
        for (size_t i = 0; i < pos_ && i < text_.size(); i++) {
            if (text_[i] == '\n') {
                line++;
                col = 1;
            } else {
                col++;
            }
        }
        throw std::runtime_error("JSON: " + what + " (line " + std::to_string(line) +
                                 ", column " + std::to_string(col) + ")");
    }

    void skip_ws() {
        while (!at_end()) {
            char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            pos_++;
        }
    }

    void consume(char c) {
        if (peek() != c) fail(std::string("expected '") + c + "'");
        pos_++;
    }

    bool literal(const char* word) {
        size_t n = std::char_traits<char>::length(word);
        if (text_.compare(pos_, n, word) != 0) return false;
        pos_ += n;
        return true;
    }

    JsonValue value(int depth) {
        if (depth > MAX_DEPTH) fail("nesting too deep");
        skip_ws();
        char c = peek();
        switch (c) {
            case '{': return object(depth + 1);
            case '[': return array(depth + 1);
            case '"': return JsonValue(quoted());
            case 't':
                if (literal("true")) return JsonValue(true);
                break;
            case 'f':
                if (literal("false")) return JsonValue(false);
                break;
            case 'n':
                if (literal("null")) return JsonValue();
                break;
            default:
                if (c == '-' || is_digit(c)) return number();
                break;
        }
        if (at_end()) fail("unexpected end of input");
        fail(std::string("unexpected character '") + c + "'");
    }

    JsonValue object(int depth) {
        consume('{');
        JsonValue obj = JsonValue::object();
        skip_ws();
        if (peek() == '}') {
            pos_++;
            return obj;
        }
        for (;;) {
            skip_ws();
            if (peek() != '"') fail("expected a member name");
            std::string name = quoted();
            skip_ws();
            consume(':');
            obj.set(std::move(name), value(depth));
            skip_ws();
            if (peek() == ',') {
                pos_++;
                continue;
            }
            consume('}');
            return obj;
        }
    }

    JsonValue array(int depth) {
        consume('[');
        JsonValue arr = JsonValue::array();
        skip_ws();
        if (peek() == ']') {
            pos_++;
            return arr;
        }
        for (;;) {
            arr.push(value(depth));
            skip_ws();
            if (peek() == ',') {
                pos_++;
                continue;
            }
            consume(']');
            return arr;
        }
    }

    unsigned long hex4() {
        if (pos_ + 4 > text_.size()) fail("truncated \\u escape");
        unsigned long cp = 0;
        for (int i = 0; i < 4; i++) {
            char h = text_[pos_++];
            cp <<= 4;
            if (is_digit(h))               cp |= static_cast<unsigned long>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned long>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned long>(h - 'A' + 10);
            else fail("bad hex digit in \\u escape");
        }
        return cp;
    }

    std::string quoted() {
        consume('"');
        std::string out;
        for (;;) {
            if (at_end()) fail("unterminated string");
            char c = text_[pos_++];
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character in string");
            if (c != '\\') {
                out += c;
                continue;
            }

            if (at_end()) fail("unterminated escape");
            char e = text_[pos_++];
            switch (e) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    unsigned long cp = hex4();
                    // Surrogate pair
                    if (cp >= 0xD800 && cp <= 0xDBFF && text_.compare(pos_, 2, "\\u") == 0) {
                        pos_ += 2;
                        unsigned long lo = hex4();
                        if (lo < 0xDC00 || lo > 0xDFFF) fail("unpaired surrogate");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    pos_--;
                    fail(std::string("unknown escape '\\") + e + "'");
            }
        }
    }

    JsonValue number() {
        size_t start = pos_;
        if (peek() == '-') pos_++;

        if (peek() == '0') {
            pos_++;
        } else if (is_digit(peek())) {
            while (is_digit(peek())) pos_++;
        } else {
            fail("expected a digit");
        }

        if (peek() == '.') {
            pos_++;
            if (!is_digit(peek())) fail("expected a digit after '.'");
            while (is_digit(peek())) pos_++;
        }

        if (peek() == 'e' || peek() == 'E') {
            pos_++;
            if (peek() == '+' || peek() == '-') pos_++;
            if (!is_digit(peek())) fail("expected an exponent");
            while (is_digit(peek())) pos_++;
        }

        std::string digits = text_.substr(start, pos_ - start);
        errno = 0;
        double v = std::strtod(digits.c_str(), nullptr);
        if (errno == ERANGE && std::isinf(v)) {
            pos_ = start;
            fail("number out of range: " + digits);
        }
        return JsonValue(v);
    }
};

}  // namespace

JsonValue JsonReader::parse(const std::string& text) {
    return Cursor(text).document();
}

JsonValue JsonReader::parse_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open JSON file: " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    try {
        return parse(buf.str());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

} // namespace pursuit
