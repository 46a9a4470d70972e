#include <sc/json.h>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace sc {

namespace {
    struct Parser {
        const std::string& s;
        size_t i = 0;
        size_t line = 1;
        size_t col = 1;

        struct Opener {
            char ch;
            size_t line, col;
        };
        std::vector<Opener> opener_stack;

        explicit Parser(const std::string& str) : s(str) {}

        char peek() const { return i < s.size() ? s[i] : '\0'; }

        char get() {
            if (i >= s.size()) return '\0';
            char c = s[i++];
            if (c == '\n') {
                ++line;
                col = 1;
            } else
                ++col;
            return c;
        }

        [[noreturn]] void fail(const std::string& base) const {
            // find start of error line
            size_t pos = 0;
            size_t cur = 1;
            while (cur < line and pos < s.size()) {
                if (s[pos] == '\n') ++cur;
                ++pos;
            }
            size_t line_end = pos;
            while (line_end < s.size() and s[line_end] != '\n') ++line_end;
            std::string line_text = s.substr(pos, line_end - pos);
            size_t caret_pos = col > 0 ? col - 1 : 0;
            if (caret_pos > line_text.size()) caret_pos = line_text.size();

            std::ostringstream ss;
            ss << base << " (line " << line << ", column " << col << ")\n";
            ss << line_text << "\n" << std::string(caret_pos, ' ') << '^';
            if (not opener_stack.empty()) {
                auto o = opener_stack.back();
                ss << "\n(opened at line " << o.line << ", column " << o.col << ")";
            }
            throw JsonParseError(ss.str(), line, col);
        }

        void skip_ws() {
            while (i < s.size()) {
                unsigned char c = static_cast<unsigned char>(s[i]);
                if (std::isspace(c)) {
                    get();
                    continue;
                }
                if (c == '/' and i + 1 < s.size() and s[i + 1] == '/') {
                    while (i < s.size() and peek() != '\n') get();
                    continue;
                }
                if (c == '/' and i + 1 < s.size() and s[i + 1] == '*') {
                    get();
                    get();
                    bool closed = false;
                    while (i < s.size()) {
                        char a = get();
                        if (a == '*' and peek() == '/') {
                            get();
                            closed = true;
                            break;
                        }
                    }
                    if (not closed) fail("unterminated block comment");
                    continue;
                }
                break;
            }
        }

        bool consume_literal(const char* word) {
            std::string w(word);
            if (s.compare(i, w.size(), w) != 0) return false;
            for (size_t k = 0; k < w.size(); ++k) get();
            return true;
        }

        Value parse_value() {
            skip_ws();
            char c = peek();
            if (c == 'n') {
                if (consume_literal("null")) return Value();
                fail("invalid literal");
            }
            if (c == 't' or c == 'f') {
                if (consume_literal("true")) return Value(true);
                if (consume_literal("false")) return Value(false);
                fail("invalid literal");
            }
            if (c == '"') return Value(parse_string());
            if (c == '[') return parse_array();
            if (c == '{') return parse_object();
            if (c == '-' or std::isdigit(static_cast<unsigned char>(c))) return parse_number();
            if (c == '\0') fail("unexpected end of input");
            fail("unexpected token while parsing value");
        }

        static int hex_val(char c) {
            if ('0' <= c and c <= '9') return c - '0';
            if ('a' <= c and c <= 'f') return 10 + (c - 'a');
            if ('A' <= c and c <= 'F') return 10 + (c - 'A');
            return -1;
        }

        static void encode_utf8(uint32_t cp, std::string& out) {
            if (cp <= 0x7F)
                out.push_back(static_cast<char>(cp));
            else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        uint32_t parse_hex4() {
            uint32_t v = 0;
            for (int k = 0; k < 4; ++k) {
                int hv = hex_val(get());
                if (hv < 0) fail("invalid unicode escape");
                v = (v << 4) | static_cast<uint32_t>(hv);
            }
            return v;
        }

        std::string parse_string() {
            if (get() != '"') fail("expected '\"'");
            std::string out;
            while (true) {
                char c = get();
                if (c == '\0') fail("unexpected end in string");
                if (c == '"') break;
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }
                char e = get();
                switch (e) {
                    case '"':
                        out.push_back('"');
                        break;
                    case '\\':
                        out.push_back('\\');
                        break;
                    case '/':
                        out.push_back('/');
                        break;
                    case 'b':
                        out.push_back('\b');
                        break;
                    case 'f':
                        out.push_back('\f');
                        break;
                    case 'n':
                        out.push_back('\n');
                        break;
                    case 'r':
                        out.push_back('\r');
                        break;
                    case 't':
                        out.push_back('\t');
                        break;
                    case 'u': {
                        uint32_t cp = parse_hex4();
                        // surrogate pair
                        if (cp >= 0xD800 and cp <= 0xDBFF and peek() == '\\' and i + 1 < s.size() and
                            s[i + 1] == 'u') {
                            get();
                            get();
                            uint32_t lo = parse_hex4();
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        }
                        encode_utf8(cp, out);
                        break;
                    }
                    default:
                        fail("unsupported escape sequence");
                }
            }
            return out;
        }

        Value parse_number() {
            size_t start = i;
            if (peek() == '-') get();
            if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
            while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            bool is_float = false;
            if (peek() == '.') {
                is_float = true;
                get();
                if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            if (peek() == 'e' or peek() == 'E') {
                is_float = true;
                get();
                if (peek() == '+' or peek() == '-') get();
                if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            std::string token = s.substr(start, i - start);
            if (is_float) return Value(std::strtod(token.c_str(), nullptr));
            errno = 0;
            long long v = std::strtoll(token.c_str(), nullptr, 10);
            if (errno == ERANGE) return Value::bigint(token);
            return Value(static_cast<int64_t>(v));
        }

        Value parse_array() {
            get();
            opener_stack.push_back(Opener{'[', line, col});
            Value out = Value::array();
            skip_ws();
            if (peek() == ']') {
                get();
                opener_stack.pop_back();
                return out;
            }
            while (true) {
                out.push_back(parse_value());
                skip_ws();
                char c = peek();
                if (c == ']') {
                    get();
                    opener_stack.pop_back();
                    return out;
                }
                if (c == ',') {
                    get();
                    continue;
                }
                if (c == ':') fail("unexpected ':' after value; found key/value pair inside array");
                fail("expected ',' or ']'");
            }
        }

        Value parse_object() {
            get();
            opener_stack.push_back(Opener{'{', line, col});
            Value out = Value::object();
            skip_ws();
            if (peek() == '}') {
                get();
                opener_stack.pop_back();
                return out;
            }
            while (true) {
                skip_ws();
                if (peek() != '"') {
                    size_t j = i;
                    while (j < s.size() and (std::isalnum(static_cast<unsigned char>(s[j])) or s[j] == '_')) ++j;
                    std::string base = "expected string key";
                    if (j > i) base += " - are you missing quotes around '" + s.substr(i, j - i) + "'?";
                    fail(base);
                }
                std::string key = parse_string();
                skip_ws();
                if (get() != ':') fail("expected ':' after object key");
                out[key] = parse_value();
                skip_ws();
                char c = peek();
                if (c == '}') {
                    get();
                    opener_stack.pop_back();
                    return out;
                }
                if (c == ',') {
                    get();
                    continue;
                }
                fail("expected ',' or '}'");
            }
        }
    };
}  // namespace

Value parse_json(const std::string& text) {
    Parser p(text);
    Value val = p.parse_value();
    p.skip_ws();
    if (p.peek() != '\0') p.fail("extra data after JSON value");
    return val;
}

}  // namespace sc
