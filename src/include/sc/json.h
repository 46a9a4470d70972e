#pragma once

#include <sc/value.h>
#include <stdexcept>
#include <string>

namespace sc {

// Thrown by parse_json; what() carries the offending line with a caret.
struct JsonParseError : public std::runtime_error {
    size_t line, col;
    JsonParseError(const std::string& msg, size_t l, size_t c) : std::runtime_error(msg), line(l), col(c) {}
};

// Parse JSON text (with // and /* */ comments) into a Value. Integers that
// do not fit int64 become BigInt values.
Value parse_json(const std::string& text);

namespace json_literals {
    inline Value operator"" _json(const char* s, std::size_t len) { return parse_json(std::string(s, len)); }
}  // namespace json_literals

}  // namespace sc
