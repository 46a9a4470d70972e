#include <sc/coerce.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace sc {

namespace {
    std::string trimmed(const std::string& s) {
        size_t b = 0;
        size_t e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
        return s.substr(b, e - b);
    }

    std::string lowered(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool is_integer_literal(const std::string& s) {
        size_t i = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
        if (i == s.size()) return false;
        return std::all_of(s.begin() + static_cast<std::ptrdiff_t>(i), s.end(),
                           [](char c) { return c >= '0' && c <= '9'; });
    }

    std::optional<Value> parse_decimal(const std::string& text) {
        std::string s = trimmed(text);
        if (s.empty()) return std::nullopt;
        if (is_integer_literal(s)) {
            errno = 0;
            long long n = std::strtoll(s.c_str(), nullptr, 10);
            if (errno != ERANGE) return Value(static_cast<int64_t>(n));
        }
        // strtod also takes hex, inf and nan spellings; only plain decimals count
        for (char c : s) {
            if (!(std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '+' || c == 'e' ||
                  c == 'E'))
                return std::nullopt;
        }
        char* end = nullptr;
        double d = std::strtod(s.c_str(), &end);
        if (end != s.c_str() + s.size()) return std::nullopt;
        return Value(d);
    }
}  // namespace

std::optional<Value> coerce_to_string(const Value& v) {
    switch (v.type()) {
        case Value::String:
            return v;
        case Value::Boolean:
            return Value(v.asBool() ? "true" : "false");
        case Value::Integer:
            return Value(std::to_string(v.asInt()));
        case Value::BigInt:
            return Value(v.asBigInt());
        case Value::Double:
            return Value(v.dump());
        default:
            return std::nullopt;
    }
}

std::optional<Value> coerce_to_number(const Value& v, NumberKind kind) {
    std::optional<Value> out;
    switch (v.type()) {
        case Value::Integer:
        case Value::Double:
            out = v;
            break;
        case Value::Boolean:
            out = Value(int64_t(v.asBool() ? 1 : 0));
            break;
        case Value::String:
            out = parse_decimal(v.asString());
            break;
        case Value::BigInt: {
            errno = 0;
            long long n = std::strtoll(v.asBigInt().c_str(), nullptr, 10);
            if (errno != ERANGE)
                out = Value(static_cast<int64_t>(n));
            else
                out = Value(std::strtod(v.asBigInt().c_str(), nullptr));
            break;
        }
        default:
            return std::nullopt;
    }
    if (out && is_integer_kind(kind) && out->isDouble()) {
        double d = out->asDouble();
        if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) < 9.2e18) out = Value(static_cast<int64_t>(d));
    }
    return out;
}

std::optional<Value> coerce_to_bool(const Value& v) {
    switch (v.type()) {
        case Value::Boolean:
            return v;
        case Value::Integer:
            return Value(v.asInt() != 0);
        case Value::Double:
            if (std::isnan(v.asDouble())) return std::nullopt;
            return Value(v.asDouble() != 0.0);
        case Value::BigInt:
            return Value(v.asBigInt() != "0");
        case Value::String: {
            std::string s = lowered(trimmed(v.asString()));
            if (s == "true" || s == "1" || s == "yes" || s == "on" || s == "y") return Value(true);
            if (s == "false" || s == "0" || s == "no" || s == "off" || s == "n" || s.empty()) return Value(false);
            return std::nullopt;
        }
        default:
            return std::nullopt;
    }
}

std::optional<Value> coerce_to_bigint(const Value& v) {
    switch (v.type()) {
        case Value::BigInt:
            return v;
        case Value::Integer:
            return Value::bigint(std::to_string(v.asInt()));
        case Value::Boolean:
            return Value::bigint(v.asBool() ? "1" : "0");
        case Value::Double: {
            double d = v.asDouble();
            if (!std::isfinite(d) || std::trunc(d) != d) return std::nullopt;
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(0) << d;
            return Value::bigint(ss.str());
        }
        case Value::String: {
            std::string s = trimmed(v.asString());
            if (!is_integer_literal(s)) return std::nullopt;
            return Value::bigint(s);
        }
        default:
            return std::nullopt;
    }
}

}  // namespace sc
