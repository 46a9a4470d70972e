#include <sc/check.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace sc {

namespace {
    std::string integral_digits(double d) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(0) << d;
        return ss.str();
    }

    // Compare a bigint (decimal digits) against a finite double.
    int compare_bigint_double(const std::string& big, double d) {
        double fl = std::floor(d);
        int cmp = compare_bigint(big, integral_digits(fl));
        if (cmp != 0) return cmp;
        return fl == d ? 0 : -1;
    }

    std::string subtract_digits(const std::string& a, const std::string& b) {
        // a >= b, both non-negative without leading zeros
        std::string out(a.size(), '0');
        int borrow = 0;
        for (size_t k = 0; k < a.size(); ++k) {
            int x = a[a.size() - 1 - k] - '0' - borrow;
            int y = k < b.size() ? b[b.size() - 1 - k] - '0' : 0;
            borrow = x < y ? 1 : 0;
            out[a.size() - 1 - k] = static_cast<char>('0' + x + borrow * 10 - y);
        }
        size_t nz = out.find_first_not_of('0');
        return nz == std::string::npos ? "0" : out.substr(nz);
    }

    // Long division remainder check on unsigned decimal strings.
    bool divides(const std::string& n, const std::string& d) {
        std::string r = "0";
        for (char c : n) {
            r = r == "0" ? std::string(1, c) : r + c;
            while (compare_bigint(r, d) >= 0) r = subtract_digits(r, d);
        }
        return r == "0";
    }

    std::string magnitude(std::string digits) {
        if (!digits.empty() && digits[0] == '-') digits.erase(0, 1);
        return digits;
    }

    std::string origin_of(const Value& v) { return v.isBigInt() ? "bigint" : "number"; }

    RawIssue format_issue(const std::string& format, const Value& input) { return make_invalid_format(format, input); }

    Check string_check(const std::string& kind, Value params, std::function<void(Payload&)> fn) {
        Check c;
        c.kind = kind;
        c.params = std::move(params);
        c.fn = [fn](Payload& p) {
            if (!p.value.isString()) return;
            fn(p);
        };
        return c;
    }
}  // namespace

int compare_numbers(const Value& a, const Value& b) {
    if (a.isInt() && b.isInt()) return a.asInt() < b.asInt() ? -1 : (a.asInt() > b.asInt() ? 1 : 0);
    bool a_num = a.isNumber() || a.isBigInt();
    bool b_num = b.isNumber() || b.isBigInt();
    if (!a_num || !b_num) throw std::logic_error("cannot compare " + a.typeString() + " with " + b.typeString());
    if ((a.isDouble() && std::isnan(a.asDouble())) || (b.isDouble() && std::isnan(b.asDouble())))
        throw std::logic_error("cannot order NaN");

    if (a.isDouble() || b.isDouble()) {
        if (!a.isBigInt() && !b.isBigInt()) {
            double x = a.asDouble();
            double y = b.asDouble();
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        const Value& big = a.isBigInt() ? a : b;
        double d = a.isBigInt() ? b.asDouble() : a.asDouble();
        int cmp;
        if (std::isinf(d))
            cmp = d > 0 ? -1 : 1;
        else
            cmp = compare_bigint_double(big.asBigInt(), d);
        return a.isBigInt() ? cmp : -cmp;
    }
    return compare_bigint(a.asBigInt(), b.asBigInt());
}

int64_t measure(const Value& v) {
    switch (v.type()) {
        case Value::String:
            return static_cast<int64_t>(utf8_length(v.asString()));
        case Value::Array:
        case Value::Set:
        case Value::Object:
        case Value::Map:
            return static_cast<int64_t>(v.size());
        case Value::File:
            return v.asFile().size;
        default:
            return -1;
    }
}

Check check_size(SizeBound bound, const std::string& origin, int64_t n) {
    if (n < 0) throw std::invalid_argument("size bound must be non-negative");
    Check c;
    c.kind = bound == SizeBound::Min ? "min_size" : (bound == SizeBound::Max ? "max_size" : "size_equals");
    c.params["origin"] = origin;
    c.params[bound == SizeBound::Max ? "maximum" : "minimum"] = n;
    c.fn = [bound, origin, n](Payload& p) {
        int64_t size = measure(p.value);
        if (size < 0) return;
        if ((bound == SizeBound::Min || bound == SizeBound::Exact) && size < n)
            p.add_issue(make_too_small(origin, n, true, p.value, bound == SizeBound::Exact));
        if ((bound == SizeBound::Max || bound == SizeBound::Exact) && size > n)
            p.add_issue(make_too_big(origin, n, true, p.value, bound == SizeBound::Exact));
    };
    return c;
}

Check check_compare(Compare op, const Value& bound) {
    if (!(bound.isNumber() || bound.isBigInt())) throw std::invalid_argument("numeric bound required");
    if (bound.isDouble() && std::isnan(bound.asDouble())) throw std::invalid_argument("numeric bound is NaN");
    static const char* const names[] = {"greater_than", "greater_than_or_equal", "less_than", "less_than_or_equal"};
    Check c;
    c.kind = names[static_cast<int>(op)];
    bool lower = op == Compare::Gt || op == Compare::Gte;
    bool inclusive = op == Compare::Gte || op == Compare::Lte;
    c.params[lower ? "minimum" : "maximum"] = bound;
    c.params["inclusive"] = inclusive;
    c.fn = [op, bound, lower, inclusive](Payload& p) {
        const Value& v = p.value;
        if (!(v.isNumber() || v.isBigInt())) return;
        if (v.isDouble() && std::isnan(v.asDouble())) return;
        int cmp = compare_numbers(v, bound);
        bool pass = false;
        switch (op) {
            case Compare::Gt:
                pass = cmp > 0;
                break;
            case Compare::Gte:
                pass = cmp >= 0;
                break;
            case Compare::Lt:
                pass = cmp < 0;
                break;
            case Compare::Lte:
                pass = cmp <= 0;
                break;
        }
        if (pass) return;
        if (lower)
            p.add_issue(make_too_small(origin_of(v), bound, inclusive, v));
        else
            p.add_issue(make_too_big(origin_of(v), bound, inclusive, v));
    };
    return c;
}

Check check_multiple_of(const Value& divisor) {
    if (!(divisor.isNumber() || divisor.isBigInt())) throw std::invalid_argument("numeric divisor required");
    if (compare_numbers(divisor, Value(0)) == 0) throw std::invalid_argument("divisor must not be zero");
    Check c;
    c.kind = "multiple_of";
    c.params["divisor"] = divisor;
    c.fn = [divisor](Payload& p) {
        const Value& v = p.value;
        bool ok = true;
        if (v.isBigInt() || (v.isInt() && !divisor.isDouble())) {
            // exact integer arithmetic
            std::string d;
            if (divisor.isDouble()) {
                double dd = std::fabs(divisor.asDouble());
                if (!std::isfinite(dd) || std::trunc(dd) != dd)
                    ok = false;
                else
                    d = integral_digits(dd);
            } else {
                d = magnitude(divisor.asBigInt());
            }
            if (!d.empty()) ok = divides(magnitude(v.asBigInt()), d);
        } else if (v.isNumber()) {
            double x = v.asDouble();
            double d = divisor.asDouble();
            if (!std::isfinite(x)) {
                ok = false;
            } else {
                // quotient within a relative epsilon of an integer
                double q = x / d;
                ok = std::fabs(q - std::round(q)) < 1e-9 * std::max(1.0, std::fabs(q));
            }
        } else {
            return;
        }
        if (ok) return;
        RawIssue issue;
        issue.code = IssueCode::NotMultipleOf;
        issue.input = v;
        issue.origin = origin_of(v);
        issue.params["divisor"] = divisor;
        p.add_issue(std::move(issue));
    };
    return c;
}

Check check_finite() {
    Check c;
    c.kind = "finite";
    c.fn = [](Payload& p) {
        if (p.value.isDouble() && !std::isfinite(p.value.asDouble())) {
            RawIssue issue = make_invalid_type("number", p.value);
            issue.params["received"] = std::isnan(p.value.asDouble()) ? "NaN" : "Infinity";
            p.add_issue(std::move(issue));
        }
    };
    return c;
}

Check check_int() {
    Check c;
    c.kind = "int";
    c.fn = [](Payload& p) {
        if (!p.value.isDouble()) return;
        double d = p.value.asDouble();
        if (std::isfinite(d) && std::trunc(d) == d) return;
        p.add_issue(make_invalid_type("int", p.value));
    };
    return c;
}

Check check_safe_int() {
    Check c;
    c.kind = "safe_int";
    c.fn = [](Payload& p) {
        const Value& v = p.value;
        if (!v.isNumber()) return;
        const double limit = 9007199254740991.0;
        if (v.isDouble()) {
            double d = v.asDouble();
            if (!std::isfinite(d) || std::trunc(d) != d) {
                p.add_issue(make_invalid_type("int", v));
                return;
            }
        }
        double d = v.asDouble();
        if (d < -limit)
            p.add_issue(make_too_small("number", Value(int64_t(-9007199254740991LL)), true, v));
        else if (d > limit)
            p.add_issue(make_too_big("number", Value(int64_t(9007199254740991LL)), true, v));
    };
    return c;
}

Check check_format(const std::string& format) {
    if (!is_format_name(format)) throw std::invalid_argument("unknown string format '" + format + "'");
    Value params = Value::object();
    params["format"] = format;
    return string_check(format, params, [format](Payload& p) {
        if (!matches_format(format, p.value.asString())) p.add_issue(format_issue(format, p.value));
    });
}

Check check_regex(const std::string& pattern, std::regex::flag_type flags) {
    auto re = std::make_shared<const std::regex>(pattern, flags);
    Value params = Value::object();
    params["format"] = "regex";
    params["pattern"] = pattern;
    return string_check("regex", params, [re, pattern](Payload& p) {
        const std::string& s = p.value.asString();
        if (s.size() <= max_regex_input && std::regex_search(s, *re)) return;
        RawIssue issue = format_issue("regex", p.value);
        issue.params["pattern"] = pattern;
        p.add_issue(std::move(issue));
    });
}

Check check_starts_with(const std::string& prefix) {
    Value params = Value::object();
    params["format"] = "starts_with";
    params["prefix"] = prefix;
    return string_check("starts_with", params, [prefix](Payload& p) {
        const std::string& s = p.value.asString();
        if (s.compare(0, prefix.size(), prefix) == 0 && s.size() >= prefix.size()) return;
        RawIssue issue = format_issue("starts_with", p.value);
        issue.params["prefix"] = prefix;
        p.add_issue(std::move(issue));
    });
}

Check check_ends_with(const std::string& suffix) {
    Value params = Value::object();
    params["format"] = "ends_with";
    params["suffix"] = suffix;
    return string_check("ends_with", params, [suffix](Payload& p) {
        const std::string& s = p.value.asString();
        if (s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0) return;
        RawIssue issue = format_issue("ends_with", p.value);
        issue.params["suffix"] = suffix;
        p.add_issue(std::move(issue));
    });
}

Check check_includes(const std::string& needle) {
    Value params = Value::object();
    params["format"] = "includes";
    params["includes"] = needle;
    return string_check("includes", params, [needle](Payload& p) {
        if (p.value.asString().find(needle) != std::string::npos) return;
        RawIssue issue = format_issue("includes", p.value);
        issue.params["includes"] = needle;
        p.add_issue(std::move(issue));
    });
}

Check check_trim() {
    return string_check("trim", Value::object(), [](Payload& p) {
        const std::string& s = p.value.asString();
        size_t b = 0;
        size_t e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
        p.value = s.substr(b, e - b);
    });
}

Check check_to_lower() {
    return string_check("to_lower", Value::object(), [](Payload& p) {
        std::string s = p.value.asString();
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        p.value = std::move(s);
    });
}

Check check_to_upper() {
    return string_check("to_upper", Value::object(), [](Payload& p) {
        std::string s = p.value.asString();
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        p.value = std::move(s);
    });
}

Check check_mime(std::vector<std::string> types) {
    Check c;
    c.kind = "mime_type";
    Value list = Value::array();
    for (auto const& t : types) list.push_back(t);
    c.params["mime"] = list;
    c.fn = [types, list](Payload& p) {
        if (!p.value.isFile()) return;
        const std::string& mime = p.value.asFile().mime;
        if (std::find(types.begin(), types.end(), mime) != types.end()) return;
        RawIssue issue;
        issue.code = IssueCode::InvalidValue;
        issue.input = p.value;
        issue.origin = "file";
        issue.params["values"] = list;
        p.add_issue(std::move(issue));
    };
    return c;
}

Check check_refine(std::function<bool(const Value&)> pred, RefineParams params) {
    if (!pred) throw std::invalid_argument("refine requires a predicate");
    Check c;
    c.kind = "custom";
    c.params = params.params;
    c.abort = params.abort;
    c.error = params.error;
    c.when = params.when;
    c.fn = [pred, params](Payload& p) {
        if (pred(p.value)) return;
        RawIssue issue = make_custom(params.message, p.value);
        issue.path = params.path;
        if (params.params.isObject() && !params.params.empty()) issue.params["params"] = params.params;
        p.add_issue(std::move(issue));
    };
    return c;
}

Check check_super_refine(std::function<void(const Value&, Payload&)> fn) {
    if (!fn) throw std::invalid_argument("super_refine requires a callback");
    Check c;
    c.kind = "custom";
    c.fn = [fn](Payload& p) { fn(p.value, p); };
    return c;
}

Check check_overwrite(std::function<Value(const Value&)> fn) {
    if (!fn) throw std::invalid_argument("overwrite requires a callback");
    Check c;
    c.kind = "overwrite";
    c.fn = [fn](Payload& p) { p.value = fn(p.value); };
    return c;
}

}  // namespace sc
