#pragma once

#include <sc/issue.h>
#include <sc/payload.h>
#include <sc/value.h>
#include <functional>
#include <regex>
#include <string>
#include <vector>

namespace sc {

// A constraint or in-place mutation run on a payload after the type step.
// `kind` and `params` describe the check for introspection; `fn` appends
// raw issues or rewrites payload.value.
struct Check {
    std::string kind;
    Value params = Value::object();
    // Stop running later checks when this one adds an issue.
    bool abort = false;
    std::function<void(Payload&)> fn;
    // Per-check message hook, captured into every issue the check raises.
    ErrorMap error;
    // When set, decides whether the check runs, even after the type step
    // reported issues. Unset checks run only on a well-typed value.
    std::function<bool(const Payload&)> when;
};

// Options accepted by refine().
struct RefineParams {
    std::string message;
    // Appended to the current path of raised issues.
    Path path;
    bool abort = false;
    // Free-form data copied into the issue's params.
    Value params = Value::object();
    ErrorMap error;
    std::function<bool(const Payload&)> when;
};

enum class SizeBound { Min, Max, Exact };
enum class Compare { Gt, Gte, Lt, Lte };

// Three-way numeric comparison across Integer, Double and BigInt values.
// Throws std::logic_error for non-numeric operands or NaN.
int compare_numbers(const Value& a, const Value& b);

// Measure used by size checks: code points for strings, element count for
// containers, bytes for files. -1 for values without a size.
int64_t measure(const Value& v);

Check check_size(SizeBound bound, const std::string& origin, int64_t n);
Check check_compare(Compare op, const Value& bound);
Check check_multiple_of(const Value& divisor);
Check check_finite();
Check check_int();
Check check_safe_int();

// Named string formats: email, url, uuid, ipv4, ipv6, cidrv4, cidrv6,
// base64, hostname, date, time, datetime, duration, lowercase, uppercase.
// Throws std::invalid_argument for an unknown name.
Check check_format(const std::string& format);
// Longest string a regex check will try to match; longer input fails the
// check without running the matcher.
constexpr size_t max_regex_input = 4096;

// Throws std::regex_error for an invalid pattern.
Check check_regex(const std::string& pattern, std::regex::flag_type flags = std::regex::ECMAScript);
Check check_starts_with(const std::string& prefix);
Check check_ends_with(const std::string& suffix);
Check check_includes(const std::string& needle);

Check check_trim();
Check check_to_lower();
Check check_to_upper();

Check check_mime(std::vector<std::string> types);

Check check_refine(std::function<bool(const Value&)> pred, RefineParams params = {});
// The callback receives the payload and may add any number of issues.
Check check_super_refine(std::function<void(const Value&, Payload&)> fn);
// Replaces the value; never raises issues by itself.
Check check_overwrite(std::function<Value(const Value&)> fn);

// formats.cpp
bool is_format_name(const std::string& format);
bool matches_format(const std::string& format, const std::string& s);

}  // namespace sc
