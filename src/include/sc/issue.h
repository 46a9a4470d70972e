#pragma once

#include <sc/value.h>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sc {

enum class IssueCode {
    InvalidType,
    InvalidValue,
    TooSmall,
    TooBig,
    InvalidFormat,
    NotMultipleOf,
    UnrecognisedKeys,
    InvalidUnion,
    InvalidKey,
    InvalidElement,
    InvalidIntersection,
    Custom
};

// Stable snake_case name of a code, e.g. "too_small".
const char* issue_code_name(IssueCode code);

// One step into a container: an object/record/map key or a sequence index.
using PathKey = std::variant<std::string, int64_t>;
using Path = std::vector<PathKey>;

// Renders a path as `a.b[2].c`; keys that are not identifiers are quoted.
std::string to_dot_path(const Path& path);

struct RawIssue;

// Message hook: returns a message for the issue or std::nullopt to defer to
// the next resolver.
using ErrorMap = std::function<std::optional<std::string>(const RawIssue&)>;

// An issue as produced by checks and parse routines. The path is relative to
// the payload that collected it until the parse finishes.
struct RawIssue {
    IssueCode code = IssueCode::Custom;
    Value input;
    Path path;
    // Explicit message; wins over every hook when set.
    std::string message;
    std::string origin;
    // Code-specific fields: expected, received, minimum, maximum, inclusive,
    // exact, format, pattern, prefix, suffix, includes, divisor, keys, key,
    // index, values, reason, discriminator, options, params.
    Value params = Value::object();
    // invalid_union: one issue list per attempted branch
    std::vector<std::vector<RawIssue> > branches;
    // invalid_key / invalid_element: issues of the offending key or value
    std::vector<RawIssue> issues;
    // Hooks captured from the check and schema that raised the issue.
    ErrorMap check_error;
    ErrorMap schema_error;
};

// User-facing issue: absolute path and rendered message.
struct Issue {
    IssueCode code = IssueCode::Custom;
    Path path;
    std::string message;
    std::string origin;
    Value params = Value::object();
    // Present only when the parse context asks for it
    std::optional<Value> input;
    std::vector<std::vector<Issue> > branches;
    std::vector<Issue> issues;

    std::string code_name() const { return issue_code_name(code); }

    // Field accessors; a null Value when the field does not apply.
    Value param(const std::string& name) const { return params.has(name) ? params.at(name) : Value(); }
    Value expected() const { return param("expected"); }
    Value received() const { return param("received"); }
    Value minimum() const { return param("minimum"); }
    Value maximum() const { return param("maximum"); }
    bool inclusive() const {
        Value v = param("inclusive");
        return v.isBool() && v.asBool();
    }
    Value format() const { return param("format"); }
    Value divisor() const { return param("divisor"); }
    std::vector<std::string> keys() const;
};

struct ParseContext;

// Built-in English message for a raw issue; never empty.
std::string default_message(const RawIssue& issue);

// Resolve the message and promote a raw issue. Resolution order: explicit
// message, check hook, schema hook, context map, process custom map, locale
// map, built-in default.
Issue finalize_issue(const RawIssue& raw, const ParseContext* ctx);

std::vector<Issue> finalize_issues(const std::vector<RawIssue>& raw, const ParseContext* ctx);

// Helpers used by checks and parse routines to build raw issues.
RawIssue make_invalid_type(const std::string& expected, const Value& input);
RawIssue make_too_small(const std::string& origin, const Value& minimum, bool inclusive, const Value& input,
                        bool exact = false);
RawIssue make_too_big(const std::string& origin, const Value& maximum, bool inclusive, const Value& input,
                      bool exact = false);
RawIssue make_invalid_format(const std::string& format, const Value& input);
RawIssue make_custom(const std::string& message, const Value& input);

// Name of the runtime kind of a value as reported in `received`.
std::string received_type_name(const Value& v);

}  // namespace sc
