#include <sc/issue.h>
#include <sc/config.h>
#include <sc/payload.h>
#include <cctype>
#include <cmath>
#include <sstream>

namespace sc {

const char* issue_code_name(IssueCode code) {
    switch (code) {
        case IssueCode::InvalidType:
            return "invalid_type";
        case IssueCode::InvalidValue:
            return "invalid_value";
        case IssueCode::TooSmall:
            return "too_small";
        case IssueCode::TooBig:
            return "too_big";
        case IssueCode::InvalidFormat:
            return "invalid_format";
        case IssueCode::NotMultipleOf:
            return "not_multiple_of";
        case IssueCode::UnrecognisedKeys:
            return "unrecognised_keys";
        case IssueCode::InvalidUnion:
            return "invalid_union";
        case IssueCode::InvalidKey:
            return "invalid_key";
        case IssueCode::InvalidElement:
            return "invalid_element";
        case IssueCode::InvalidIntersection:
            return "invalid_intersection";
        case IssueCode::Custom:
            return "custom";
    }
    return "custom";
}

static bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    if (!(std::isalpha(static_cast<unsigned char>(s[0])) || s[0] == '_' || s[0] == '$')) return false;
    for (char c : s)
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$')) return false;
    return true;
}

std::string to_dot_path(const Path& path) {
    std::string out;
    for (auto const& key : path) {
        if (auto idx = std::get_if<int64_t>(&key)) {
            out += "[" + std::to_string(*idx) + "]";
            continue;
        }
        const std::string& k = std::get<std::string>(key);
        if (is_identifier(k)) {
            if (!out.empty()) out += ".";
            out += k;
        } else {
            out += "[" + Value(k).dump() + "]";
        }
    }
    return out;
}

std::string received_type_name(const Value& v) {
    if (v.isPointer()) return v.pointee() ? received_type_name(*v.pointee()) : "null";
    return v.typeString();
}

std::vector<std::string> Issue::keys() const {
    std::vector<std::string> out;
    Value k = param("keys");
    if (!k.isArray()) return out;
    for (auto const& e : k.asArray())
        if (e.isString()) out.push_back(e.asString());
    return out;
}

namespace {
    // Strings are quoted, everything else is dumped.
    std::string stringify(const Value& v) { return v.dump(); }

    std::string join_values(const Value& values, const std::string& sep) {
        std::string out;
        if (!values.isArray()) return out;
        bool first = true;
        for (auto const& v : values.asArray()) {
            if (!first) out += sep;
            first = false;
            out += stringify(v);
        }
        return out;
    }

    std::string str_param(const RawIssue& issue, const std::string& name) {
        if (!issue.params.has(name)) return "";
        const Value& v = issue.params.at(name);
        return v.isString() ? v.asString() : v.dump();
    }

    const char* size_unit(const std::string& origin) {
        if (origin == "string") return "characters";
        if (origin == "file") return "bytes";
        if (origin == "array" || origin == "set" || origin == "tuple") return "items";
        if (origin == "object" || origin == "map" || origin == "record") return "entries";
        return nullptr;
    }

    std::string format_noun(const std::string& format) {
        if (format == "regex") return "string";
        if (format == "email") return "email address";
        if (format == "url") return "URL";
        if (format == "uuid") return "UUID";
        if (format == "ipv4") return "IPv4 address";
        if (format == "ipv6") return "IPv6 address";
        if (format == "cidrv4") return "IPv4 range";
        if (format == "cidrv6") return "IPv6 range";
        if (format == "base64") return "base64-encoded string";
        if (format == "hostname") return "hostname";
        if (format == "date") return "ISO date";
        if (format == "time") return "ISO time";
        if (format == "datetime") return "ISO datetime";
        if (format == "duration") return "ISO duration";
        if (format == "lowercase") return "string: must be lowercase";
        if (format == "uppercase") return "string: must be uppercase";
        if (format == "mime") return "file type";
        return format;
    }

    std::string size_message(const RawIssue& issue, bool too_small) {
        const std::string origin = issue.origin.empty() ? "value" : issue.origin;
        const char* key = too_small ? "minimum" : "maximum";
        if (!issue.params.has(key)) return too_small ? "Too small" : "Too big";
        std::string threshold = stringify(issue.params.at(key));
        bool inclusive = !issue.params.has("inclusive") || issue.params.at("inclusive").asBool();
        bool exact = issue.params.has("exact") && issue.params.at("exact").asBool();
        std::string head = too_small ? "Too small: expected " : "Too big: expected ";

        if (const char* unit = size_unit(origin)) {
            std::string adj = exact ? "exactly " : (too_small ? (inclusive ? "at least " : "more than ")
                                                              : (inclusive ? "at most " : "fewer than "));
            return head + origin + " to have " + adj + threshold + " " + unit;
        }
        std::string op = too_small ? (inclusive ? ">=" : ">") : (inclusive ? "<=" : "<");
        return head + origin + " to be " + op + threshold;
    }

    std::string format_message(const RawIssue& issue) {
        std::string format = str_param(issue, "format");
        if (format == "starts_with") return "Invalid string: must start with " + stringify(issue.params.at("prefix"));
        if (format == "ends_with") return "Invalid string: must end with " + stringify(issue.params.at("suffix"));
        if (format == "includes") return "Invalid string: must include " + stringify(issue.params.at("includes"));
        if (format == "regex") return "Invalid string: must match pattern " + str_param(issue, "pattern");
        if (format.empty()) return "Invalid format";
        return "Invalid " + format_noun(format);
    }
}  // namespace

std::string default_message(const RawIssue& issue) {
    switch (issue.code) {
        case IssueCode::InvalidType: {
            std::string expected = str_param(issue, "expected");
            std::string received = str_param(issue, "received");
            if (received.empty()) received = received_type_name(issue.input);
            return "Invalid input: expected " + expected + ", received " + received;
        }
        case IssueCode::InvalidValue: {
            if (!issue.params.has("values")) return "Invalid value";
            const Value& values = issue.params.at("values");
            if (values.size() == 1) return "Invalid input: expected " + stringify(values.at(0));
            return "Invalid option: expected one of " + join_values(values, "|");
        }
        case IssueCode::TooSmall:
            return size_message(issue, true);
        case IssueCode::TooBig:
            return size_message(issue, false);
        case IssueCode::InvalidFormat:
            return format_message(issue);
        case IssueCode::NotMultipleOf:
            return "Invalid number: must be a multiple of " + str_param(issue, "divisor");
        case IssueCode::UnrecognisedKeys: {
            const Value keys = issue.params.has("keys") ? issue.params.at("keys") : Value::array();
            return std::string("Unrecognized key") + (keys.size() > 1 ? "s" : "") + ": " + join_values(keys, ", ");
        }
        case IssueCode::InvalidUnion: {
            if (issue.params.has("discriminator"))
                return "Invalid discriminator value: expected " + join_values(issue.params.at("options"), " | ");
            if (str_param(issue, "reason") == "multiple") return "Invalid input: more than one union member matched";
            return "Invalid input: no union member matched";
        }
        case IssueCode::InvalidKey:
            return "Invalid key in " + (issue.origin.empty() ? std::string("value") : issue.origin);
        case IssueCode::InvalidElement: {
            std::string where = issue.origin.empty() ? std::string("value") : issue.origin;
            if (!issue.issues.empty()) {
                std::string inner = issue.issues.front().message.empty() ? default_message(issue.issues.front())
                                                                         : issue.issues.front().message;
                return "Invalid value in " + where + ": " + inner;
            }
            return "Invalid value in " + where;
        }
        case IssueCode::InvalidIntersection: {
            std::string reason = str_param(issue, "reason");
            if (reason.empty()) return "Intersection results could not be merged";
            return "Intersection results could not be merged: " + reason;
        }
        case IssueCode::Custom: {
            std::string msg = str_param(issue, "message");
            return msg.empty() ? "Invalid input" : msg;
        }
    }
    return "Invalid input";
}

Issue finalize_issue(const RawIssue& raw, const ParseContext* ctx) {
    std::optional<std::string> message;
    if (!raw.message.empty()) message = raw.message;
    if (!message && raw.check_error) message = raw.check_error(raw);
    if ((!message || message->empty()) && raw.schema_error) message = raw.schema_error(raw);
    if ((!message || message->empty()) && ctx && ctx->error_map) message = ctx->error_map(raw);
    if (!message || message->empty()) {
        auto cfg = config();
        if (cfg->custom_error) message = cfg->custom_error(raw);
        if (!message || message->empty()) {
            std::string locale = (ctx && !ctx->locale.empty()) ? ctx->locale : cfg->default_locale;
            auto it = cfg->locales.find(locale);
            if (it != cfg->locales.end() && it->second) message = it->second(raw);
        }
    }

    Issue out;
    out.code = raw.code;
    out.path = raw.path;
    out.message = (message && !message->empty()) ? *message : default_message(raw);
    out.origin = raw.origin;
    out.params = raw.params;
    if (ctx && ctx->report_input) out.input = raw.input;
    for (auto const& branch : raw.branches) out.branches.push_back(finalize_issues(branch, ctx));
    out.issues = finalize_issues(raw.issues, ctx);
    return out;
}

std::vector<Issue> finalize_issues(const std::vector<RawIssue>& raw, const ParseContext* ctx) {
    std::vector<Issue> out;
    out.reserve(raw.size());
    for (auto const& r : raw) out.push_back(finalize_issue(r, ctx));
    return out;
}

RawIssue make_invalid_type(const std::string& expected, const Value& input) {
    RawIssue issue;
    issue.code = IssueCode::InvalidType;
    issue.input = input;
    issue.params["expected"] = expected;
    issue.params["received"] = received_type_name(input);
    return issue;
}

static RawIssue make_bound(IssueCode code, const char* key, const std::string& origin, const Value& bound,
                           bool inclusive, const Value& input, bool exact) {
    RawIssue issue;
    issue.code = code;
    issue.input = input;
    issue.origin = origin;
    issue.params["origin"] = origin;
    issue.params[key] = bound;
    issue.params["inclusive"] = inclusive;
    if (exact) issue.params["exact"] = true;
    return issue;
}

RawIssue make_too_small(const std::string& origin, const Value& minimum, bool inclusive, const Value& input,
                        bool exact) {
    return make_bound(IssueCode::TooSmall, "minimum", origin, minimum, inclusive, input, exact);
}

RawIssue make_too_big(const std::string& origin, const Value& maximum, bool inclusive, const Value& input,
                      bool exact) {
    return make_bound(IssueCode::TooBig, "maximum", origin, maximum, inclusive, input, exact);
}

RawIssue make_invalid_format(const std::string& format, const Value& input) {
    RawIssue issue;
    issue.code = IssueCode::InvalidFormat;
    issue.input = input;
    issue.origin = "string";
    issue.params["format"] = format;
    return issue;
}

RawIssue make_custom(const std::string& message, const Value& input) {
    RawIssue issue;
    issue.code = IssueCode::Custom;
    issue.input = input;
    issue.message = message;
    return issue;
}

}  // namespace sc
