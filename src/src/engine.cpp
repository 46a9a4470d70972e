#include <sc/schema.h>
#include <sc/coerce.h>
#include <sc/config.h>
#include <sc/merge.h>
#include <array>
#include <cfloat>
#include <cmath>
#include <limits>

namespace sc {

namespace {
    using ParseFn = void (*)(const SchemaNode&, Payload&);

    bool is_nil(const Value& v) { return v.isNull() || v.isNullPointer(); }

    // Kinds that reject nil outright and see through pointer holders.
    bool nil_gated(Kind k) {
        switch (k) {
            case Kind::String:
            case Kind::Number:
            case Kind::BigInt:
            case Kind::Bool:
            case Kind::Array:
            case Kind::Tuple:
            case Kind::Set:
            case Kind::Map:
            case Kind::Record:
            case Kind::Object:
            case Kind::DiscriminatedUnion:
            case Kind::Function:
            case Kind::File:
                return true;
            default:
                return false;
        }
    }

    bool unwraps_pointer(Kind k) { return nil_gated(k) || k == Kind::Literal || k == Kind::Enum; }

    std::string expected_name(const SchemaNode& node) {
        switch (node.kind) {
            case Kind::Number:
                return node.number_kind == NumberKind::Float64 ? "number" : number_kind_name(node.number_kind);
            case Kind::DiscriminatedUnion:
                return "object";
            default:
                return kind_name(node.kind);
        }
    }

    void invalid_type(const std::string& expected, Payload& p) { p.add_issue(make_invalid_type(expected, p.value)); }

    void callback_failed(const std::exception& e, Payload& p) { p.add_issue(make_custom(e.what(), p.value)); }

    PathKey path_key(const Value& key) {
        if (key.isString()) return key.asString();
        if (key.isInt()) return key.asInt();
        return key.dump();
    }

    std::string path_text(const Path& path) { return path.empty() ? std::string("<root>") : to_dot_path(path); }

    // Checks without a `when` predicate only run on a value that passed the
    // type step; `type_failed` says it did not.
    void run_checks(const SchemaNode& node, Payload& p, bool type_failed) {
        bool abort_all = p.ctx && p.ctx->abort_early;
        for (auto const& check : node.checks) {
            size_t before = p.issues.size();
            try {
                if (check.when ? !check.when(p) : type_failed) continue;
                check.fn(p);
            } catch (const std::exception& e) {
                callback_failed(e, p);
            }
            for (size_t i = before; i < p.issues.size(); ++i)
                if (!p.issues[i].check_error && check.error) p.issues[i].check_error = check.error;
            if (p.issues.size() > before && (check.abort || abort_all)) {
                if (debug_enabled()) debug_log("  check '" + check.kind + "' aborted at " + path_text(p.path));
                break;
            }
        }
    }

    std::optional<Value> coerce_for(const SchemaNode& node, const Value& v) {
        switch (node.kind) {
            case Kind::String:
                return coerce_to_string(v);
            case Kind::Number:
                return coerce_to_number(v, node.number_kind);
            case Kind::Bool:
                return coerce_to_bool(v);
            case Kind::BigInt:
                return coerce_to_bigint(v);
            default:
                return std::nullopt;
        }
    }

    Value wrap_callable(const Schema& args, const Schema& returns, const std::shared_ptr<const Callable>& target,
                        const ParseContext& ctx) {
        return Value::function([args, returns, target, ctx](const std::vector<Value>& call_args) {
            Value parsed = must_parse(args, Value::array(call_args), ctx);
            Value result = (*target)(parsed.asArray());
            return must_parse(returns, result, ctx);
        });
    }

    // -- optionality of object fields ----------------------------------------

    enum class Presence { Required, Omit, Substitute };

    Presence presence_of(const Schema& s) {
        switch (s.kind()) {
            case Kind::Optional:
                return Presence::Omit;
            case Kind::Default:
            case Kind::Prefault:
            case Kind::Catch:
                return Presence::Substitute;
            case Kind::Readonly:
            case Kind::Nilable:
            case Kind::Pipe:
                return presence_of(s.node().inner.front());
            case Kind::Lazy:
                return presence_of(resolve_lazy(s.node()));
            default:
                return Presence::Required;
        }
    }

    // Handle a key that is absent from the input. Returns true when `out`
    // should receive `value`.
    bool parse_missing(const Schema& field, const std::string& key, Payload& p, Value& value) {
        Presence presence;
        try {
            presence = presence_of(field);
        } catch (const std::exception& e) {
            RawIssue issue = make_custom(e.what(), Value());
            issue.path = {key};
            p.add_issue(std::move(issue));
            return false;
        }
        if (presence == Presence::Omit) return false;
        if (presence == Presence::Required) {
            RawIssue issue = make_invalid_type(field.expected_type(), Value());
            issue.params["received"] = "undefined";
            issue.path = {key};
            p.add_issue(std::move(issue));
            return false;
        }
        Payload child = p.child(key, Value());
        parse_payload(field, child);
        if (!child.ok()) {
            p.merge_child(key, std::move(child.issues));
            return false;
        }
        value = std::move(child.value);
        return true;
    }

    // -- primitives ----------------------------------------------------------

    void parse_string(const SchemaNode&, Payload& p) {
        if (!p.value.isString()) invalid_type("string", p);
    }

    struct IntRange {
        int64_t lo, hi;
    };

    IntRange int_range(NumberKind k) {
        switch (k) {
            case NumberKind::Int8:
                return {std::numeric_limits<int8_t>::min(), std::numeric_limits<int8_t>::max()};
            case NumberKind::Int16:
                return {std::numeric_limits<int16_t>::min(), std::numeric_limits<int16_t>::max()};
            case NumberKind::Int32:
                return {std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max()};
            case NumberKind::Uint8:
                return {0, std::numeric_limits<uint8_t>::max()};
            case NumberKind::Uint16:
                return {0, std::numeric_limits<uint16_t>::max()};
            case NumberKind::Uint32:
                return {0, std::numeric_limits<uint32_t>::max()};
            case NumberKind::Uint64:
                return {0, std::numeric_limits<int64_t>::max()};
            default:
                return {std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max()};
        }
    }

    void parse_number(const SchemaNode& node, Payload& p) {
        const NumberKind nk = node.number_kind;
        const std::string expected = nk == NumberKind::Float64 ? "number" : number_kind_name(nk);
        Value& v = p.value;
        if (!v.isNumber() || (v.isDouble() && std::isnan(v.asDouble()))) {
            invalid_type(expected, p);
            return;
        }
        const std::string origin = number_kind_name(nk);
        if (nk == NumberKind::Float64) return;
        if (nk == NumberKind::Float32) {
            double d = v.asDouble();
            if (std::isfinite(d) && d > FLT_MAX)
                p.add_issue(make_too_big(origin, Value(static_cast<double>(FLT_MAX)), true, v));
            else if (std::isfinite(d) && d < -FLT_MAX)
                p.add_issue(make_too_small(origin, Value(-static_cast<double>(FLT_MAX)), true, v));
            return;
        }

        IntRange range = int_range(nk);
        if (v.isDouble()) {
            double d = v.asDouble();
            if (!std::isfinite(d) || std::trunc(d) != d) {
                invalid_type(expected, p);
                return;
            }
            if (d < static_cast<double>(range.lo)) {
                p.add_issue(make_too_small(origin, range.lo, true, v));
                return;
            }
            // 2^63 is the first double above INT64_MAX
            if (d > static_cast<double>(range.hi) || d >= 9223372036854775808.0) {
                p.add_issue(make_too_big(origin, range.hi, true, v));
                return;
            }
            v = Value(static_cast<int64_t>(d));
            return;
        }
        int64_t n = v.asInt();
        if (n < range.lo)
            p.add_issue(make_too_small(origin, range.lo, true, v));
        else if (n > range.hi)
            p.add_issue(make_too_big(origin, range.hi, true, v));
    }

    void parse_bigint(const SchemaNode&, Payload& p) {
        if (!p.value.isBigInt()) invalid_type("bigint", p);
    }

    void parse_bool(const SchemaNode&, Payload& p) {
        if (!p.value.isBool()) invalid_type("bool", p);
    }

    void parse_nil(const SchemaNode&, Payload& p) {
        if (!is_nil(p.value)) invalid_type("null", p);
    }

    void parse_pass(const SchemaNode&, Payload&) {}

    void parse_never(const SchemaNode&, Payload& p) { invalid_type("never", p); }

    void parse_values(const SchemaNode& node, Payload& p) {
        const Value probe = p.value.isNullPointer() ? Value() : p.value;
        for (auto const& v : node.values)
            if (v == probe) return;
        if (is_nil(p.value)) {
            invalid_type(expected_name(node), p);
            return;
        }
        RawIssue issue;
        issue.code = IssueCode::InvalidValue;
        issue.input = p.value;
        issue.params["values"] = Value::array(node.values);
        p.add_issue(std::move(issue));
    }

    void parse_file(const SchemaNode&, Payload& p) {
        if (!p.value.isFile()) invalid_type("file", p);
    }

    void parse_custom(const SchemaNode& node, Payload& p) {
        if (!node.predicate) return;
        bool ok = false;
        try {
            ok = node.predicate(p.value);
        } catch (const std::exception& e) {
            callback_failed(e, p);
            return;
        }
        if (!ok) p.add_issue(make_custom(node.message, p.value));
    }

    // -- containers ----------------------------------------------------------

    void parse_array(const SchemaNode& node, Payload& p) {
        if (!p.value.isArray()) {
            invalid_type("array", p);
            return;
        }
        const Schema& element = node.inner.front();
        const Value input = std::move(p.value);
        Value out = Value::array();
        for (size_t i = 0; i < input.size(); ++i) {
            const int64_t idx = static_cast<int64_t>(i);
            Payload child = p.child(idx, input.at(i));
            parse_payload(element, child);
            if (child.ok())
                out.push_back(std::move(child.value));
            else
                p.merge_child(idx, std::move(child.issues));
        }
        p.value = p.ok() ? std::move(out) : input;
    }

    void parse_tuple(const SchemaNode& node, Payload& p) {
        if (!p.value.isArray()) {
            invalid_type("tuple", p);
            return;
        }
        const Value input = p.value;
        const size_t n_items = node.inner.size();
        size_t required = n_items;
        try {
            while (required > 0 && presence_of(node.inner[required - 1]) != Presence::Required) --required;
        } catch (const std::exception& e) {
            callback_failed(e, p);
            return;
        }

        const size_t len = input.size();
        if (len < required) {
            p.add_issue(make_too_small("array", static_cast<int64_t>(required), true, input,
                                       !node.rest && required == n_items));
            return;
        }
        if (!node.rest && len > n_items) {
            p.add_issue(make_too_big("array", static_cast<int64_t>(n_items), true, input,
                                     required == n_items));
            return;
        }

        Value out = Value::array();
        for (size_t i = 0; i < len; ++i) {
            const Schema& item = i < n_items ? node.inner[i] : *node.rest;
            const int64_t idx = static_cast<int64_t>(i);
            Payload child = p.child(idx, input.at(i));
            parse_payload(item, child);
            if (child.ok())
                out.push_back(std::move(child.value));
            else
                p.merge_child(idx, std::move(child.issues));
        }
        if (p.ok()) p.value = std::move(out);
    }

    void parse_set(const SchemaNode& node, Payload& p) {
        if (!p.value.isSet()) {
            invalid_type("set", p);
            return;
        }
        const Schema& element = node.inner.front();
        const Value input = p.value;
        Value out = Value::set();
        for (size_t i = 0; i < input.size(); ++i) {
            const PathKey at = static_cast<int64_t>(i);
            Payload trial = p.child(at, input.at(i));
            parse_payload(element, trial);
            if (trial.ok()) {
                out.insert(std::move(trial.value));
                continue;
            }
            RawIssue issue;
            issue.code = IssueCode::InvalidElement;
            issue.origin = "set";
            issue.input = input.at(i);
            issue.path = {at};
            issue.params["index"] = static_cast<int64_t>(i);
            issue.issues = std::move(trial.issues);
            p.add_issue(std::move(issue));
        }
        if (p.ok()) p.value = std::move(out);
    }

    void parse_map(const SchemaNode& node, Payload& p) {
        if (!p.value.isMap()) {
            invalid_type("map", p);
            return;
        }
        const Schema& key_schema = node.inner[0];
        const Schema& value_schema = node.inner[1];
        const Value input = p.value;
        Value out = Value::map();
        for (auto const& entry : input.asEntries()) {
            Payload key = p.sibling(entry.first);
            parse_payload(key_schema, key);
            if (!key.ok()) {
                RawIssue issue;
                issue.code = IssueCode::InvalidKey;
                issue.origin = "map";
                issue.input = entry.first;
                issue.params["key"] = entry.first;
                issue.issues = std::move(key.issues);
                p.add_issue(std::move(issue));
                continue;
            }
            const PathKey at = path_key(entry.first);
            Payload value = p.child(at, entry.second);
            parse_payload(value_schema, value);
            if (!value.ok()) {
                RawIssue issue;
                issue.code = IssueCode::InvalidElement;
                issue.origin = "map";
                issue.input = entry.second;
                issue.path = {at};
                issue.params["key"] = entry.first;
                issue.issues = std::move(value.issues);
                p.add_issue(std::move(issue));
                continue;
            }
            out.insert(std::move(key.value), std::move(value.value));
        }
        if (p.ok()) p.value = std::move(out);
    }

    // Keys required by an enum or literal key schema, if any.
    std::vector<std::string> exhaustive_keys(const Schema& key_schema) {
        std::vector<std::string> keys;
        if (key_schema.kind() != Kind::Enum && key_schema.kind() != Kind::Literal) return keys;
        for (auto const& v : key_schema.node().values) {
            if (!v.isString()) return {};
            keys.push_back(v.asString());
        }
        return keys;
    }

    void parse_record(const SchemaNode& node, Payload& p) {
        if (!p.value.isObject()) {
            invalid_type("record", p);
            return;
        }
        const Schema& key_schema = node.inner[0];
        const Schema& value_schema = node.inner[1];
        const Value input = p.value;
        Value out = Value::object();
        for (auto const& kv : input.asObject()) {
            Payload key = p.sibling(kv.first);
            parse_payload(key_schema, key);
            if (!key.ok()) {
                RawIssue issue;
                issue.code = IssueCode::InvalidKey;
                issue.origin = "record";
                issue.input = kv.first;
                issue.path = {kv.first};
                issue.params["key"] = kv.first;
                issue.issues = std::move(key.issues);
                p.add_issue(std::move(issue));
                continue;
            }
            Payload value = p.child(kv.first, kv.second);
            parse_payload(value_schema, value);
            if (!value.ok()) {
                p.merge_child(kv.first, std::move(value.issues));
                continue;
            }
            const std::string out_key = key.value.isString() ? key.value.asString() : key.value.dump();
            out[out_key] = std::move(value.value);
        }
        for (auto const& k : exhaustive_keys(key_schema)) {
            if (input.has(k)) continue;
            Value substitute;
            if (parse_missing(value_schema, k, p, substitute)) out[k] = std::move(substitute);
        }
        if (p.ok()) p.value = std::move(out);
    }

    void parse_object(const SchemaNode& node, Payload& p) {
        if (!p.value.isObject()) {
            invalid_type("object", p);
            return;
        }
        const Value input = p.value;
        Value out = Value::object();
        for (auto const& field : node.shape) {
            const std::string& key = field.first;
            if (!input.has(key)) {
                Value substitute;
                if (parse_missing(field.second, key, p, substitute)) out[key] = std::move(substitute);
                continue;
            }
            Payload child = p.child(key, input.at(key));
            parse_payload(field.second, child);
            if (child.ok())
                out[key] = std::move(child.value);
            else
                p.merge_child(key, std::move(child.issues));
        }

        UnknownKeys mode = node.unknown_keys;
        if (mode == UnknownKeys::Strip && p.ctx && p.ctx->strict) mode = UnknownKeys::Strict;
        Value unrecognised = Value::array();
        for (auto const& kv : input.asObject()) {
            bool known = false;
            for (auto const& field : node.shape) known = known || field.first == kv.first;
            if (known) continue;
            switch (mode) {
                case UnknownKeys::Strip:
                    break;
                case UnknownKeys::Strict:
                    unrecognised.push_back(kv.first);
                    break;
                case UnknownKeys::Passthrough:
                    out[kv.first] = kv.second;
                    break;
                case UnknownKeys::Catchall: {
                    Payload child = p.child(kv.first, kv.second);
                    parse_payload(*node.rest, child);
                    if (child.ok())
                        out[kv.first] = std::move(child.value);
                    else
                        p.merge_child(kv.first, std::move(child.issues));
                    break;
                }
            }
        }
        if (!unrecognised.empty()) {
            RawIssue issue;
            issue.code = IssueCode::UnrecognisedKeys;
            issue.origin = "object";
            issue.input = input;
            issue.params["keys"] = unrecognised;
            p.add_issue(std::move(issue));
        }
        if (p.ok()) p.value = std::move(out);
    }

    // -- unions and intersection ---------------------------------------------

    void parse_union(const SchemaNode& node, Payload& p) {
        std::vector<std::vector<RawIssue> > branches;
        for (auto const& member : node.inner) {
            Payload trial = p.sibling(p.value);
            parse_payload(member, trial);
            if (trial.ok()) {
                p.value = std::move(trial.value);
                return;
            }
            branches.push_back(std::move(trial.issues));
        }
        RawIssue issue;
        issue.code = IssueCode::InvalidUnion;
        issue.input = p.value;
        issue.branches = std::move(branches);
        p.add_issue(std::move(issue));
    }

    void parse_exclusive_union(const SchemaNode& node, Payload& p) {
        std::vector<std::vector<RawIssue> > branches;
        std::optional<Value> match;
        size_t matches = 0;
        for (auto const& member : node.inner) {
            Payload trial = p.sibling(p.value);
            parse_payload(member, trial);
            if (trial.ok()) {
                if (++matches == 1) match = std::move(trial.value);
            } else {
                branches.push_back(std::move(trial.issues));
            }
        }
        if (matches == 1) {
            p.value = std::move(*match);
            return;
        }
        RawIssue issue;
        issue.code = IssueCode::InvalidUnion;
        issue.input = p.value;
        if (matches > 1) {
            issue.params["reason"] = "multiple";
            issue.params["matches"] = static_cast<int64_t>(matches);
        } else {
            issue.branches = std::move(branches);
        }
        p.add_issue(std::move(issue));
    }

    void parse_discriminated_union(const SchemaNode& node, Payload& p) {
        if (!p.value.isObject()) {
            invalid_type("object", p);
            return;
        }
        const Value tag = p.value.has(node.discriminator) ? p.value.at(node.discriminator) : Value();
        for (auto const& entry : node.discriminator_map) {
            if (entry.first == tag) {
                parse_payload(node.inner[entry.second], p);
                return;
            }
        }
        Value options = Value::array();
        for (auto const& entry : node.discriminator_map) options.push_back(entry.first);
        RawIssue issue;
        issue.code = IssueCode::InvalidUnion;
        issue.input = tag;
        issue.path = {node.discriminator};
        issue.params["discriminator"] = node.discriminator;
        issue.params["options"] = options;
        p.add_issue(std::move(issue));
    }

    void parse_intersection(const SchemaNode& node, Payload& p) {
        Payload left = p.sibling(p.value);
        parse_payload(node.inner[0], left);
        Payload right = p.sibling(p.value);
        parse_payload(node.inner[1], right);
        if (!left.ok() || !right.ok()) {
            p.merge(std::move(left.issues));
            p.merge(std::move(right.issues));
            return;
        }
        MergeResult merged = merge_values(left.value, right.value);
        if (merged.ok) {
            p.value = std::move(merged.value);
            return;
        }
        RawIssue issue;
        issue.code = IssueCode::InvalidIntersection;
        issue.input = p.value;
        issue.params["reason"] = merged.conflict.empty() ? std::string("incompatible values")
                                                         : "incompatible values at " + to_dot_path(merged.conflict);
        Value at = Value::array();
        for (auto const& key : merged.conflict) {
            if (auto idx = std::get_if<int64_t>(&key))
                at.push_back(*idx);
            else
                at.push_back(std::get<std::string>(key));
        }
        issue.params["path"] = at;
        p.add_issue(std::move(issue));
    }

    // -- deferred, callable and pipeline kinds -------------------------------

    void parse_lazy(const SchemaNode& node, Payload& p) {
        const Schema* target = nullptr;
        try {
            target = &resolve_lazy(node);
        } catch (const std::exception& e) {
            callback_failed(e, p);
            return;
        }
        parse_payload(*target, p);
    }

    void parse_function(const SchemaNode& node, Payload& p) {
        if (!p.value.isFunction()) {
            invalid_type("function", p);
            return;
        }
        p.value = wrap_callable(node.inner[0], node.inner[1], p.value.asFunction(), p.ctx ? *p.ctx : ParseContext{});
    }

    void parse_pipe(const SchemaNode& node, Payload& p) {
        Payload first = p.sibling(p.value);
        parse_payload(node.inner[0], first);
        if (!first.ok()) {
            p.merge(std::move(first.issues));
            return;
        }
        Payload second = p.sibling(std::move(first.value));
        parse_payload(node.inner[1], second);
        p.merge(std::move(second.issues));
        p.value = std::move(second.value);
    }

    void parse_transform(const SchemaNode& node, Payload& p) {
        const size_t before = p.issues.size();
        try {
            Value out = node.transform(p.value, p);
            p.value = p.issues.size() == before ? std::move(out) : Value();
        } catch (const std::exception& e) {
            callback_failed(e, p);
            p.value = Value();
        }
    }

    // -- wrappers ------------------------------------------------------------

    void parse_inner(const SchemaNode& node, Payload& p) { parse_payload(node.inner.front(), p); }

    void parse_optional(const SchemaNode& node, Payload& p) {
        if (is_nil(p.value)) return;
        parse_inner(node, p);
    }

    bool substitute(const SchemaNode& node, Payload& p) {
        try {
            p.value = node.factory ? node.factory() : node.fallback;
            return true;
        } catch (const std::exception& e) {
            callback_failed(e, p);
            return false;
        }
    }

    void parse_default(const SchemaNode& node, Payload& p) {
        if (is_nil(p.value)) {
            substitute(node, p);
            return;
        }
        parse_inner(node, p);
    }

    void parse_prefault(const SchemaNode& node, Payload& p) {
        if (is_nil(p.value) && !substitute(node, p)) return;
        parse_inner(node, p);
    }

    void parse_catch(const SchemaNode& node, Payload& p) {
        Payload trial = p.sibling(p.value);
        parse_inner(node, trial);
        if (trial.ok()) {
            p.value = std::move(trial.value);
            return;
        }
        if (!node.catch_fn) {
            p.value = node.fallback;
            return;
        }
        try {
            p.value = node.catch_fn(finalize_issues(trial.issues, p.ctx), p.value);
        } catch (const std::exception& e) {
            callback_failed(e, p);
        }
    }

    const std::array<ParseFn, kind_count>& dispatch_table() {
        static const std::array<ParseFn, kind_count> table = [] {
            std::array<ParseFn, kind_count> t{};
            auto at = [&t](Kind k) -> ParseFn& { return t[static_cast<size_t>(k)]; };
            at(Kind::String) = parse_string;
            at(Kind::Number) = parse_number;
            at(Kind::BigInt) = parse_bigint;
            at(Kind::Bool) = parse_bool;
            at(Kind::Nil) = parse_nil;
            at(Kind::Any) = parse_pass;
            at(Kind::Unknown) = parse_pass;
            at(Kind::Never) = parse_never;
            at(Kind::Literal) = parse_values;
            at(Kind::Enum) = parse_values;
            at(Kind::Array) = parse_array;
            at(Kind::Tuple) = parse_tuple;
            at(Kind::Set) = parse_set;
            at(Kind::Map) = parse_map;
            at(Kind::Record) = parse_record;
            at(Kind::Object) = parse_object;
            at(Kind::Union) = parse_union;
            at(Kind::DiscriminatedUnion) = parse_discriminated_union;
            at(Kind::ExclusiveUnion) = parse_exclusive_union;
            at(Kind::Intersection) = parse_intersection;
            at(Kind::Lazy) = parse_lazy;
            at(Kind::Function) = parse_function;
            at(Kind::Pipe) = parse_pipe;
            at(Kind::Transform) = parse_transform;
            at(Kind::Readonly) = parse_inner;
            at(Kind::Optional) = parse_optional;
            at(Kind::Nilable) = parse_optional;
            at(Kind::Default) = parse_default;
            at(Kind::Prefault) = parse_prefault;
            at(Kind::Catch) = parse_catch;
            at(Kind::Custom) = parse_custom;
            at(Kind::File) = parse_file;
            return t;
        }();
        return table;
    }

    // Pointer holders are opened before the nil gate and coercion, and the
    // result is wrapped in a fresh pointer once everything passed.
    void parse_value_node(const SchemaNode& node, Payload& p, ParseFn fn) {
        const bool held = p.value.isPointer() && p.value.pointee();
        if (held) {
            Value inner = *p.value.pointee();
            p.value = std::move(inner);
        }
        if (nil_gated(node.kind) && is_nil(p.value)) {
            invalid_type(expected_name(node), p);
            return;
        }
        if (node.coerce) {
            std::optional<Value> converted = coerce_for(node, p.value);
            if (converted) p.value = std::move(*converted);
        }
        const size_t before = p.issues.size();
        fn(node, p);
        run_checks(node, p, p.issues.size() != before);
        if (held && p.issues.size() == before) p.value = Value::pointer(std::move(p.value));
    }
}  // namespace

void parse_payload(const Schema& schema, Payload& p) {
    const SchemaNode& node = schema.node();
    if (debug_enabled()) debug_log(std::string("parse ") + kind_name(node.kind) + " at " + path_text(p.path));

    ParseFn fn = dispatch_table()[static_cast<size_t>(node.kind)];
    const size_t before = p.issues.size();
    if (unwraps_pointer(node.kind)) {
        parse_value_node(node, p, fn);
    } else {
        fn(node, p);
        run_checks(node, p, p.issues.size() != before);
    }

    if (node.error) {
        for (size_t i = before; i < p.issues.size(); ++i) {
            RawIssue& issue = p.issues[i];
            if (issue.path.empty() && !issue.schema_error) issue.schema_error = node.error;
        }
    }
    if (debug_enabled() && p.issues.size() > before)
        debug_log("  " + std::to_string(p.issues.size() - before) + " issue(s) from " + kind_name(node.kind));
}

ParseResult parse(const Schema& schema, const Value& input, const ParseContext& ctx) {
    Payload p(input, &ctx);
    parse_payload(schema, p);
    ParseResult result;
    if (p.ok()) {
        result.value = std::move(p.value);
        return result;
    }
    result.error = ValidationError(finalize_issues(p.issues, &ctx), ctx.report_format);
    return result;
}

ParseResult safe_parse(const Schema& schema, const Value& input, const ParseContext& ctx) {
    return parse(schema, input, ctx);
}

Value must_parse(const Schema& schema, const Value& input, const ParseContext& ctx) {
    ParseResult result = parse(schema, input, ctx);
    if (!result.ok()) throw ParseError(std::move(*result.error));
    return std::move(result.value);
}

Value validated_function(const Schema& fn_schema, const std::shared_ptr<const Callable>& target,
                         const ParseContext& ctx) {
    if (fn_schema.kind() != Kind::Function) throw std::logic_error("validated_function requires a function schema");
    return wrap_callable(fn_schema.node().inner[0], fn_schema.node().inner[1], target, ctx);
}

}  // namespace sc
