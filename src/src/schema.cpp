#include <sc/schema.h>
#include <cmath>
#include <mutex>

namespace sc {

struct LazyState {
    std::function<Schema()> thunk;
    std::once_flag once;
    std::optional<Schema> resolved;
};

const char* kind_name(Kind kind) {
    switch (kind) {
        case Kind::String:
            return "string";
        case Kind::Number:
            return "number";
        case Kind::BigInt:
            return "bigint";
        case Kind::Bool:
            return "bool";
        case Kind::Nil:
            return "nil";
        case Kind::Any:
            return "any";
        case Kind::Unknown:
            return "unknown";
        case Kind::Never:
            return "never";
        case Kind::Literal:
            return "literal";
        case Kind::Enum:
            return "enum";
        case Kind::Array:
            return "array";
        case Kind::Tuple:
            return "tuple";
        case Kind::Set:
            return "set";
        case Kind::Map:
            return "map";
        case Kind::Record:
            return "record";
        case Kind::Object:
            return "object";
        case Kind::Union:
            return "union";
        case Kind::DiscriminatedUnion:
            return "discriminated_union";
        case Kind::ExclusiveUnion:
            return "exclusive_union";
        case Kind::Intersection:
            return "intersection";
        case Kind::Lazy:
            return "lazy";
        case Kind::Function:
            return "function";
        case Kind::Pipe:
            return "pipe";
        case Kind::Transform:
            return "transform";
        case Kind::Readonly:
            return "readonly";
        case Kind::Optional:
            return "optional";
        case Kind::Nilable:
            return "nilable";
        case Kind::Default:
            return "default";
        case Kind::Prefault:
            return "prefault";
        case Kind::Catch:
            return "catch";
        case Kind::Custom:
            return "custom";
        case Kind::File:
            return "file";
    }
    return "unknown";
}

const char* number_kind_name(NumberKind kind) {
    switch (kind) {
        case NumberKind::Float64:
            return "float64";
        case NumberKind::Float32:
            return "float32";
        case NumberKind::Int8:
            return "int8";
        case NumberKind::Int16:
            return "int16";
        case NumberKind::Int32:
            return "int32";
        case NumberKind::Int64:
            return "int64";
        case NumberKind::Uint8:
            return "uint8";
        case NumberKind::Uint16:
            return "uint16";
        case NumberKind::Uint32:
            return "uint32";
        case NumberKind::Uint64:
            return "uint64";
    }
    return "number";
}

namespace {
    // Size bounds are whole counts; a fractional or non-numeric bound is a
    // construction error rather than a silently truncated limit.
    int64_t size_bound(const Value& bound, const char* op) {
        if (bound.isInt()) return bound.asInt();
        if (bound.isDouble() && std::isfinite(bound.asDouble()) && std::trunc(bound.asDouble()) == bound.asDouble() &&
            std::fabs(bound.asDouble()) < 9007199254740992.0)
            return static_cast<int64_t>(bound.asDouble());
        throw std::invalid_argument(std::string(op) + "(): size bound must be a whole number, got " + bound.dump());
    }

    Schema make(Kind kind) {
        auto node = std::make_shared<SchemaNode>();
        node->kind = kind;
        return Schema(std::move(node));
    }

    Schema make(std::shared_ptr<SchemaNode> node) { return Schema(std::move(node)); }

    Schema make_number(NumberKind nk) {
        auto node = std::make_shared<SchemaNode>();
        node->kind = Kind::Number;
        node->number_kind = nk;
        return Schema(std::move(node));
    }

    Schema with_inner(Kind kind, std::vector<Schema> inner) {
        auto node = std::make_shared<SchemaNode>();
        node->kind = kind;
        node->inner = std::move(inner);
        return Schema(std::move(node));
    }

    ErrorMap message_hook(const std::string& message) {
        if (message.empty()) return {};
        return [message](const RawIssue&) -> std::optional<std::string> { return message; };
    }

    bool is_size_kind(Kind k) {
        return k == Kind::String || k == Kind::Array || k == Kind::Set || k == Kind::Map || k == Kind::Record ||
               k == Kind::Object || k == Kind::File;
    }

    bool is_numeric_kind(Kind k) { return k == Kind::Number || k == Kind::BigInt; }
}  // namespace

// -- Schema -------------------------------------------------------------------

Schema::Schema() : m_node(std::make_shared<SchemaNode>()) {}

Schema::Schema(std::shared_ptr<const SchemaNode> node) : m_node(std::move(node)) {
    if (!m_node) throw std::invalid_argument("Schema requires a node");
}

Kind Schema::kind() const { return m_node->kind; }

std::string Schema::expected_type() const {
    const SchemaNode& n = *m_node;
    switch (n.kind) {
        case Kind::Number:
            return n.number_kind == NumberKind::Float64 ? "number" : number_kind_name(n.number_kind);
        case Kind::Nil:
            return "null";
        case Kind::DiscriminatedUnion:
            return "object";
        case Kind::Optional:
        case Kind::Nilable:
        case Kind::Default:
        case Kind::Prefault:
        case Kind::Catch:
        case Kind::Readonly:
            return n.inner.front().expected_type();
        case Kind::Pipe:
            return n.inner.front().expected_type();
        case Kind::Lazy:
            return resolve_lazy(n).expected_type();
        default:
            return kind_name(n.kind);
    }
}

ParseResult Schema::parse(const Value& input, const ParseContext& ctx) const { return sc::parse(*this, input, ctx); }

ParseResult Schema::safe_parse(const Value& input, const ParseContext& ctx) const {
    return sc::parse(*this, input, ctx);
}

Value Schema::must_parse(const Value& input, const ParseContext& ctx) const {
    return sc::must_parse(*this, input, ctx);
}

std::shared_ptr<SchemaNode> Schema::clone() const { return std::make_shared<SchemaNode>(*m_node); }

Schema Schema::wrap(Kind kind) const { return with_inner(kind, {*this}); }

void Schema::require_kind(std::initializer_list<Kind> kinds, const char* op) const {
    for (Kind k : kinds)
        if (k == m_node->kind) return;
    throw std::logic_error(std::string(op) + "() is not supported on " + kind_name(m_node->kind) + " schemas");
}

Schema Schema::with_check(Check c, const std::string& message) const {
    if (!message.empty()) c.error = message_hook(message);
    auto node = clone();
    node->checks.push_back(std::move(c));
    return make(std::move(node));
}

// -- wrappers -----------------------------------------------------------------

Schema Schema::optional() const { return wrap(Kind::Optional); }
Schema Schema::nilable() const { return wrap(Kind::Nilable); }
Schema Schema::nullish() const { return nilable().optional(); }

Schema Schema::non_optional() const {
    if (m_node->kind == Kind::Optional) return m_node->inner.front();
    return *this;
}

Schema Schema::readonly() const { return wrap(Kind::Readonly); }

Schema Schema::default_value(Value v) const {
    auto node = std::make_shared<SchemaNode>();
    node->kind = Kind::Default;
    node->inner = {*this};
    node->fallback = std::move(v);
    return make(std::move(node));
}

Schema Schema::default_fn(std::function<Value()> fn) const {
    if (!fn) throw std::invalid_argument("default_fn requires a callable");
    auto node = std::make_shared<SchemaNode>();
    node->kind = Kind::Default;
    node->inner = {*this};
    node->factory = std::move(fn);
    return make(std::move(node));
}

Schema Schema::prefault(Value v) const {
    auto node = std::make_shared<SchemaNode>();
    node->kind = Kind::Prefault;
    node->inner = {*this};
    node->fallback = std::move(v);
    return make(std::move(node));
}

Schema Schema::prefault_fn(std::function<Value()> fn) const {
    if (!fn) throw std::invalid_argument("prefault_fn requires a callable");
    auto node = std::make_shared<SchemaNode>();
    node->kind = Kind::Prefault;
    node->inner = {*this};
    node->factory = std::move(fn);
    return make(std::move(node));
}

Schema Schema::catch_value(Value v) const {
    auto node = std::make_shared<SchemaNode>();
    node->kind = Kind::Catch;
    node->inner = {*this};
    node->fallback = std::move(v);
    return make(std::move(node));
}

Schema Schema::catch_fn(CatchFn fn) const {
    if (!fn) throw std::invalid_argument("catch_fn requires a callable");
    auto node = std::make_shared<SchemaNode>();
    node->kind = Kind::Catch;
    node->inner = {*this};
    node->catch_fn = std::move(fn);
    return make(std::move(node));
}

// -- metadata -----------------------------------------------------------------

Schema Schema::describe(const std::string& description) const {
    auto node = clone();
    node->meta["description"] = description;
    return make(std::move(node));
}

Schema Schema::meta(const Value& fields) const {
    if (!fields.isObject()) throw std::invalid_argument("meta() expects an object");
    auto node = clone();
    for (auto const& kv : fields.asObject()) node->meta[kv.first] = kv.second;
    return make(std::move(node));
}

Schema Schema::brand(const std::string& tag) const {
    auto node = clone();
    node->meta["brand"] = tag;
    return make(std::move(node));
}

Schema Schema::error(ErrorMap map) const {
    auto node = clone();
    node->error = std::move(map);
    return make(std::move(node));
}

Schema Schema::error(const std::string& message) const { return error(message_hook(message)); }

std::string Schema::description() const {
    return m_node->meta.has("description") ? m_node->meta.at("description").asString() : std::string();
}

std::string Schema::brand_name() const {
    return m_node->meta.has("brand") ? m_node->meta.at("brand").asString() : std::string();
}

const Value& Schema::metadata() const { return m_node->meta; }

Schema Schema::coerce() const {
    require_kind({Kind::String, Kind::Number, Kind::BigInt, Kind::Bool}, "coerce");
    auto node = clone();
    node->coerce = true;
    return make(std::move(node));
}

bool Schema::coerces() const { return m_node->coerce; }

// -- checks -------------------------------------------------------------------

Schema Schema::min(const Value& bound, const std::string& message) const {
    if (is_numeric_kind(kind())) return gte(bound, message);
    if (!is_size_kind(kind())) require_kind({}, "min");
    return with_check(check_size(SizeBound::Min, kind_name(kind()), size_bound(bound, "min")), message);
}

Schema Schema::max(const Value& bound, const std::string& message) const {
    if (is_numeric_kind(kind())) return lte(bound, message);
    if (!is_size_kind(kind())) require_kind({}, "max");
    return with_check(check_size(SizeBound::Max, kind_name(kind()), size_bound(bound, "max")), message);
}

Schema Schema::length(int64_t n, const std::string& message) const {
    require_kind({Kind::String, Kind::Array}, "length");
    return with_check(check_size(SizeBound::Exact, kind_name(kind()), n), message);
}

Schema Schema::size(int64_t n, const std::string& message) const {
    if (!is_size_kind(kind())) require_kind({}, "size");
    return with_check(check_size(SizeBound::Exact, kind_name(kind()), n), message);
}

Schema Schema::nonempty(const std::string& message) const {
    require_kind({Kind::String, Kind::Array, Kind::Set, Kind::Map, Kind::Record}, "nonempty");
    return with_check(check_size(SizeBound::Min, kind_name(kind()), 1), message);
}

Schema Schema::gt(const Value& bound, const std::string& message) const {
    require_kind({Kind::Number, Kind::BigInt}, "gt");
    return with_check(check_compare(Compare::Gt, bound), message);
}

Schema Schema::gte(const Value& bound, const std::string& message) const {
    require_kind({Kind::Number, Kind::BigInt}, "gte");
    return with_check(check_compare(Compare::Gte, bound), message);
}

Schema Schema::lt(const Value& bound, const std::string& message) const {
    require_kind({Kind::Number, Kind::BigInt}, "lt");
    return with_check(check_compare(Compare::Lt, bound), message);
}

Schema Schema::lte(const Value& bound, const std::string& message) const {
    require_kind({Kind::Number, Kind::BigInt}, "lte");
    return with_check(check_compare(Compare::Lte, bound), message);
}

Schema Schema::multiple_of(const Value& divisor, const std::string& message) const {
    require_kind({Kind::Number, Kind::BigInt}, "multiple_of");
    return with_check(check_multiple_of(divisor), message);
}

Schema Schema::positive(const std::string& message) const { return gt(0, message); }
Schema Schema::negative(const std::string& message) const { return lt(0, message); }
Schema Schema::non_negative(const std::string& message) const { return gte(0, message); }
Schema Schema::non_positive(const std::string& message) const { return lte(0, message); }

Schema Schema::finite(const std::string& message) const {
    require_kind({Kind::Number}, "finite");
    return with_check(check_finite(), message);
}

Schema Schema::integer(const std::string& message) const {
    require_kind({Kind::Number}, "integer");
    return with_check(check_int(), message);
}

Schema Schema::safe_int(const std::string& message) const {
    require_kind({Kind::Number}, "safe_int");
    return with_check(check_safe_int(), message);
}

Schema Schema::string_format(const char* method, const std::string& format, const std::string& message) const {
    require_kind({Kind::String}, method);
    return with_check(check_format(format), message);
}

Schema Schema::email(const std::string& message) const { return string_format("email", "email", message); }
Schema Schema::url(const std::string& message) const { return string_format("url", "url", message); }
Schema Schema::uuid(const std::string& message) const { return string_format("uuid", "uuid", message); }
Schema Schema::lowercase(const std::string& message) const { return string_format("lowercase", "lowercase", message); }
Schema Schema::uppercase(const std::string& message) const { return string_format("uppercase", "uppercase", message); }
Schema Schema::ipv4(const std::string& message) const { return string_format("ipv4", "ipv4", message); }
Schema Schema::ipv6(const std::string& message) const { return string_format("ipv6", "ipv6", message); }
Schema Schema::cidrv4(const std::string& message) const { return string_format("cidrv4", "cidrv4", message); }
Schema Schema::cidrv6(const std::string& message) const { return string_format("cidrv6", "cidrv6", message); }
Schema Schema::base64(const std::string& message) const { return string_format("base64", "base64", message); }
Schema Schema::hostname(const std::string& message) const { return string_format("hostname", "hostname", message); }
Schema Schema::iso_date(const std::string& message) const { return string_format("iso_date", "date", message); }
Schema Schema::iso_time(const std::string& message) const { return string_format("iso_time", "time", message); }
Schema Schema::iso_datetime(const std::string& message) const { return string_format("iso_datetime", "datetime", message); }
Schema Schema::iso_duration(const std::string& message) const { return string_format("iso_duration", "duration", message); }

Schema Schema::regex(const std::string& pattern, const std::string& message) const {
    require_kind({Kind::String}, "regex");
    return with_check(check_regex(pattern), message);
}

Schema Schema::starts_with(const std::string& prefix, const std::string& message) const {
    require_kind({Kind::String}, "starts_with");
    return with_check(check_starts_with(prefix), message);
}

Schema Schema::ends_with(const std::string& suffix, const std::string& message) const {
    require_kind({Kind::String}, "ends_with");
    return with_check(check_ends_with(suffix), message);
}

Schema Schema::includes(const std::string& needle, const std::string& message) const {
    require_kind({Kind::String}, "includes");
    return with_check(check_includes(needle), message);
}

Schema Schema::trim() const {
    require_kind({Kind::String}, "trim");
    return with_check(check_trim(), {});
}

Schema Schema::to_lower() const {
    require_kind({Kind::String}, "to_lower");
    return with_check(check_to_lower(), {});
}

Schema Schema::to_upper() const {
    require_kind({Kind::String}, "to_upper");
    return with_check(check_to_upper(), {});
}

Schema Schema::mime(std::vector<std::string> types, const std::string& message) const {
    require_kind({Kind::File}, "mime");
    return with_check(check_mime(std::move(types)), message);
}

Schema Schema::check(Check c) const {
    if (!c.fn) throw std::invalid_argument("check requires a callback");
    return with_check(std::move(c), {});
}

const std::vector<Check>& Schema::checks() const { return m_node->checks; }

// -- refinement and transformation --------------------------------------------

Schema Schema::refine(std::function<bool(const Value&)> pred, RefineParams params) const {
    return with_check(check_refine(std::move(pred), std::move(params)), {});
}

Schema Schema::refine(std::function<bool(const Value&)> pred, const std::string& message) const {
    RefineParams params;
    params.message = message;
    return refine(std::move(pred), std::move(params));
}

Schema Schema::super_refine(std::function<void(const Value&, Payload&)> fn) const {
    return with_check(check_super_refine(std::move(fn)), {});
}

Schema Schema::overwrite(std::function<Value(const Value&)> fn) const {
    return with_check(check_overwrite(std::move(fn)), {});
}

Schema Schema::transform(TransformFn fn) const { return sc::pipe(*this, sc::transform(std::move(fn))); }

Schema Schema::pipe(const Schema& next) const { return sc::pipe(*this, next); }

// -- enum operators -----------------------------------------------------------

const std::vector<Value>& Schema::options() const {
    require_kind({Kind::Enum, Kind::Literal}, "options");
    return m_node->values;
}

Schema Schema::extract(const std::vector<Value>& values) const {
    require_kind({Kind::Enum}, "extract");
    std::vector<Value> kept;
    for (auto const& v : values) {
        bool known = false;
        for (auto const& o : m_node->values) known = known || o == v;
        if (!known) throw std::invalid_argument("extract(): " + v.dump() + " is not an enum member");
        kept.push_back(v);
    }
    return enum_of(std::move(kept));
}

Schema Schema::exclude(const std::vector<Value>& values) const {
    require_kind({Kind::Enum}, "exclude");
    std::vector<Value> kept;
    for (auto const& o : m_node->values) {
        bool drop = false;
        for (auto const& v : values) drop = drop || o == v;
        if (!drop) kept.push_back(o);
    }
    return enum_of(std::move(kept));
}

// -- containers and wrappers --------------------------------------------------

Schema Schema::element() const {
    require_kind({Kind::Array, Kind::Set}, "element");
    return m_node->inner.front();
}

Schema Schema::unwrap() const {
    switch (kind()) {
        case Kind::Optional:
        case Kind::Nilable:
        case Kind::Default:
        case Kind::Prefault:
        case Kind::Catch:
        case Kind::Readonly:
            return m_node->inner.front();
        case Kind::Lazy:
            return resolve_lazy(*m_node);
        default:
            throw std::logic_error(std::string("unwrap() is not supported on ") + kind_name(kind()) + " schemas");
    }
}

Schema Schema::rest(const Schema& tail) const {
    require_kind({Kind::Tuple}, "rest");
    auto node = clone();
    node->rest = tail;
    return make(std::move(node));
}

Value Schema::implement(Callable fn) const {
    require_kind({Kind::Function}, "implement");
    if (!fn) throw std::invalid_argument("implement requires a callable");
    return validated_function(*this, std::make_shared<const Callable>(std::move(fn)), ParseContext{});
}

// -- constructors -------------------------------------------------------------

Schema string() { return make(Kind::String); }
Schema number() { return make_number(NumberKind::Float64); }
Schema float32() { return make_number(NumberKind::Float32); }
Schema float64() { return make_number(NumberKind::Float64); }
Schema integer() { return make_number(NumberKind::Int64); }
Schema int8() { return make_number(NumberKind::Int8); }
Schema int16() { return make_number(NumberKind::Int16); }
Schema int32() { return make_number(NumberKind::Int32); }
Schema int64() { return make_number(NumberKind::Int64); }
Schema uint8() { return make_number(NumberKind::Uint8); }
Schema uint16() { return make_number(NumberKind::Uint16); }
Schema uint32() { return make_number(NumberKind::Uint32); }
Schema uint64() { return make_number(NumberKind::Uint64); }
Schema bigint() { return make(Kind::BigInt); }
Schema boolean() { return make(Kind::Bool); }
Schema nil() { return make(Kind::Nil); }
Schema any() { return make(Kind::Any); }
Schema unknown() { return make(Kind::Unknown); }
Schema never() { return make(Kind::Never); }

Schema literal(Value value) { return literal(std::vector<Value>{std::move(value)}); }

Schema literal(std::vector<Value> values) {
    if (values.empty()) throw std::invalid_argument("literal requires at least one value");
    auto node = std::make_shared<SchemaNode>();
    node->kind = Kind::Literal;
    node->values = std::move(values);
    return make(std::move(node));
}

Schema enum_of(std::vector<Value> values) {
    if (values.empty()) throw std::invalid_argument("enum requires at least one value");
    auto node = std::make_shared<SchemaNode>();
    node->kind = Kind::Enum;
    for (auto& v : values) {
        bool dup = false;
        for (auto const& o : node->values) dup = dup || o == v;
        if (!dup) node->values.push_back(std::move(v));
    }
    return make(std::move(node));
}

Schema native_enum(std::vector<std::pair<std::string, Value> > entries) {
    if (entries.empty()) throw std::invalid_argument("enum requires at least one entry");
    std::vector<Value> values;
    for (auto const& e : entries) values.push_back(e.second);
    Schema base = enum_of(std::move(values));
    auto node = std::make_shared<SchemaNode>(base.node());
    node->enum_entries = std::move(entries);
    return make(std::move(node));
}

Schema array(const Schema& element) { return with_inner(Kind::Array, {element}); }

Schema tuple(std::vector<Schema> items, std::optional<Schema> rest) {
    auto node = std::make_shared<SchemaNode>();
    node->kind = Kind::Tuple;
    node->inner = std::move(items);
    node->rest = std::move(rest);
    return make(std::move(node));
}

Schema set(const Schema& element) { return with_inner(Kind::Set, {element}); }
Schema map(const Schema& key, const Schema& value) { return with_inner(Kind::Map, {key, value}); }
Schema record(const Schema& key, const Schema& value) { return with_inner(Kind::Record, {key, value}); }

Schema union_of(std::vector<Schema> members) {
    if (members.empty()) throw std::invalid_argument("union requires at least one member");
    return with_inner(Kind::Union, std::move(members));
}

Schema exclusive_union(std::vector<Schema> members) {
    if (members.empty()) throw std::invalid_argument("exclusive union requires at least one member");
    return with_inner(Kind::ExclusiveUnion, std::move(members));
}

Schema discriminated_union(const std::string& field, std::vector<Schema> members) {
    if (members.empty()) throw std::invalid_argument("discriminated union requires at least one member");
    auto node = std::make_shared<SchemaNode>();
    node->kind = Kind::DiscriminatedUnion;
    node->discriminator = field;
    for (size_t i = 0; i < members.size(); ++i) {
        const Schema& m = members[i];
        if (m.kind() != Kind::Object)
            throw std::invalid_argument("discriminated union member " + std::to_string(i) + " is not an object");
        const Schema* disc = nullptr;
        for (auto const& f : m.shape())
            if (f.first == field) disc = &f.second;
        if (!disc || (disc->kind() != Kind::Literal && disc->kind() != Kind::Enum))
            throw std::invalid_argument("discriminated union member " + std::to_string(i) +
                                        " has no literal discriminator '" + field + "'");
        for (auto const& v : disc->options()) {
            for (auto const& seen : node->discriminator_map)
                if (seen.first == v)
                    throw std::invalid_argument("duplicate discriminator value " + v.dump() + " for '" + field + "'");
            node->discriminator_map.emplace_back(v, i);
        }
    }
    node->inner = std::move(members);
    return make(std::move(node));
}

Schema intersection(const Schema& left, const Schema& right) { return with_inner(Kind::Intersection, {left, right}); }

Schema lazy(std::function<Schema()> thunk) {
    if (!thunk) throw std::invalid_argument("lazy requires a thunk");
    auto node = std::make_shared<SchemaNode>();
    node->kind = Kind::Lazy;
    node->lazy = std::make_shared<LazyState>();
    node->lazy->thunk = std::move(thunk);
    return make(std::move(node));
}

const Schema& resolve_lazy(const SchemaNode& node) {
    if (node.kind != Kind::Lazy || !node.lazy) throw std::logic_error("not a lazy schema");
    LazyState& state = *node.lazy;
    std::call_once(state.once, [&state] { state.resolved = state.thunk(); });
    return *state.resolved;
}

Schema function() { return function(tuple({}, unknown()), unknown()); }

Schema function(const Schema& args, const Schema& returns) {
    if (args.kind() != Kind::Tuple) throw std::invalid_argument("function arguments must be a tuple schema");
    return with_inner(Kind::Function, {args, returns});
}

Schema pipe(const Schema& first, const Schema& second) { return with_inner(Kind::Pipe, {first, second}); }

Schema transform(TransformFn fn) {
    if (!fn) throw std::invalid_argument("transform requires a callable");
    auto node = std::make_shared<SchemaNode>();
    node->kind = Kind::Transform;
    node->transform = std::move(fn);
    return make(std::move(node));
}

Schema preprocess(std::function<Value(const Value&)> fn, const Schema& schema) {
    if (!fn) throw std::invalid_argument("preprocess requires a callable");
    return pipe(transform([fn](const Value& v, Payload&) { return fn(v); }), schema);
}

Schema custom(std::function<bool(const Value&)> pred, const std::string& message) {
    auto node = std::make_shared<SchemaNode>();
    node->kind = Kind::Custom;
    node->predicate = std::move(pred);
    node->message = message;
    return make(std::move(node));
}

Schema file() { return make(Kind::File); }

namespace coerce {
    Schema string() { return sc::string().coerce(); }
    Schema number() { return sc::number().coerce(); }
    Schema integer() { return sc::integer().coerce(); }
    Schema int32() { return sc::int32().coerce(); }
    Schema int64() { return sc::int64().coerce(); }
    Schema boolean() { return sc::boolean().coerce(); }
    Schema bigint() { return sc::bigint().coerce(); }
}  // namespace coerce

}  // namespace sc
