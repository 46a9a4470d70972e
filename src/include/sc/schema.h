#pragma once

#include <sc/check.h>
#include <sc/error.h>
#include <sc/issue.h>
#include <sc/kind.h>
#include <sc/payload.h>
#include <sc/value.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sc {

struct SchemaNode;
struct LazyState;
class Schema;

// Ordered field list of an object schema.
using Shape = std::vector<std::pair<std::string, Schema> >;

// Maps a parsed value; issues added to the payload fail the parse.
using TransformFn = std::function<Value(const Value&, Payload&)>;
// Produces the fallback of a catch wrapper from the swallowed issues and the input.
using CatchFn = std::function<Value(const std::vector<Issue>&, const Value&)>;

struct ParseResult {
    Value value;
    std::optional<ValidationError> error;

    bool ok() const noexcept { return !error.has_value(); }
    explicit operator bool() const noexcept { return ok(); }
};

// Immutable handle to a schema node. Copies share the node; every modifier
// returns a new Schema built from a copy of the node, so the receiver is
// never changed.
class Schema {
  public:
    // An `unknown` schema.
    Schema();
    explicit Schema(std::shared_ptr<const SchemaNode> node);

    const SchemaNode& node() const { return *m_node; }
    Kind kind() const;
    // Name reported as `expected` by invalid_type issues raised for this schema.
    std::string expected_type() const;

    ParseResult parse(const Value& input, const ParseContext& ctx = {}) const;
    ParseResult safe_parse(const Value& input, const ParseContext& ctx = {}) const;
    // Throws ParseError on failure.
    Value must_parse(const Value& input, const ParseContext& ctx = {}) const;

    // -- wrappers ------------------------------------------------------------
    Schema optional() const;
    Schema nilable() const;
    Schema nullish() const;
    // Removes an outer optional; other schemas are returned unchanged.
    Schema non_optional() const;
    Schema readonly() const;
    Schema default_value(Value v) const;
    Schema default_fn(std::function<Value()> fn) const;
    Schema prefault(Value v) const;
    Schema prefault_fn(std::function<Value()> fn) const;
    Schema catch_value(Value v) const;
    Schema catch_fn(CatchFn fn) const;

    // -- metadata ------------------------------------------------------------
    Schema describe(const std::string& description) const;
    // Merges the keys of `fields` (an object) into the metadata bag.
    Schema meta(const Value& fields) const;
    Schema brand(const std::string& tag) const;
    // Schema-level message hook for issues raised by this node.
    Schema error(ErrorMap map) const;
    Schema error(const std::string& message) const;
    std::string description() const;
    std::string brand_name() const;
    const Value& metadata() const;

    // Enable the pre-parse coercion step (string, number, bigint, bool only).
    Schema coerce() const;
    bool coerces() const;

    // -- checks --------------------------------------------------------------
    // Applying a check to a kind that does not support it throws std::logic_error.
    // Sizes for string, array, set, map, record, object, file; on number and
    // bigint, min and max are gte and lte.
    Schema min(const Value& bound, const std::string& message = {}) const;
    Schema max(const Value& bound, const std::string& message = {}) const;
    Schema length(int64_t n, const std::string& message = {}) const;
    Schema size(int64_t n, const std::string& message = {}) const;
    Schema nonempty(const std::string& message = {}) const;

    Schema gt(const Value& bound, const std::string& message = {}) const;
    Schema gte(const Value& bound, const std::string& message = {}) const;
    Schema lt(const Value& bound, const std::string& message = {}) const;
    Schema lte(const Value& bound, const std::string& message = {}) const;
    Schema multiple_of(const Value& divisor, const std::string& message = {}) const;
    Schema positive(const std::string& message = {}) const;
    Schema negative(const std::string& message = {}) const;
    Schema non_negative(const std::string& message = {}) const;
    Schema non_positive(const std::string& message = {}) const;
    Schema finite(const std::string& message = {}) const;
    Schema integer(const std::string& message = {}) const;
    Schema safe_int(const std::string& message = {}) const;

    Schema email(const std::string& message = {}) const;
    Schema url(const std::string& message = {}) const;
    Schema uuid(const std::string& message = {}) const;
    Schema regex(const std::string& pattern, const std::string& message = {}) const;
    Schema starts_with(const std::string& prefix, const std::string& message = {}) const;
    Schema ends_with(const std::string& suffix, const std::string& message = {}) const;
    Schema includes(const std::string& needle, const std::string& message = {}) const;
    Schema trim() const;
    Schema to_lower() const;
    Schema to_upper() const;
    Schema lowercase(const std::string& message = {}) const;
    Schema uppercase(const std::string& message = {}) const;
    Schema ipv4(const std::string& message = {}) const;
    Schema ipv6(const std::string& message = {}) const;
    Schema cidrv4(const std::string& message = {}) const;
    Schema cidrv6(const std::string& message = {}) const;
    Schema base64(const std::string& message = {}) const;
    Schema hostname(const std::string& message = {}) const;
    Schema iso_date(const std::string& message = {}) const;
    Schema iso_time(const std::string& message = {}) const;
    Schema iso_datetime(const std::string& message = {}) const;
    Schema iso_duration(const std::string& message = {}) const;

    Schema mime(std::vector<std::string> types, const std::string& message = {}) const;

    // Append an arbitrary check; allowed on every kind.
    Schema check(Check c) const;
    const std::vector<Check>& checks() const;

    // -- refinement and transformation --------------------------------------
    Schema refine(std::function<bool(const Value&)> pred, RefineParams params = {}) const;
    Schema refine(std::function<bool(const Value&)> pred, const std::string& message) const;

    // `pred` receives the value converted to T; a value that does not
    // convert fails the refinement.
    template <typename T, typename Pred>
    Schema refine_as(Pred pred, RefineParams params = {}) const {
        return refine(
            [pred](const Value& v) {
                std::optional<T> typed = value_as<T>(v);
                return typed.has_value() && static_cast<bool>(pred(*typed));
            },
            std::move(params));
    }

    Schema super_refine(std::function<void(const Value&, Payload&)> fn) const;
    Schema overwrite(std::function<Value(const Value&)> fn) const;
    // pipe(*this, transform(fn))
    Schema transform(TransformFn fn) const;
    Schema pipe(const Schema& next) const;

    // -- object operators ----------------------------------------------------
    const Shape& shape() const;
    // Throws std::invalid_argument for names not in the shape.
    Schema pick(const std::vector<std::string>& keys) const;
    Schema omit(const std::vector<std::string>& keys) const;
    // All fields when `keys` is empty.
    Schema partial(const std::vector<std::string>& keys = {}) const;
    Schema required(const std::vector<std::string>& keys = {}) const;
    Schema extend(const Shape& fields) const;
    // extend() with the other object's fields, then its unknown-key policy.
    Schema merge(const Schema& other) const;
    Schema key_of() const;
    Schema strict() const;
    Schema strip() const;
    Schema passthrough() const;
    Schema catchall(const Schema& rest) const;
    UnknownKeys unknown_keys() const;

    // -- enum operators ------------------------------------------------------
    const std::vector<Value>& options() const;
    Schema extract(const std::vector<Value>& values) const;
    Schema exclude(const std::vector<Value>& values) const;

    // -- containers and wrappers ---------------------------------------------
    // Element schema of an array or set.
    Schema element() const;
    // The wrapped schema of optional, nilable, default, prefault, catch and
    // readonly; the resolved schema of lazy.
    Schema unwrap() const;
    // Tuple with a variadic tail.
    Schema rest(const Schema& tail) const;

    // Wrap a native callable so every call validates its arguments and its
    // return value against this function schema.
    Value implement(Callable fn) const;

    bool same_node(const Schema& other) const noexcept { return m_node == other.m_node; }

  private:
    std::shared_ptr<const SchemaNode> m_node;

    std::shared_ptr<SchemaNode> clone() const;
    Schema wrap(Kind kind) const;
    Schema with_check(Check c, const std::string& message) const;
    Schema string_format(const char* method, const std::string& format, const std::string& message) const;
    void require_kind(std::initializer_list<Kind> kinds, const char* op) const;
};

// Definition plus internals of one schema. Fields that do not apply to the
// node's kind stay empty.
struct SchemaNode {
    Kind kind = Kind::Unknown;

    // internals
    std::vector<Check> checks;
    bool coerce = false;
    ErrorMap error;
    // literal and enum members
    std::vector<Value> values;
    // description, brand, title, examples and free-form keys
    Value meta = Value::object();

    // definition
    NumberKind number_kind = NumberKind::Float64;
    // element (array, set), items (tuple), members (unions), sides
    // (intersection), stages (pipe), key and value (map, record), args and
    // returns (function), wrapped schema (wrappers)
    std::vector<Schema> inner;
    // tuple rest, object catchall
    std::optional<Schema> rest;
    Shape shape;
    UnknownKeys unknown_keys = UnknownKeys::Strip;
    std::string discriminator;
    // discriminator value to index in `inner`
    std::vector<std::pair<Value, size_t> > discriminator_map;
    // name-keyed enum entries
    std::vector<std::pair<std::string, Value> > enum_entries;
    // default, prefault and catch substitutes
    Value fallback;
    std::function<Value()> factory;
    CatchFn catch_fn;
    TransformFn transform;
    std::function<bool(const Value&)> predicate;
    // custom: message of the raised issue
    std::string message;
    std::shared_ptr<LazyState> lazy;
};

// -- primitives ---------------------------------------------------------------
Schema string();
Schema number();
Schema float32();
Schema float64();
// int64
Schema integer();
Schema int8();
Schema int16();
Schema int32();
Schema int64();
// Value integers are int64, so uint64 accepts 0 .. INT64_MAX.
Schema uint8();
Schema uint16();
Schema uint32();
Schema uint64();
Schema bigint();
Schema boolean();
Schema nil();
Schema any();
Schema unknown();
Schema never();
Schema literal(Value value);
Schema literal(std::vector<Value> values);
// Throws std::invalid_argument when empty.
Schema enum_of(std::vector<Value> values);
Schema native_enum(std::vector<std::pair<std::string, Value> > entries);

// -- containers ---------------------------------------------------------------
Schema array(const Schema& element);
Schema tuple(std::vector<Schema> items, std::optional<Schema> rest = std::nullopt);
Schema set(const Schema& element);
Schema map(const Schema& key, const Schema& value);
Schema record(const Schema& key, const Schema& value);
Schema object(Shape shape = {});

// -- composites ---------------------------------------------------------------
Schema union_of(std::vector<Schema> members);
// Every member must be an object with a literal (or enum) at `field`, and no
// value may select two members; throws std::invalid_argument otherwise.
Schema discriminated_union(const std::string& field, std::vector<Schema> members);
Schema exclusive_union(std::vector<Schema> members);
Schema intersection(const Schema& left, const Schema& right);
// The thunk runs once, on first use, and its result is shared by every caller.
Schema lazy(std::function<Schema()> thunk);
// Accepts any arguments and return value.
Schema function();
// `args` is a tuple schema.
Schema function(const Schema& args, const Schema& returns);
Schema pipe(const Schema& first, const Schema& second);
// Accepts any input and maps it with `fn`.
Schema transform(TransformFn fn);
Schema preprocess(std::function<Value(const Value&)> fn, const Schema& schema);
Schema custom(std::function<bool(const Value&)> pred = {}, const std::string& message = {});
Schema file();

// Schemas with the coerce flag set.
namespace coerce {
    Schema string();
    Schema number();
    Schema integer();
    Schema int32();
    Schema int64();
    Schema boolean();
    Schema bigint();
}  // namespace coerce

// -- parsing (engine.cpp) -----------------------------------------------------
ParseResult parse(const Schema& schema, const Value& input, const ParseContext& ctx = {});
ParseResult safe_parse(const Schema& schema, const Value& input, const ParseContext& ctx = {});
Value must_parse(const Schema& schema, const Value& input, const ParseContext& ctx = {});

// Run a schema against a payload in place; issues are appended with paths
// relative to the payload.
void parse_payload(const Schema& schema, Payload& payload);

// Resolve a lazy node, running its thunk on first use.
const Schema& resolve_lazy(const SchemaNode& node);

// Function value that validates calls against a function schema.
Value validated_function(const Schema& fn_schema, const std::shared_ptr<const Callable>& target,
                         const ParseContext& ctx);

}  // namespace sc
