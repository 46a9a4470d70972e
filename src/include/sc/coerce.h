#pragma once

#include <sc/kind.h>
#include <sc/value.h>
#include <optional>

namespace sc {

// Pre-parse conversions applied when a schema's coerce flag is set. Each
// returns std::nullopt when the input has no conversion, in which case the
// original input goes on to the type check and fails there.

// Scalars to their textual form.
std::optional<Value> coerce_to_string(const Value& v);

// Base-10 strings (trimmed), bools as 0/1, bigints that fit. Integer kinds
// produce Integer values for integral input and leave fractional or
// out-of-range input for the type check to reject.
std::optional<Value> coerce_to_number(const Value& v, NumberKind kind);

// "true" "1" "yes" "on" "y" and "false" "0" "no" "off" "n" "" (trimmed,
// case-insensitive); numbers and bigints by comparison with zero.
std::optional<Value> coerce_to_bool(const Value& v);

// Integer strings, integers, integral finite doubles, bools.
std::optional<Value> coerce_to_bigint(const Value& v);

}  // namespace sc
