#pragma once

namespace sc {

enum class Kind {
    String,
    Number,
    BigInt,
    Bool,
    Nil,
    Any,
    Unknown,
    Never,
    Literal,
    Enum,
    Array,
    Tuple,
    Set,
    Map,
    Record,
    Object,
    Union,
    DiscriminatedUnion,
    ExclusiveUnion,
    Intersection,
    Lazy,
    Function,
    Pipe,
    Transform,
    Readonly,
    Optional,
    Nilable,
    Default,
    Prefault,
    Catch,
    Custom,
    File
};

// Number of entries in Kind; sizes the parse dispatch table.
constexpr int kind_count = static_cast<int>(Kind::File) + 1;

const char* kind_name(Kind kind);

enum class NumberKind { Float64, Float32, Int8, Int16, Int32, Int64, Uint8, Uint16, Uint32, Uint64 };

const char* number_kind_name(NumberKind kind);

inline bool is_integer_kind(NumberKind kind) { return kind != NumberKind::Float64 && kind != NumberKind::Float32; }

// Policy for object keys that are not part of the shape.
enum class UnknownKeys { Strip, Strict, Passthrough, Catchall };

}  // namespace sc
