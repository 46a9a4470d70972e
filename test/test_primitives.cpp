#include <catch2/catch_all.hpp>
#include <sc/sculpt.h>
#include <cfloat>
#include <cmath>
#include <limits>

using namespace sc;
using namespace sc::json_literals;

TEST_CASE("Strings", "[primitives]") {
    REQUIRE(string().parse("hello").value == Value("hello"));
    auto issue = string().parse(42).error->front();
    REQUIRE(issue.code == IssueCode::InvalidType);
    REQUIRE(issue.expected() == Value("string"));
    REQUIRE(issue.received() == Value("number"));
    REQUIRE(issue.path.empty());
}

TEST_CASE("Null is rejected by value schemas", "[primitives]") {
    for (auto const& s : {string(), number(), boolean(), bigint(), array(any()), object({}), file()}) {
        auto issue = s.parse(Value()).error->front();
        REQUIRE(issue.code == IssueCode::InvalidType);
        REQUIRE(issue.received() == Value("null"));
    }
    REQUIRE(string().parse(Value::null_pointer()).error->front().received() == Value("null"));
}

TEST_CASE("Numbers", "[primitives]") {
    SECTION("float64 accepts integers, doubles and infinities but not NaN") {
        REQUIRE(number().parse(3).ok());
        REQUIRE(number().parse(2.5).ok());
        REQUIRE(number().parse(-std::numeric_limits<double>::infinity()).ok());
        auto issue = number().parse(std::nan("")).error->front();
        REQUIRE(issue.code == IssueCode::InvalidType);
        REQUIRE(issue.received() == Value("NaN"));
        REQUIRE_FALSE(number().parse("3").ok());
        REQUIRE_FALSE(number().parse(Value::bigint("3")).ok());
    }
    SECTION("float32 range") {
        REQUIRE(float32().parse(1.5).ok());
        auto issue = float32().parse(1e39).error->front();
        REQUIRE(issue.code == IssueCode::TooBig);
        REQUIRE(issue.origin == "float32");
    }
    SECTION("integer kinds") {
        REQUIRE(int8().parse(127).ok());
        auto big = int8().parse(128).error->front();
        REQUIRE(big.code == IssueCode::TooBig);
        REQUIRE(big.origin == "int8");
        REQUIRE(big.maximum() == Value(127));
        REQUIRE(uint8().parse(-1).error->front().code == IssueCode::TooSmall);
        REQUIRE(uint16().parse(65535).ok());
        REQUIRE(int32().parse(int64_t(2147483648LL)).error->front().code == IssueCode::TooBig);
        REQUIRE(uint32().parse(int64_t(4294967295LL)).ok());
        REQUIRE(uint64().parse(std::numeric_limits<int64_t>::max()).ok());
        REQUIRE(uint64().parse(-1).error->front().minimum() == Value(0));
    }
    SECTION("integral doubles become integers") {
        auto result = int64().parse(4.0);
        REQUIRE(result.ok());
        REQUIRE(result.value.isInt());
        auto fractional = int64().parse(4.5).error->front();
        REQUIRE(fractional.code == IssueCode::InvalidType);
        REQUIRE(fractional.expected() == Value("int64"));
        REQUIRE(int16().parse(1e10).error->front().code == IssueCode::TooBig);
    }
}

TEST_CASE("Big integers", "[primitives]") {
    REQUIRE(bigint().parse(Value::bigint("123456789012345678901234567890")).ok());
    REQUIRE(bigint().parse(5).error->front().expected() == Value("bigint"));
}

TEST_CASE("Booleans, nil, any, unknown and never", "[primitives]") {
    REQUIRE(boolean().parse(false).value == Value(false));
    REQUIRE(boolean().parse(0).error->front().expected() == Value("bool"));
    REQUIRE(nil().parse(Value()).ok());
    REQUIRE(nil().parse(Value::null_pointer()).ok());
    REQUIRE(nil().parse(0).error->front().expected() == Value("null"));
    REQUIRE(any().parse(Value()).ok());
    REQUIRE(unknown().parse(R"({"x": [1]})"_json).value == R"({"x": [1]})"_json);
    REQUIRE(never().parse(1).error->front().expected() == Value("never"));
    REQUIRE(Schema().kind() == Kind::Unknown);
}

TEST_CASE("Literals and enums", "[primitives]") {
    SECTION("literal") {
        REQUIRE(literal("on").parse("on").ok());
        auto issue = literal("on").parse("off").error->front();
        REQUIRE(issue.code == IssueCode::InvalidValue);
        REQUIRE(issue.param("values") == Value::array({"on"}));
        REQUIRE(literal(Value()).parse(Value()).ok());
        REQUIRE(literal(std::vector<Value>{1, 2}).parse(2.0).ok());
    }
    SECTION("enum") {
        auto colour = enum_of({"red", "green", "blue"});
        REQUIRE(colour.parse("green").ok());
        REQUIRE(colour.options().size() == 3);
        REQUIRE_FALSE(colour.parse(Value()).ok());
        REQUIRE(colour.extract({"red"}).options() == std::vector<Value>{"red"});
        REQUIRE(colour.exclude({"red"}).options() == std::vector<Value>{"green", "blue"});
        REQUIRE_THROWS_AS(colour.extract({"pink"}), std::invalid_argument);
        REQUIRE(enum_of({"a", "a", "b"}).options().size() == 2);
        REQUIRE_THROWS_AS(enum_of({}), std::invalid_argument);
    }
    SECTION("null is a type error unless it is one of the values") {
        auto issue = literal("a").parse(Value()).error->front();
        REQUIRE(issue.code == IssueCode::InvalidType);
        REQUIRE(issue.expected() == Value("literal"));
        REQUIRE(issue.received() == Value("null"));
        auto colour = enum_of({"red", "green"}).parse(Value::null_pointer()).error->front();
        REQUIRE(colour.code == IssueCode::InvalidType);
        REQUIRE(colour.expected() == Value("enum"));
        REQUIRE(literal(std::vector<Value>{Value(), "a"}).parse(Value()).ok());
    }
    SECTION("native enum") {
        auto level = native_enum({{"Low", 1}, {"High", 3}});
        REQUIRE(level.parse(3).ok());
        REQUIRE_FALSE(level.parse(2).ok());
        REQUIRE(level.node().enum_entries.front().first == "Low");
    }
}

TEST_CASE("Pointers are opened, validated and wrapped again", "[primitives]") {
    auto result = string().trim().parse(Value::pointer(Value("  x ")));
    REQUIRE(result.ok());
    REQUIRE(result.value.isPointer());
    REQUIRE(*result.value.pointee() == Value("x"));

    auto input = Value::pointer(Value("  x "));
    string().trim().parse(input);
    REQUIRE(*input.pointee() == Value("  x "));

    REQUIRE(string().parse(Value::pointer(Value(1))).error->front().received() == Value("number"));
    REQUIRE(string().optional().parse(Value::null_pointer()).ok());
    REQUIRE(enum_of({"a"}).parse(Value::pointer(Value("a"))).value.isPointer());
}

TEST_CASE("Custom predicates", "[primitives]") {
    auto even = custom([](const Value& v) { return v.isInt() && v.asInt() % 2 == 0; }, "must be even");
    REQUIRE(even.parse(4).ok());
    auto issue = even.parse(3).error->front();
    REQUIRE(issue.code == IssueCode::Custom);
    REQUIRE(issue.message == "must be even");
    REQUIRE(custom().parse("anything").ok());
}

TEST_CASE("Files", "[primitives]") {
    auto upload = file().min(1).max(1024);
    REQUIRE(upload.parse(Value::file("a.txt", 12, "text/plain")).ok());
    REQUIRE(upload.parse(Value::file("empty.txt", 0)).error->front().code == IssueCode::TooSmall);
}
