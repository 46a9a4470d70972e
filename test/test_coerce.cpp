#include <catch2/catch_all.hpp>
#include <sc/sculpt.h>

using namespace sc;

TEST_CASE("Coerced numbers", "[coerce]") {
    REQUIRE(coerce::number().parse("42").value == Value(42));
    REQUIRE(coerce::number().parse(" 2.5 ").value == Value(2.5));
    REQUIRE(coerce::number().parse(true).value == Value(1));
    REQUIRE(coerce::number().parse(Value::bigint("7")).value == Value(7));

    auto bad = coerce::number().parse("12abc").error->front();
    REQUIRE(bad.code == IssueCode::InvalidType);
    REQUIRE(bad.received() == Value("string"));
    REQUIRE_FALSE(coerce::number().parse("0x10").ok());
    REQUIRE_FALSE(coerce::number().parse("").ok());
}

TEST_CASE("Coerced integers reject fractional and out of range input", "[coerce]") {
    REQUIRE(coerce::integer().parse("17").value.isInt());
    REQUIRE(coerce::int32().parse("3.0").value == Value(3));
    REQUIRE(coerce::int32().parse("3.5").error->front().expected() == Value("int32"));
    REQUIRE(coerce::int32().parse("3000000000").error->front().code == IssueCode::TooBig);
    REQUIRE(coerce::int64().parse(Value::bigint("99999999999999999999")).error->front().code == IssueCode::TooBig);
}

TEST_CASE("Coerced booleans", "[coerce]") {
    for (auto const* text : {"true", "1", "yes", "on", "Y", "  TRUE "}) {
        INFO(text);
        REQUIRE(coerce::boolean().parse(text).value == Value(true));
    }
    for (auto const* text : {"false", "0", "no", "off", "n"}) {
        INFO(text);
        REQUIRE(coerce::boolean().parse(text).value == Value(false));
    }
    REQUIRE(coerce::boolean().parse(2).value == Value(true));
    REQUIRE(coerce::boolean().parse(0.0).value == Value(false));
    REQUIRE_FALSE(coerce::boolean().parse("maybe").ok());
}

TEST_CASE("Coerced strings", "[coerce]") {
    REQUIRE(coerce::string().parse(42).value == Value("42"));
    REQUIRE(coerce::string().parse(1.5).value == Value("1.5"));
    REQUIRE(coerce::string().parse(false).value == Value("false"));
    REQUIRE(coerce::string().parse(Value::bigint("12345678901234567890")).value == Value("12345678901234567890"));
    REQUIRE_FALSE(coerce::string().parse(Value::array()).ok());
}

TEST_CASE("Coerced big integers", "[coerce]") {
    REQUIRE(coerce::bigint().parse("123456789012345678901").value == Value::bigint("123456789012345678901"));
    REQUIRE(coerce::bigint().parse(12).value.isBigInt());
    REQUIRE(coerce::bigint().parse(3.0).value == Value::bigint("3"));
    REQUIRE_FALSE(coerce::bigint().parse(3.5).ok());
    REQUIRE_FALSE(coerce::bigint().parse("1e3").ok());
}

TEST_CASE("Coercion runs before checks and only when enabled", "[coerce]") {
    auto port = int32().coerce().gte(1).lte(65535);
    REQUIRE(port.coerces());
    REQUIRE(port.parse("8080").value == Value(8080));
    REQUIRE(port.parse("0").error->front().code == IssueCode::TooSmall);
    REQUIRE_FALSE(int32().gte(1).parse("8080").ok());
    REQUIRE_FALSE(int32().coerces());
    REQUIRE_THROWS_AS(array(number()).coerce(), std::logic_error);
}

TEST_CASE("Coercion helpers leave unconvertible input alone", "[coerce]") {
    REQUIRE_FALSE(coerce_to_number(Value::array(), NumberKind::Float64).has_value());
    REQUIRE(coerce_to_number(Value("4.0"), NumberKind::Int64)->isInt());
    REQUIRE(coerce_to_number(Value("4.0"), NumberKind::Float64)->isDouble());
    REQUIRE_FALSE(coerce_to_bool(Value("maybe")).has_value());
    REQUIRE(*coerce_to_string(Value(true)) == Value("true"));
}
