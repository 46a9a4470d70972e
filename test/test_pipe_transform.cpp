#include <catch2/catch_all.hpp>
#include <sc/sculpt.h>

using namespace sc;
using namespace sc::json_literals;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Transforms map the parsed value", "[transform]") {
    auto length = string().transform([](const Value& v, Payload&) {
        return Value(static_cast<int64_t>(v.asString().size()));
    });
    REQUIRE(length.kind() == Kind::Pipe);
    REQUIRE(length.parse("hello").value == Value(5));
    REQUIRE(length.parse(5).error->front().code == IssueCode::InvalidType);
}

TEST_CASE("Transforms can reject their input", "[transform]") {
    auto parse_int = string().transform([](const Value& v, Payload& p) {
        const std::string& s = v.asString();
        if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
            p.add_issue(make_custom("not an integer: " + s, v));
            return Value();
        }
        return Value(static_cast<int64_t>(std::stoll(s)));
    });
    REQUIRE(parse_int.parse("42").value == Value(42));
    auto result = parse_int.parse("4x");
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error->front().message == "not an integer: 4x");
    REQUIRE(result.value.isNull());

    auto throwing = transform([](const Value&, Payload&) -> Value { throw std::runtime_error("boom"); });
    REQUIRE(throwing.parse(1).error->front().message == "boom");
}

TEST_CASE("Pipes run stages in order and stop at the first failure", "[pipe]") {
    int second_calls = 0;
    auto counted = custom([&second_calls](const Value&) {
        ++second_calls;
        return true;
    });
    auto s = pipe(string().min(2), counted);
    REQUIRE(s.parse("abc").ok());
    REQUIRE(second_calls == 1);
    REQUIRE_FALSE(s.parse("a").ok());
    REQUIRE(second_calls == 1);

    auto to_port = string().trim().pipe(coerce::number()).pipe(number().integer().gte(1).lte(65535));
    REQUIRE(to_port.parse(" 8080 ").value == Value(8080));
    auto issue = to_port.parse("70000").error->front();
    REQUIRE(issue.code == IssueCode::TooBig);
    REQUIRE(to_port.parse(8080).error->front().expected() == Value("string"));
}

TEST_CASE("Pipes report the expected type of their first stage", "[pipe]") {
    REQUIRE(pipe(string(), number()).expected_type() == "string");
    auto nested = object({{"n", pipe(string(), coerce::int32())}});
    auto issue = nested.parse(R"({"n": "x"})"_json).error->front();
    REQUIRE(issue.path == Path{std::string("n")});
    REQUIRE(issue.expected() == Value("int32"));
}

TEST_CASE("Preprocess maps raw input before validation", "[pipe]") {
    auto csv = preprocess(
        [](const Value& v) {
            if (!v.isString()) return v;
            Value parts = Value::array();
            std::string current;
            for (char c : v.asString()) {
                if (c == ',') {
                    parts.push_back(current);
                    current.clear();
                } else {
                    current += c;
                }
            }
            parts.push_back(current);
            return parts;
        },
        array(string().min(1)));
    REQUIRE(csv.parse("a,b,c").value == R"(["a", "b", "c"])"_json);
    REQUIRE(csv.parse(R"(["x"])"_json).ok());
    REQUIRE(csv.parse("a,,c").error->front().path == Path{int64_t(1)});
}

TEST_CASE("Function schemas validate arguments and results", "[function]") {
    auto add = function(tuple({number(), number()}), number());
    Value impl = add.implement([](const std::vector<Value>& args) {
        return Value(args.at(0).asDouble() + args.at(1).asDouble());
    });
    REQUIRE(impl.call({1, 2}) == Value(3));

    try {
        impl.call({1, "2"});
        FAIL("expected ParseError");
    } catch (const ParseError& e) {
        REQUIRE(e.error().front().path == Path{int64_t(1)});
    }
    REQUIRE_THROWS_AS(impl.call({1}), ParseError);

    auto bad_result = function(tuple({}), string()).implement([](const std::vector<Value>&) { return Value(1); });
    REQUIRE_THROWS_WITH(bad_result.call({}), ContainsSubstring("expected string"));
}

TEST_CASE("Function values are wrapped when parsed", "[function]") {
    auto callback = function(tuple({string()}), boolean());
    auto raw = Value::function([](const std::vector<Value>& args) { return Value(args.at(0).asString().empty()); });
    auto parsed = callback.parse(raw);
    REQUIRE(parsed.ok());
    REQUIRE(parsed.value.isFunction());
    REQUIRE(parsed.value.call({""}) == Value(true));
    REQUIRE_THROWS_AS(parsed.value.call({1}), ParseError);
    REQUIRE(callback.parse("not a function").error->front().expected() == Value("function"));
    REQUIRE(function().parse(raw).ok());
    REQUIRE_THROWS_AS(function(string(), string()), std::invalid_argument);
}
