#include <catch2/catch_all.hpp>
#include <sc/sculpt.h>

using namespace sc;
using namespace sc::json_literals;

TEST_CASE("optional, nilable and nullish pass nil through", "[wrappers]") {
    for (auto const& s : {string().optional(), string().nilable(), string().nullish()}) {
        REQUIRE(s.parse(Value()).ok());
        REQUIRE(s.parse(Value()).value.isNull());
        REQUIRE(s.parse("x").ok());
        REQUIRE_FALSE(s.parse(1).ok());
    }
    REQUIRE(string().optional().unwrap().kind() == Kind::String);
    REQUIRE(string().optional().non_optional().kind() == Kind::String);
    REQUIRE(string().non_optional().kind() == Kind::String);
    REQUIRE(string().nullish().kind() == Kind::Optional);
}

TEST_CASE("Wrapped schemas report the inner expected type", "[wrappers]") {
    REQUIRE(string().optional().parse(1).error->front().expected() == Value("string"));
    REQUIRE(int32().default_value(1).expected_type() == "int32");
    REQUIRE(number().readonly().expected_type() == "number");
}

TEST_CASE("Defaults replace nil without validation", "[wrappers]") {
    auto s = number().default_value(7);
    REQUIRE(s.parse(Value()).value == Value(7));
    REQUIRE(s.parse(3).value == Value(3));
    REQUIRE(s.parse("3").error->front().code == IssueCode::InvalidType);

    // the default is not checked against the inner schema
    REQUIRE(number().gte(10).default_value(1).parse(Value()).value == Value(1));

    int calls = 0;
    auto counted = array(number()).default_fn([&calls] {
        ++calls;
        return Value::array();
    });
    REQUIRE(counted.parse(Value()).value == Value::array());
    REQUIRE(counted.parse(Value()).ok());
    REQUIRE(calls == 2);
    REQUIRE(counted.parse(R"([1])"_json).ok());
    REQUIRE(calls == 2);
}

TEST_CASE("Prefaults are parsed by the inner schema", "[wrappers]") {
    REQUIRE(number().prefault(7).parse(Value()).value == Value(7));
    REQUIRE(number().prefault(7).parse("3").error->front().code == IssueCode::InvalidType);
    REQUIRE(string().trim().prefault("  padded ").parse(Value()).value == Value("padded"));

    auto issue = number().gte(10).prefault(1).parse(Value()).error->front();
    REQUIRE(issue.code == IssueCode::TooSmall);

    auto fn = string().prefault_fn([] { return Value(" x "); }).pipe(string().trim());
    REQUIRE(fn.parse(Value()).value == Value("x"));
}

TEST_CASE("Catch recovers from any failure", "[wrappers]") {
    auto s = number().positive().catch_value(0);
    REQUIRE(s.parse(5).value == Value(5));
    REQUIRE(s.parse(-5).value == Value(0));
    REQUIRE(s.parse("junk").value == Value(0));
    REQUIRE(s.parse(Value()).value == Value(0));

    std::vector<Issue> seen;
    auto logged = string().min(3).catch_fn([&seen](const std::vector<Issue>& issues, const Value& input) {
        seen = issues;
        return Value("fallback for " + input.asString());
    });
    REQUIRE(logged.parse("ab").value == Value("fallback for ab"));
    REQUIRE(seen.size() == 1);
    REQUIRE(seen.front().code == IssueCode::TooSmall);
    REQUIRE_FALSE(seen.front().message.empty());
}

TEST_CASE("Exceptions from default factories become issues", "[wrappers]") {
    auto s = string().default_fn([]() -> Value { throw std::runtime_error("no default available"); });
    auto issue = s.parse(Value()).error->front();
    REQUIRE(issue.code == IssueCode::Custom);
    REQUIRE(issue.message == "no default available");
}

TEST_CASE("Readonly delegates to the wrapped schema", "[wrappers]") {
    auto s = object({{"a", number()}}).readonly();
    REQUIRE(s.kind() == Kind::Readonly);
    REQUIRE(s.parse(R"({"a": 1})"_json).ok());
    REQUIRE_FALSE(s.parse(R"({"a": "1"})"_json).ok());
    REQUIRE(s.unwrap().kind() == Kind::Object);
    REQUIRE(object({{"x", number().default_value(1).readonly()}}).parse(Value::object()).value ==
            R"({"x": 1})"_json);
}

TEST_CASE("Schema level messages", "[wrappers]") {
    auto s = number().error("need a number");
    REQUIRE(s.parse("x").error->front().message == "need a number");
    auto nested = object({{"n", number()}}).error("object message");
    REQUIRE(nested.parse(R"({"n": "x"})"_json).error->front().message != "object message");
    REQUIRE(nested.parse(1).error->front().message == "object message");
}

TEST_CASE("Metadata", "[wrappers]") {
    auto s = string().describe("user name").brand("UserName").meta(R"({"title": "Name", "examples": ["ada"]})"_json);
    REQUIRE(s.description() == "user name");
    REQUIRE(s.brand_name() == "UserName");
    REQUIRE(s.metadata().at("title") == Value("Name"));
    REQUIRE(s.metadata().at("examples").size() == 1);
    REQUIRE(string().description().empty());
    REQUIRE_THROWS_AS(string().meta(Value(1)), std::invalid_argument);
}

TEST_CASE("Modifiers never change the receiver", "[wrappers]") {
    auto base = string();
    auto derived = base.min(3).email().describe("d");
    REQUIRE(base.checks().empty());
    REQUIRE(base.description().empty());
    REQUIRE(derived.checks().size() == 2);
    REQUIRE(base.parse("a").ok());
    REQUIRE_FALSE(derived.parse("a").ok());

    auto obj = object({{"a", string()}});
    auto extended = obj.extend({{"b", number()}}).strict();
    REQUIRE(obj.shape().size() == 1);
    REQUIRE(obj.unknown_keys() == UnknownKeys::Strip);
    REQUIRE(extended.shape().size() == 2);

    auto copy = base;
    REQUIRE(copy.same_node(base));
    REQUIRE_FALSE(derived.same_node(base));
}
