#include <catch2/catch_all.hpp>
#include <sc/sculpt.h>

using namespace sc;
using namespace sc::json_literals;

TEST_CASE("Arrays validate every element", "[containers]") {
    auto numbers = array(number());
    REQUIRE(numbers.parse(R"([1, 2.5, 3])"_json).ok());
    REQUIRE(numbers.element().kind() == Kind::Number);

    auto issues = numbers.parse(R"([1, "two", 3, "four"])"_json).error->issues();
    REQUIRE(issues.size() == 2);
    REQUIRE(issues[0].path == Path{int64_t(1)});
    REQUIRE(issues[1].path == Path{int64_t(3)});
    REQUIRE(numbers.parse(R"({"0": 1})"_json).error->front().expected() == Value("array"));
}

TEST_CASE("Array elements carry their transformed values", "[containers]") {
    auto trimmed = array(string().trim());
    REQUIRE(trimmed.parse(R"([" a ", "b "])"_json).value == R"(["a", "b"])"_json);
}

TEST_CASE("Nested paths combine keys and indices", "[containers]") {
    auto s = object({{"a", array(object({{"b", string()}}))}});
    auto issue = s.parse(R"({"a": [{"b": "x"}, {"b": "y"}, {"b": 3}]})"_json).error->front();
    REQUIRE(issue.path == Path{std::string("a"), int64_t(2), std::string("b")});
    REQUIRE(to_dot_path(issue.path) == "a[2].b");
}

TEST_CASE("Tuples", "[containers]") {
    auto point = tuple({number(), number(), string().optional()});
    SECTION("fixed items") {
        REQUIRE(point.parse(R"([1, 2])"_json).ok());
        REQUIRE(point.parse(R"([1, 2, "label"])"_json).ok());
        auto issue = point.parse(R"([1, "y"])"_json).error->front();
        REQUIRE(issue.path == Path{int64_t(1)});
    }
    SECTION("arity") {
        auto too_short = point.parse(R"([1])"_json).error->front();
        REQUIRE(too_short.code == IssueCode::TooSmall);
        REQUIRE(too_short.minimum() == Value(2));
        REQUIRE(too_short.origin == "array");
        auto too_long = point.parse(R"([1, 2, "a", 4])"_json).error->front();
        REQUIRE(too_long.code == IssueCode::TooBig);
        REQUIRE(too_long.maximum() == Value(3));
    }
    SECTION("rest items") {
        auto args = tuple({string()}).rest(number());
        REQUIRE(args.parse(R"(["sum", 1, 2, 3])"_json).ok());
        REQUIRE(args.parse(R"(["sum", 1, "x"])"_json).error->front().path == Path{int64_t(2)});
        REQUIRE(tuple({string()}, number()).parse(R"(["a", 1])"_json).ok());
    }
    SECTION("type") { REQUIRE(point.parse(Value("1,2")).error->front().expected() == Value("tuple")); }
}

TEST_CASE("Sets", "[containers]") {
    auto tags = set(string().min(2));
    REQUIRE(tags.parse(Value::set({"ab", "cd"})).ok());
    REQUIRE(tags.element().kind() == Kind::String);

    auto issue = tags.parse(Value::set({"ab", "c"})).error->front();
    REQUIRE(issue.code == IssueCode::InvalidElement);
    REQUIRE(issue.origin == "set");
    REQUIRE(issue.param("index") == Value(1));
    REQUIRE(issue.issues.size() == 1);
    REQUIRE(issue.issues.front().code == IssueCode::TooSmall);
    REQUIRE(issue.path == Path{int64_t(1)});
    REQUIRE_FALSE(tags.parse(Value::array({"ab"})).ok());

    Value in = Value::object();
    in["tags"] = Value::set({"ab", "c"});
    auto error = *object({{"tags", tags}}).parse(in).error;
    REQUIRE(error.flatten().field_errors.count("tags") == 1);
    REQUIRE(error.flatten().form_errors.empty());
    REQUIRE(error.treeify().at("properties").at("tags").at("items").at(1).at("errors").size() == 1);
}

TEST_CASE("Maps", "[containers]") {
    auto scores = map(string(), number());
    REQUIRE(scores.parse(Value::map({{"ada", 1}, {"bob", 2}})).ok());

    SECTION("key failures") {
        auto issue = scores.parse(Value::map({{1, 1}})).error->front();
        REQUIRE(issue.code == IssueCode::InvalidKey);
        REQUIRE(issue.origin == "map");
        REQUIRE(issue.path.empty());
        REQUIRE(issue.issues.front().code == IssueCode::InvalidType);
    }
    SECTION("value failures are placed under the key") {
        auto issue = scores.parse(Value::map({{"ada", "x"}})).error->front();
        REQUIRE(issue.code == IssueCode::InvalidElement);
        REQUIRE(issue.path == Path{std::string("ada")});
        REQUIRE(issue.param("key") == Value("ada"));
    }
    SECTION("non string keys") {
        auto by_id = map(int64(), string());
        auto result = by_id.parse(Value::map({{7, 1}}));
        REQUIRE(result.error->front().path == Path{int64_t(7)});
        REQUIRE(by_id.parse(Value::map({{7, "seven"}})).value.find(Value(7))->asString() == "seven");
    }
    SECTION("type") { REQUIRE(scores.parse(Value::object()).error->front().expected() == Value("map")); }
}

TEST_CASE("Records", "[containers]") {
    auto counts = record(string().min(2), int64());
    REQUIRE(counts.parse(R"({"ab": 1, "cd": 2})"_json).ok());

    auto issues = counts.parse(R"({"a": 1, "cd": "x"})"_json).error->issues();
    REQUIRE(issues.size() == 2);
    REQUIRE(issues[0].code == IssueCode::InvalidKey);
    REQUIRE(issues[0].path == Path{std::string("a")});
    REQUIRE(issues[1].code == IssueCode::InvalidType);
    REQUIRE(issues[1].path == Path{std::string("cd")});

    SECTION("enum keys are exhaustive") {
        auto flags = record(enum_of({"read", "write"}), boolean());
        REQUIRE(flags.parse(R"({"read": true, "write": false})"_json).ok());
        auto issue = flags.parse(R"({"read": true})"_json).error->front();
        REQUIRE(issue.path == Path{std::string("write")});
        REQUIRE(issue.received() == Value("undefined"));
        REQUIRE(record(enum_of({"read", "write"}), boolean().optional()).parse(R"({"read": true})"_json).ok());
    }
    SECTION("keys can be transformed") {
        auto upper = record(string().to_upper(), number());
        REQUIRE(upper.parse(R"({"a": 1})"_json).value == R"({"A": 1})"_json);
    }
}
