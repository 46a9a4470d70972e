#include <catch2/catch_all.hpp>
#include <sc/sculpt.h>
#include <atomic>
#include <thread>

using namespace sc;
using namespace sc::json_literals;

TEST_CASE("A short string fails a minimum length", "[scenario]") {
    auto s = string().min(3);
    auto result = s.parse("hi");
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error->size() == 1);
    auto const& issue = result.error->front();
    REQUIRE(issue.code == IssueCode::TooSmall);
    REQUIRE(issue.minimum() == Value(3));
    REQUIRE(issue.path.empty());

    auto ok = s.parse("hello");
    REQUIRE(ok.ok());
    REQUIRE(ok.value == Value("hello"));
}

TEST_CASE("A strict object rejects unknown keys", "[scenario]") {
    auto s = object({{"age", int64().gte(0)}}).strict();
    auto issue = s.parse(R"({"age": 30, "extra": 1})"_json).error->front();
    REQUIRE(issue.code == IssueCode::UnrecognisedKeys);
    REQUIRE(issue.keys() == std::vector<std::string>{"extra"});
}

TEST_CASE("A default replaces null but not a wrong type", "[scenario]") {
    auto s = number().default_value(7);
    REQUIRE(s.parse(Value()).value == Value(7));
    REQUIRE(s.parse("3").error->front().code == IssueCode::InvalidType);
}

TEST_CASE("A prefault replaces null and is then validated", "[scenario]") {
    auto s = number().prefault(7);
    REQUIRE(s.parse(Value()).value == Value(7));
    REQUIRE(s.parse("3").error->front().code == IssueCode::InvalidType);
}

TEST_CASE("A lazy self referential list validates", "[scenario]") {
    static Schema list;
    list = object({{"value", int64()}, {"next", lazy([] { return list; }).nilable().optional()}});
    REQUIRE(list.parse(R"({"value": 1, "next": {"value": 2, "next": null}})"_json).ok());
    REQUIRE_FALSE(list.parse(R"({"value": 1, "next": {"value": "2"}})"_json).ok());
}

TEST_CASE("A trimming pipe feeds a length check", "[scenario]") {
    auto s = pipe(string().trim(), string().min(1));
    REQUIRE(s.parse("   ").error->front().code == IssueCode::TooSmall);
    REQUIRE(s.parse("  hi ").value == Value("hi"));
}

TEST_CASE("A realistic payload", "[scenario]") {
    auto address = object({{"street", string().min(1)}, {"zip", string().regex("^[0-9]{5}$")}});
    auto order = object({
        {"id", string().uuid()},
        {"email", string().trim().to_lower().email()},
        {"items", array(object({{"sku", string()}, {"qty", coerce::int32().positive()}})).nonempty()},
        {"shipping", address},
        {"billing", address.optional()},
        {"status", enum_of({"new", "paid", "shipped"}).default_value("new")},
        {"tags", set(string()).optional()},
    });

    auto good = R"({
        "id": "123e4567-e89b-12d3-a456-426614174000",
        "email": "  Ada@Example.COM ",
        "items": [{"sku": "A1", "qty": "2"}],
        "shipping": {"street": "1 Main St", "zip": "12345"}
    })"_json;
    auto result = order.parse(good);
    REQUIRE(result.ok());
    REQUIRE(result.value.at("email") == Value("ada@example.com"));
    REQUIRE(result.value.at("items").at(0).at("qty") == Value(2));
    REQUIRE(result.value.at("status") == Value("new"));

    auto bad = R"({
        "id": "nope",
        "email": "ada",
        "items": [{"sku": "A1", "qty": "-1"}, {"sku": 2, "qty": 1}],
        "shipping": {"street": "", "zip": "1234"},
        "status": "lost"
    })"_json;
    auto error = *order.parse(bad).error;
    std::vector<std::string> paths;
    for (auto const& issue : error.issues()) paths.push_back(to_dot_path(issue.path));
    REQUIRE(paths == std::vector<std::string>{"id", "email", "items[0].qty", "items[1].sku", "shipping.street",
                                              "shipping.zip", "status"});
}

TEST_CASE("Schemas are shared safely between threads", "[scenario][concurrency]") {
    auto s = object({{"name", string().min(2)}, {"scores", array(number().gte(0)).max(5)}});
    const Value good = R"({"name": "Ada", "scores": [1, 2, 3]})"_json;
    const Value bad = R"({"name": "A", "scores": [1, -2]})"_json;

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                if (!s.parse(good).ok()) ++mismatches;
                auto result = s.parse(bad);
                if (result.ok() || result.error->size() != 2) ++mismatches;
            }
        });
    }
    for (auto& th : threads) th.join();
    REQUIRE(mismatches == 0);
}

TEST_CASE("Parsing an output again gives the same output", "[scenario]") {
    auto check_stable = [](const Schema& s, const Value& input) {
        auto first = s.parse(input);
        REQUIRE(first.ok());
        auto second = s.parse(first.value);
        REQUIRE(second.ok());
        REQUIRE(second.value == first.value);
    };

    SECTION("objects with substituted fields") {
        auto s = object({{"n", number().default_value(7)},
                         {"s", string().trim().prefault(" x ")},
                         {"c", coerce::number()},
                         {"opt", string().optional()}});
        check_stable(s, R"({"c": "5", "extra": true})"_json);
        REQUIRE(s.parse(R"({"c": "5"})"_json).value == R"({"n": 7, "s": "x", "c": 5})"_json);
    }
    SECTION("coerced scalars") {
        check_stable(coerce::int32(), "42");
        check_stable(coerce::boolean(), "yes");
        check_stable(coerce::string(), 3.5);
    }
    SECTION("pointers") {
        check_stable(string().trim(), Value::pointer(Value(" a ")));
        check_stable(array(number().nilable()), Value::array({Value::pointer(Value(1)), Value()}));
    }
    SECTION("unions") {
        check_stable(union_of({string().trim(), number()}), " a ");
        auto shape = discriminated_union(
            "kind", {object({{"kind", literal("circle")}, {"r", coerce::number()}}),
                     object({{"kind", literal("square")}, {"side", number()}})});
        check_stable(shape, R"({"kind": "circle", "r": "2"})"_json);
    }
    SECTION("intersections") {
        auto both = intersection(object({{"name", string().trim()}}), object({{"age", coerce::int32()}}));
        check_stable(both, R"({"name": " Ada ", "age": "36", "x": 1})"_json);
    }
}
