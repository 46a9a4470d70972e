#include <catch2/catch_all.hpp>
#include <sc/sculpt.h>
#include <atomic>
#include <thread>

using namespace sc;
using namespace sc::json_literals;

namespace {
// {value: number, next?: list}
Schema linked_list() {
    static const Schema list =
        object({{"value", number()}, {"next", lazy([] { return linked_list(); }).optional()}});
    return list;
}

// {name: string, children: [tree]}
Schema tree() {
    static const Schema node = object({{"name", string()}, {"children", array(lazy([] { return tree(); }))}});
    return node;
}
}  // namespace

TEST_CASE("Self referential schemas validate recursive data", "[lazy]") {
    REQUIRE(linked_list().parse(R"({"value": 1, "next": {"value": 2, "next": {"value": 3}}})"_json).ok());
    auto issue = linked_list().parse(R"({"value": 1, "next": {"value": 2, "next": {"value": "3"}}})"_json)
                     .error->front();
    REQUIRE(issue.path == Path{std::string("next"), std::string("next"), std::string("value")});

    auto t = R"({"name": "root", "children": [{"name": "a", "children": []}, {"name": 1, "children": []}]})"_json;
    REQUIRE(tree().parse(t).error->front().path == Path{std::string("children"), int64_t(1), std::string("name")});
}

TEST_CASE("Lazy thunks run once", "[lazy]") {
    std::atomic<int> calls{0};
    auto s = lazy([&calls] {
        ++calls;
        return string();
    });
    REQUIRE(calls == 0);
    REQUIRE(s.parse("a").ok());
    REQUIRE(s.parse("b").ok());
    REQUIRE(s.unwrap().kind() == Kind::String);
    REQUIRE(s.expected_type() == "string");
    REQUIRE(calls == 1);
}

TEST_CASE("Lazy resolution is shared across threads", "[lazy][concurrency]") {
    std::atomic<int> calls{0};
    auto s = lazy([&calls] {
        ++calls;
        std::this_thread::yield();
        return number().gte(0);
    });
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&s, &failures, t] {
            for (int i = 0; i < 100; ++i) {
                if (!s.parse(i * t).ok()) ++failures;
                if (s.parse(-1).ok()) ++failures;
            }
        });
    }
    for (auto& th : threads) th.join();
    REQUIRE(calls == 1);
    REQUIRE(failures == 0);
}

TEST_CASE("A failing thunk becomes an issue", "[lazy]") {
    auto s = lazy([]() -> Schema { throw std::runtime_error("unresolvable"); });
    auto issue = s.parse(1).error->front();
    REQUIRE(issue.code == IssueCode::Custom);
    REQUIRE(issue.message == "unresolvable");
}

TEST_CASE("Registry metadata is keyed by schema identity", "[registry]") {
    Registry registry;
    auto email = string().email();
    SchemaMeta meta;
    meta.title = "Email";
    meta.description = "contact address";
    registry.add(email, meta);

    REQUIRE(registry.has(email));
    REQUIRE(registry.get(email)->title == "Email");
    REQUIRE_FALSE(registry.has(email.min(3)));
    REQUIRE_FALSE(registry.get(string()).has_value());

    meta.version = "2";
    registry.add(email, meta);
    REQUIRE(registry.size() == 1);
    REQUIRE(registry.get(email)->version == "2");

    registry.remove(email);
    REQUIRE(registry.size() == 0);
}

TEST_CASE("Registry lookups by brand and iteration", "[registry]") {
    Registry registry;
    auto user_id = string().uuid().brand("UserId");
    SchemaMeta meta;
    meta.title = "User id";
    meta.extra["format"] = "uuid";
    registry.add(user_id, meta).add(number(), SchemaMeta{});

    REQUIRE(registry.by_brand("UserId")->extra.at("format") == Value("uuid"));
    REQUIRE_FALSE(registry.by_brand("OrderId").has_value());

    int visited = 0;
    registry.for_each([&visited](const Schema&, const SchemaMeta&) {
        ++visited;
        return false;
    });
    REQUIRE(visited == 1);
}

TEST_CASE("Named schemas and references", "[registry]") {
    Registry registry;
    auto node = object({{"id", int64()}, {"parent", registry.ref("Node").optional()}});
    REQUIRE_FALSE(registry.defined("Node"));
    registry.define("Node", node);
    REQUIRE(registry.defined("Node"));
    REQUIRE(registry.lookup("Node").same_node(node));
    REQUIRE(node.parse(R"({"id": 1, "parent": {"id": 2}})"_json).ok());
    REQUIRE(node.parse(R"({"id": 1, "parent": {"id": "2"}})"_json).error->front().path ==
            Path{std::string("parent"), std::string("id")});

    REQUIRE_THROWS_AS(registry.lookup("Missing"), std::out_of_range);
    auto dangling = registry.ref("Missing");
    REQUIRE(dangling.parse(1).error->front().code == IssueCode::Custom);

    registry.clear();
    REQUIRE_FALSE(registry.defined("Node"));
}

TEST_CASE("References outlive their registry", "[registry]") {
    Schema resolved_early;
    Schema never_resolved;
    {
        Registry registry;
        registry.define("Id", int64().positive());
        resolved_early = registry.ref("Id");
        never_resolved = registry.ref("Id");
        REQUIRE(resolved_early.parse(1).ok());
    }
    // the first parse memoised the target
    REQUIRE(resolved_early.parse(2).ok());
    REQUIRE_FALSE(resolved_early.parse(-2).ok());

    auto issue = never_resolved.parse(1).error->front();
    REQUIRE(issue.code == IssueCode::Custom);
    REQUIRE_THAT(issue.message, Catch::Matchers::ContainsSubstring("destroyed"));
}

TEST_CASE("The global registry is shared", "[registry]") {
    auto s = string().brand("GlobalName");
    global_registry().add(s, SchemaMeta{"Global", "", "", Value::object()});
    REQUIRE(global_registry().by_brand("GlobalName")->title == "Global");
    global_registry().remove(s);
    REQUIRE_FALSE(global_registry().has(s));
}
