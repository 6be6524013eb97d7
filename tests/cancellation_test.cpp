#include <catch2/catch_test_macros.hpp>

#include "mcprt/core/cancellation.hpp"

#include <vector>

using namespace mcprt;

TEST_CASE("Default token is never cancelled", "[cancellation]") {
    CancellationToken token;
    REQUIRE_FALSE(token.can_be_cancelled());
    REQUIRE_FALSE(token.is_cancelled());
    REQUIRE(token.reason().is_null());

    bool called = false;
    auto registration = token.on_cancel([&](const Json&) { called = true; });
    REQUIRE_FALSE(called);
}

TEST_CASE("Cancelling notifies observers with the exact reason", "[cancellation]") {
    CancellationSource source;
    auto token = source.token();

    std::vector<Json> seen;
    auto first = token.on_cancel([&](const Json& reason) { seen.push_back(reason); });
    auto second = token.on_cancel([&](const Json& reason) { seen.push_back(reason); });

    const Json reason = {{"code", 7}, {"why", "shutdown"}};
    REQUIRE(source.cancel(reason));

    REQUIRE(seen.size() == 2);
    REQUIRE(seen[0] == reason);
    REQUIRE(token.is_cancelled());
    REQUIRE(token.reason() == reason);
}

TEST_CASE("Only the first cancel wins", "[cancellation]") {
    CancellationSource source;
    REQUIRE(source.cancel("first"));
    REQUIRE_FALSE(source.cancel("second"));
    REQUIRE(source.token().reason() == "first");
}

TEST_CASE("Observers registered after cancellation run immediately", "[cancellation]") {
    CancellationSource source;
    source.cancel("late");

    Json seen;
    auto registration = source.token().on_cancel([&](const Json& reason) { seen = reason; });
    REQUIRE(seen == "late");
}

TEST_CASE("Dropping a registration detaches its observer", "[cancellation]") {
    CancellationSource source;
    int calls = 0;
    {
        auto registration = source.token().on_cancel([&](const Json&) { ++calls; });
    }
    auto kept = source.token().on_cancel([&](const Json&) { calls += 10; });

    source.cancel();
    REQUIRE(calls == 10);
}

TEST_CASE("Moved registrations stay attached", "[cancellation]") {
    CancellationSource source;
    int calls = 0;

    CancellationRegistration outer;
    {
        auto inner = source.token().on_cancel([&](const Json&) { ++calls; });
        outer = std::move(inner);
    }

    source.cancel();
    REQUIRE(calls == 1);
}

TEST_CASE("Observers may query the token while being notified", "[cancellation]") {
    CancellationSource source;
    auto token = source.token();

    bool observed = false;
    auto registration = token.on_cancel([&](const Json&) { observed = token.is_cancelled(); });
    source.cancel();
    REQUIRE(observed);
}
