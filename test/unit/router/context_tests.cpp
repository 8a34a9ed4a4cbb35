// Copyright (c) 2025 The procrouter developers
// Distributed under the MIT software license

#include <catch2/catch.hpp>

#include "router/context.hpp"

#include <chrono>

using namespace procrouter::router;
using namespace std::chrono_literals;

TEST_CASE("Context: Background is never cancelled", "[context]") {
    auto ctx = Context::Background();

    REQUIRE_FALSE(ctx.Cancelled());
    REQUIRE_FALSE(ctx.deadline().has_value());
    REQUIRE_FALSE(ctx.RemainingTime().has_value());
    REQUIRE(ctx.request_id().empty());
}

TEST_CASE("Context: Stop requests cancel the context", "[context]") {
    std::stop_source source;
    Context ctx(source.get_token(), std::nullopt, "42");

    REQUIRE_FALSE(ctx.Cancelled());
    source.request_stop();
    REQUIRE(ctx.Cancelled());
    REQUIRE(ctx.request_id() == "42");
}

TEST_CASE("Context: Deadlines", "[context]") {
    SECTION("Passed deadline cancels") {
        Context ctx(std::stop_token{}, Context::Clock::now() - 1ms);
        REQUIRE(ctx.Cancelled());
        REQUIRE(ctx.RemainingTime() == Context::Clock::duration::zero());
    }

    SECTION("Future deadline leaves time remaining") {
        auto ctx = Context::Background().WithTimeout(1h);
        REQUIRE_FALSE(ctx.Cancelled());
        REQUIRE(ctx.RemainingTime().has_value());
        REQUIRE(*ctx.RemainingTime() > 59min);
    }

    SECTION("Derived deadline never extends the parent's") {
        auto parent = Context::Background().WithTimeout(1s);
        auto child = parent.WithTimeout(1h);
        REQUIRE(child.deadline() == parent.deadline());

        auto tighter = parent.WithTimeout(1ms);
        REQUIRE(*tighter.deadline() < *parent.deadline());
    }

    SECTION("Derived context keeps cancellation and request id") {
        std::stop_source source;
        Context parent(source.get_token(), std::nullopt, "req");
        auto child = parent.WithTimeout(1h);

        source.request_stop();
        REQUIRE(child.Cancelled());
        REQUIRE(child.request_id() == "req");
    }
}
