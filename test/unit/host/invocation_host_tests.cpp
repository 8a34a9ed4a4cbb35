// Copyright (c) 2025 The procrouter developers
// Distributed under the MIT software license
// Tests for the line-delimited invocation host

#include <catch2/catch.hpp>

#include "host/invocation_host.hpp"
#include "router/envelope.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace procrouter;
using router::Context;
using router::Payload;
using json = nlohmann::json;

namespace {

void RegisterTestProcedures(router::Dispatcher& dispatcher) {
    dispatcher.Register("echo", [](const Context&, const Payload& body) { return body; });
    dispatcher.Register("fail", [](const Context&, const Payload&) -> Payload {
        throw router::HandlerError("it failed");
    });
    dispatcher.Register("binary-error", [](const Context&, const Payload&) -> Payload {
        throw std::runtime_error("open failed: \xff\xfe");
    });
    dispatcher.Register("null-error", [](const Context&, const Payload&) -> Payload {
        throw std::runtime_error("null");
    });
    dispatcher.Register("deadline", [](const Context& ctx, const Payload&) {
        return Payload(ctx.deadline() ? "true" : "false");
    });
    dispatcher.Register("id", [](const Context& ctx, const Payload&) { return Payload(json(ctx.request_id()).dump()); });
}

std::vector<std::string> Lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

TEST_CASE("InvocationHost: Invoke", "[host]") {
    router::Dispatcher dispatcher;
    RegisterTestProcedures(dispatcher);
    host::InvocationHost host(dispatcher);

    SECTION("Successful procedure") {
        auto result = host.Invoke(R"({"procedure":"echo","body":{"key":"value"}})");

        REQUIRE(result.ok);
        REQUIRE(result.payload == R"({"body":{"key":"value"}})");
    }

    SECTION("Handler failure is a successful invocation with an error field") {
        auto result = host.Invoke(R"({"procedure":"fail"})");

        REQUIRE(result.ok);
        REQUIRE(result.payload == R"({"error":"it failed"})");
    }

    SECTION("Unknown procedure is a failed invocation") {
        auto result = host.Invoke(R"({"procedure":"nope"})");

        REQUIRE_FALSE(result.ok);
        REQUIRE(json::parse(result.payload)["dispatchError"] == "unrecognized procedure 'nope'");
    }

    SECTION("Error message reading as null stays a string") {
        auto result = host.Invoke(R"({"procedure":"null-error"})");

        REQUIRE(result.ok);
        REQUIRE(result.payload == R"({"error":"null"})");
    }

    SECTION("Malformed event is a failed invocation") {
        auto result = host.Invoke("{broken");

        REQUIRE_FALSE(result.ok);
        REQUIRE(json::parse(result.payload).contains("dispatchError"));
    }

    SECTION("Explicit context reaches the handler") {
        Context ctx(std::stop_token{}, std::nullopt, "custom-id");
        auto result = host.Invoke(R"({"procedure":"id"})", ctx);

        REQUIRE(result.payload == R"({"body":"custom-id"})");
    }

    SECTION("Request ids are sequential") {
        REQUIRE(host.Invoke(R"({"procedure":"id"})").payload == R"({"body":"1"})");
        REQUIRE(host.Invoke(R"({"procedure":"id"})").payload == R"({"body":"2"})");
    }
}

TEST_CASE("InvocationHost: Configuration", "[host]") {
    router::Dispatcher dispatcher;
    RegisterTestProcedures(dispatcher);

    SECTION("No deadline by default") {
        host::InvocationHost host(dispatcher);
        REQUIRE(host.Invoke(R"({"procedure":"deadline"})").payload == R"({"body":false})");
    }

    SECTION("Timeout attaches a deadline") {
        host::HostConfig config;
        config.invocation_timeout = std::chrono::milliseconds(500);
        host::InvocationHost host(dispatcher, config);
        REQUIRE(host.Invoke(R"({"procedure":"deadline"})").payload == R"({"body":true})");
    }

    SECTION("Oversize events are rejected") {
        host::HostConfig config;
        config.max_event_bytes = 16;
        host::InvocationHost host(dispatcher, config);

        auto result = host.Invoke(R"({"procedure":"echo","body":"long enough"})");
        REQUIRE_FALSE(result.ok);
        REQUIRE(json::parse(result.payload)["dispatchError"] == "event too large");
    }
}

TEST_CASE("InvocationHost: Serve loop", "[host]") {
    router::Dispatcher dispatcher;
    RegisterTestProcedures(dispatcher);
    host::InvocationHost host(dispatcher);

    SECTION("One response line per event, blank lines skipped") {
        std::istringstream in(R"({"procedure":"echo","body":[1]})"
                              "\n\n"
                              R"({"procedure":"fail"})"
                              "\n"
                              R"({"procedure":"missing"})"
                              "\n");
        std::ostringstream out;

        REQUIRE(host.Serve(in, out) == 3);

        auto lines = Lines(out.str());
        REQUIRE(lines.size() == 3);
        REQUIRE(lines[0] == R"({"body":[1]})");
        REQUIRE(lines[1] == R"({"error":"it failed"})");
        REQUIRE(lines[2] == R"({"dispatchError":"unrecognized procedure 'missing'"})");
    }

    SECTION("Non-UTF-8 error message does not stop the loop") {
        std::istringstream in(R"({"procedure":"binary-error"})"
                              "\n"
                              R"({"procedure":"echo","body":{"n":1e2}})"
                              "\n");
        std::ostringstream out;

        REQUIRE(host.Serve(in, out) == 2);

        auto lines = Lines(out.str());
        REQUIRE(lines.size() == 2);
        auto first = json::parse(lines[0]);
        REQUIRE(first["error"].get<std::string>().rfind("open failed: ", 0) == 0);
        REQUIRE(lines[1] == R"({"body":{"n":1e2}})");
    }

    SECTION("Stopped host processes nothing") {
        std::istringstream in(R"({"procedure":"echo"})" "\n");
        std::ostringstream out;

        host.Stop();
        REQUIRE(host.StopRequested());
        REQUIRE(host.Serve(in, out) == 0);
        REQUIRE(out.str().empty());
    }

    SECTION("Stop cancels contexts handed to handlers") {
        bool cancelled = false;
        dispatcher.Register("stop", [&host, &cancelled](const Context& ctx, const Payload& body) {
            host.Stop();
            cancelled = ctx.Cancelled();
            return body;
        });
        std::istringstream in(R"({"procedure":"stop"})" "\n" R"({"procedure":"echo"})" "\n");
        std::ostringstream out;

        REQUIRE(host.Serve(in, out) == 1);
        REQUIRE(cancelled);
    }
}
