#include <catch2/catch_test_macros.hpp>

#include <pbi_scan/api/admin_gateway.hpp>
#include "../../test/mocks/mock_http_session.hpp"

#include <chrono>
#include <vector>

using namespace pbi_scan;
using namespace pbi_scan::testing;

namespace {

struct SleepRecorder {
    std::vector<std::chrono::milliseconds> calls;
    SleepFn Fn() {
        return [this](std::chrono::milliseconds d) { calls.push_back(d); };
    }
};

RetryPolicy Policy(int max_retries) {
    RetryPolicy p;
    p.max_retries = max_retries;
    p.delay = std::chrono::milliseconds{250};
    return p;
}

} // anonymous namespace

// ===========================================================================
// Success paths
// ===========================================================================

TEST_CASE("AdminGateway: GetJson parses a 200 body", "[api][gateway]") {
    MockHttpSession mock;
    mock.EnqueueGet(Respond(200, R"({"value":[1,2]})"));
    SleepRecorder sleeps;
    AdminGateway gateway(mock, Policy(3), sleeps.Fn());

    auto r = gateway.GetJson("/x");
    REQUIRE(r.IsOk());
    CHECK(r.Value()["value"].size() == 2);
    CHECK(mock.GetCallCount() == 1);
    CHECK(sleeps.calls.empty());
}

TEST_CASE("AdminGateway: empty 2xx body is an empty object", "[api][gateway]") {
    MockHttpSession mock;
    mock.EnqueuePost(Respond(202, ""));
    AdminGateway gateway(mock, Policy(0), nullptr);

    auto r = gateway.PostJson("/submit", nlohmann::json::object());
    REQUIRE(r.IsOk());
    CHECK(r.Value().is_object());
    CHECK(r.Value().empty());
}

TEST_CASE("AdminGateway: PostJson sends serialized body", "[api][gateway]") {
    MockHttpSession mock;
    mock.EnqueuePost(Respond(202, R"({"id":"s1"})"));
    AdminGateway gateway(mock, Policy(0), nullptr);

    auto r = gateway.PostJson("/submit", {{"workspaces", {"a", "b"}}});
    REQUIRE(r.IsOk());
    REQUIRE(mock.PostCallCount() == 1);
    CHECK(mock.PostCalls()[0].content_type == "application/json");
    CHECK(nlohmann::json::parse(mock.PostCalls()[0].body)["workspaces"].size() == 2);
}

TEST_CASE("AdminGateway: GetText returns body unparsed", "[api][gateway]") {
    MockHttpSession mock;
    mock.EnqueueGet(Respond(200, "not json at all"));
    AdminGateway gateway(mock, Policy(0), nullptr);

    auto r = gateway.GetText("/raw");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "not json at all");
}

TEST_CASE("AdminGateway: invalid JSON on 2xx is not retried", "[api][gateway]") {
    MockHttpSession mock;
    mock.EnqueueGet(Respond(200, "{broken"));
    AdminGateway gateway(mock, Policy(3), nullptr);

    auto r = gateway.GetJson("/x");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Internal);
    CHECK(mock.GetCallCount() == 1);
}

// ===========================================================================
// Retry behaviour
// ===========================================================================

TEST_CASE("AdminGateway: transient failure exhausts max_retries + 1 attempts", "[api][gateway]") {
    MockHttpSession mock;
    mock.SetGetHandler([](const std::string&) { return Respond(503); });
    SleepRecorder sleeps;
    AdminGateway gateway(mock, Policy(3), sleeps.Fn());

    auto r = gateway.GetJson("/flaky");
    REQUIRE(r.IsErr());
    CHECK(r.Error().http_status == 503);
    CHECK(r.Error().category == ErrorCategory::Connection);
    CHECK(mock.GetCallCount() == 4);
    REQUIRE(sleeps.calls.size() == 3);
    CHECK(sleeps.calls[0] == std::chrono::milliseconds{250});
}

TEST_CASE("AdminGateway: recovers after a transient failure", "[api][gateway]") {
    MockHttpSession mock;
    mock.EnqueueGet(TransportFailure("/x"));
    mock.EnqueueGet(Respond(429));
    mock.EnqueueGet(Respond(200, R"({"ok":true})"));
    SleepRecorder sleeps;
    AdminGateway gateway(mock, Policy(3), sleeps.Fn());

    auto r = gateway.GetJson("/x");
    REQUIRE(r.IsOk());
    CHECK(r.Value()["ok"] == true);
    CHECK(mock.GetCallCount() == 3);
    CHECK(sleeps.calls.size() == 2);
}

TEST_CASE("AdminGateway: 404 is attempted exactly once", "[api][gateway]") {
    MockHttpSession mock;
    mock.SetGetHandler([](const std::string&) {
        return Respond(404, R"({"error":{"code":"ItemNotFound"}})");
    });
    SleepRecorder sleeps;
    AdminGateway gateway(mock, Policy(5), sleeps.Fn());

    auto r = gateway.GetJson("/gone");
    REQUIRE(r.IsErr());
    CHECK(r.Error().IsNotFound());
    CHECK(mock.GetCallCount() == 1);
    CHECK(sleeps.calls.empty());
}

TEST_CASE("AdminGateway: POST is retried like GET", "[api][gateway]") {
    MockHttpSession mock;
    mock.EnqueuePost(Respond(500));
    mock.EnqueuePost(Respond(202, R"({"id":"s2"})"));
    AdminGateway gateway(mock, Policy(3), nullptr);

    auto r = gateway.PostJson("/submit", nlohmann::json::object());
    REQUIRE(r.IsOk());
    CHECK(r.Value()["id"] == "s2");
    CHECK(mock.PostCallCount() == 2);
}

TEST_CASE("AdminGateway: zero retries means a single attempt", "[api][gateway]") {
    MockHttpSession mock;
    mock.SetGetHandler([](const std::string&) { return Respond(500); });
    AdminGateway gateway(mock, Policy(0), nullptr);

    CHECK(gateway.GetJson("/x").IsErr());
    CHECK(mock.GetCallCount() == 1);
}

TEST_CASE("AdminGateway: negative max_retries is clamped to zero", "[api][gateway]") {
    MockHttpSession mock;
    mock.SetGetHandler([](const std::string&) { return Respond(500); });
    AdminGateway gateway(mock, Policy(-2), nullptr);

    CHECK(gateway.Policy().max_retries == 0);
    CHECK(gateway.GetJson("/x").IsErr());
    CHECK(mock.GetCallCount() == 1);
}
