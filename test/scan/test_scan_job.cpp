#include <catch2/catch_test_macros.hpp>

#include <pbi_scan/scan/scan_job.hpp>
#include "../../test/mocks/mock_http_session.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace pbi_scan;
using namespace pbi_scan::testing;

namespace {

RetryPolicy NoRetry() {
    return RetryPolicy{0, std::chrono::milliseconds{0}};
}

ScanJobOptions Options(int max_polls = 0) {
    ScanJobOptions o;
    o.poll_interval = std::chrono::milliseconds{10};
    o.max_polls = max_polls;
    return o;
}

ScanRequest OneBatch() {
    return ScanRequest{1, {"ws-a"}, ScanOptions{}};
}

} // anonymous namespace

TEST_CASE("ScanJobRunner: NotStarted -> Running -> Succeeded fetches result", "[scan][job]") {
    MockHttpSession mock;
    mock.EnqueuePost(Respond(202, R"({"id":"s1","status":"NotStarted"})"));
    mock.EnqueueGet(Respond(200, R"({"status":"Running"})"));
    mock.EnqueueGet(Respond(200, R"({"status":"Succeeded"})"));
    mock.EnqueueGet(Respond(200, R"({"workspaces":[{"id":"ws-a"}]})"));

    std::vector<std::chrono::milliseconds> sleeps;
    AdminGateway gateway(mock, NoRetry(), nullptr);
    ScanJobRunner runner(gateway, Options(),
                         [&](std::chrono::milliseconds d) { sleeps.push_back(d); });

    auto r = runner.Run(OneBatch());
    REQUIRE(r.IsOk());
    CHECK(r.Value().job.status == ScanStatus::Succeeded);
    CHECK(r.Value().polls == 2);
    CHECK(r.Value().raw_result == R"({"workspaces":[{"id":"ws-a"}]})");

    // Sleep precedes every poll.
    REQUIRE(sleeps.size() == 2);
    CHECK(sleeps[0] == std::chrono::milliseconds{10});
    REQUIRE(mock.GetCallCount() == 3);
    CHECK(mock.GetCalls()[2].path == "/v1.0/myorg/admin/workspaces/scanResult/s1");
}

TEST_CASE("ScanJobRunner: Failed status fails the job without fetching", "[scan][job]") {
    MockHttpSession mock;
    mock.EnqueuePost(Respond(202, R"({"id":"s1","status":"NotStarted"})"));
    mock.EnqueueGet(Respond(200, R"({"status":"Failed"})"));
    AdminGateway gateway(mock, NoRetry(), nullptr);
    ScanJobRunner runner(gateway, Options(), nullptr);

    auto r = runner.Run(OneBatch());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::ScanFailed);
    CHECK(r.Error().message.find("Failed") != std::string::npos);
    CHECK(mock.GetCallCount() == 1);
}

TEST_CASE("ScanJobRunner: unrecognised status is terminal and fails", "[scan][job]") {
    MockHttpSession mock;
    mock.EnqueuePost(Respond(202, R"({"id":"s1","status":"Running"})"));
    mock.EnqueueGet(Respond(200, R"({"status":"Archived"})"));
    AdminGateway gateway(mock, NoRetry(), nullptr);
    ScanJobRunner runner(gateway, Options(), nullptr);

    auto r = runner.Run(OneBatch());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::ScanFailed);
    CHECK(r.Error().message.find("Unknown") != std::string::npos);
}

TEST_CASE("ScanJobRunner: Succeeded at submit skips polling", "[scan][job]") {
    MockHttpSession mock;
    mock.EnqueuePost(Respond(202, R"({"id":"s1","status":"Succeeded"})"));
    mock.EnqueueGet(Respond(200, R"({"workspaces":[]})"));
    AdminGateway gateway(mock, NoRetry(), nullptr);
    ScanJobRunner runner(gateway, Options(), nullptr);

    auto r = runner.Run(OneBatch());
    REQUIRE(r.IsOk());
    CHECK(r.Value().polls == 0);
    CHECK(mock.GetCallCount() == 1);
}

TEST_CASE("ScanJobRunner: max_polls bounds a stuck job", "[scan][job]") {
    MockHttpSession mock;
    mock.EnqueuePost(Respond(202, R"({"id":"s1","status":"NotStarted"})"));
    mock.SetGetHandler([](const std::string&) {
        return Respond(200, R"({"status":"Running"})");
    });
    AdminGateway gateway(mock, NoRetry(), nullptr);
    ScanJobRunner runner(gateway, Options(3), nullptr);

    auto r = runner.Run(OneBatch());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Timeout);
    CHECK(mock.GetCallCount() == 3);
}

TEST_CASE("ScanJobRunner: status poll error ends the job", "[scan][job]") {
    MockHttpSession mock;
    mock.EnqueuePost(Respond(202, R"({"id":"s1"})"));
    mock.EnqueueGet(Respond(500));
    AdminGateway gateway(mock, NoRetry(), nullptr);
    ScanJobRunner runner(gateway, Options(), nullptr);

    auto r = runner.Run(OneBatch());
    REQUIRE(r.IsErr());
    CHECK(r.Error().http_status == 500);
}

TEST_CASE("ScanJobRunner: fetch error after success fails the job", "[scan][job]") {
    MockHttpSession mock;
    mock.EnqueuePost(Respond(202, R"({"id":"s1","status":"Succeeded"})"));
    mock.EnqueueGet(Respond(404));
    AdminGateway gateway(mock, NoRetry(), nullptr);
    ScanJobRunner runner(gateway, Options(), nullptr);

    auto r = runner.Run(OneBatch());
    REQUIRE(r.IsErr());
    CHECK(r.Error().IsNotFound());
}
