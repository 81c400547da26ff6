#include <catch2/catch_test_macros.hpp>

#include <pbi_scan/api/http_session.hpp>

#include <httplib.h>

#include <chrono>
#include <string>
#include <thread>

using namespace pbi_scan;

// ===========================================================================
// Helper: run an httplib::Server on an OS-assigned loopback port.
// ===========================================================================
namespace {

class LocalServer {
public:
    explicit LocalServer(httplib::Server& svr) : svr_(svr) {
        port_ = svr_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { svr_.listen_after_bind(); });
        svr_.wait_until_ready();
    }

    ~LocalServer() {
        svr_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] std::string BaseUrl() const {
        return "http://127.0.0.1:" + std::to_string(port_);
    }

    LocalServer(const LocalServer&) = delete;
    LocalServer& operator=(const LocalServer&) = delete;

private:
    httplib::Server& svr_;
    int port_ = 0;
    std::thread thread_;
};

HttpSessionOptions FastOptions() {
    HttpSessionOptions opts;
    opts.connect_timeout = std::chrono::seconds{5};
    opts.read_timeout = std::chrono::seconds{5};
    return opts;
}

} // anonymous namespace

TEST_CASE("HttpSession: GET sends bearer token and JSON accept", "[api][session][live]") {
    httplib::Server svr;
    std::string received_auth;
    std::string received_accept;

    svr.Get("/v1.0/myorg/admin/groups", [&](const httplib::Request& req,
                                            httplib::Response& res) {
        received_auth = req.get_header_value("Authorization");
        received_accept = req.get_header_value("Accept");
        res.set_content(R"({"value":[]})", "application/json");
    });

    LocalServer server(svr);
    HttpSession session(server.BaseUrl(), "tok-123", FastOptions());

    auto result = session.Get("/v1.0/myorg/admin/groups");
    REQUIRE(result.IsOk());
    CHECK(result.Value().status_code == 200);
    CHECK(result.Value().body == R"({"value":[]})");
    CHECK(received_auth == "Bearer tok-123");
    CHECK(received_accept == "application/json");
}

TEST_CASE("HttpSession: POST forwards body and content type", "[api][session][live]") {
    httplib::Server svr;
    std::string received_body;
    std::string received_type;

    svr.Post("/v1.0/myorg/admin/workspaces/getInfo", [&](const httplib::Request& req,
                                                         httplib::Response& res) {
        received_body = req.body;
        received_type = req.get_header_value("Content-Type");
        res.status = 202;
        res.set_content(R"({"id":"s1","status":"NotStarted"})", "application/json");
    });

    LocalServer server(svr);
    HttpSession session(server.BaseUrl(), "tok", FastOptions());

    auto result = session.Post("/v1.0/myorg/admin/workspaces/getInfo",
                               R"({"workspaces":["a"]})", "application/json");
    REQUIRE(result.IsOk());
    CHECK(result.Value().status_code == 202);
    CHECK(received_body == R"({"workspaces":["a"]})");
    CHECK(received_type == "application/json");
}

TEST_CASE("HttpSession: error status is an Ok response", "[api][session][live]") {
    httplib::Server svr;
    svr.Get("/missing", [](const httplib::Request&, httplib::Response& res) {
        res.status = 404;
        res.set_content(R"({"error":{"code":"ItemNotFound"}})", "application/json");
    });

    LocalServer server(svr);
    HttpSession session(server.BaseUrl(), "tok", FastOptions());

    auto result = session.Get("/missing");
    REQUIRE(result.IsOk());
    CHECK(result.Value().status_code == 404);
}

TEST_CASE("HttpSession: unreachable host is a transport error", "[api][session][live]") {
    HttpSessionOptions opts;
    opts.connect_timeout = std::chrono::seconds{1};
    opts.read_timeout = std::chrono::seconds{1};
    // Port 1 on loopback is never listening in the test environment.
    HttpSession session("http://127.0.0.1:1", "tok", opts);

    auto result = session.Get("/v1.0/myorg/admin/groups");
    REQUIRE(result.IsErr());
    CHECK_FALSE(result.Error().http_status.has_value());
    CHECK(result.Error().message.find("HTTP request failed") != std::string::npos);
}
