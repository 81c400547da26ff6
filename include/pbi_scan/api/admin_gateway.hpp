#pragma once

#include <pbi_scan/api/i_http_session.hpp>
#include <pbi_scan/core/result.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <string>

namespace pbi_scan {

/// Blocking sleep. Injected so tests can run retry and poll loops instantly.
using SleepFn = std::function<void(std::chrono::milliseconds)>;

/// std::this_thread::sleep_for.
SleepFn RealSleep();

// ---------------------------------------------------------------------------
// RetryPolicy: fixed-delay bounded retry.
//
// A call is attempted at most max_retries + 1 times with `delay` between
// attempts. There is no backoff growth and no circuit breaker.
// ---------------------------------------------------------------------------
struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds delay{std::chrono::seconds{5}};
};

// ---------------------------------------------------------------------------
// AdminGateway: thin JSON layer over IHttpSession for the admin REST API.
//
// Every call applies the RetryPolicy, except that a not-found failure
// (HTTP 404) is returned after the first attempt: it means "this resource
// or capability does not exist" and retrying cannot change that.
// Exhausting the retries returns the last failure.
//
// POST is retried like GET. A retried submit may create a duplicate scan
// job server-side; each POST retry is logged as a warning.
//
// Holds a reference to the session; the session must outlive the gateway.
// ---------------------------------------------------------------------------
class AdminGateway {
public:
    AdminGateway(IHttpSession& session, RetryPolicy policy, SleepFn sleep);

    [[nodiscard]] Result<nlohmann::json, Error> GetJson(const std::string& path);

    [[nodiscard]] Result<nlohmann::json, Error> PostJson(const std::string& path,
                                                         const nlohmann::json& body);

    /// GET returning the raw 2xx body, unparsed.
    [[nodiscard]] Result<std::string, Error> GetText(const std::string& path);

    [[nodiscard]] const RetryPolicy& Policy() const noexcept { return policy_; }

private:
    Result<std::string, Error> Execute(
        const std::string& operation,
        const std::string& path,
        const std::function<Result<HttpResponse, Error>()>& send);

    IHttpSession& session_;
    RetryPolicy policy_;
    SleepFn sleep_;
};

} // namespace pbi_scan
