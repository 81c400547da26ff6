#pragma once

#include <pbi_scan/api/i_http_session.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace pbi_scan {

// ---------------------------------------------------------------------------
// HttpSessionOptions: transport configuration for the REST session.
// ---------------------------------------------------------------------------
struct HttpSessionOptions {
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds read_timeout{300};
    bool disable_tls_verify = false;
};

// ---------------------------------------------------------------------------
// HttpSession: concrete IHttpSession implementation using cpp-httplib.
//
// Uses pimpl to avoid leaking httplib into the public header.
//
// Every request carries:
//   - Authorization: Bearer <access token>
//   - Accept: application/json
// The token is supplied by the caller; acquiring it is outside this class.
// ---------------------------------------------------------------------------
class HttpSession : public IHttpSession {
public:
    /// base_url is scheme://host[:port], e.g. "https://api.powerbi.com".
    HttpSession(const std::string& base_url,
                const std::string& access_token,
                const HttpSessionOptions& options = {});

    ~HttpSession() override;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) = delete;
    HttpSession& operator=(HttpSession&&) = delete;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pbi_scan
