#pragma once

#include <pbi_scan/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace pbi_scan {

// ---------------------------------------------------------------------------
// HttpHeaders: ordered key-value pairs for HTTP headers.
// Header names are case-sensitive in this representation; callers
// normalise as needed.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpResponse: the result of an HTTP request.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IHttpSession: abstract HTTP session for the admin REST API.
//
// The gateway and every module above it depend on this interface rather
// than a concrete HTTP client. This enables offline testing via
// MockHttpSession.
//
// A transport failure (no response at all) is an Err. Any HTTP status,
// including 4xx/5xx, is an Ok carrying the response; interpreting the
// status is the caller's job.
// ---------------------------------------------------------------------------
class IHttpSession {
public:
    virtual ~IHttpSession() = default;

    // Non-copyable, non-movable (polymorphic base).
    IHttpSession(const IHttpSession&) = delete;
    IHttpSession& operator=(const IHttpSession&) = delete;
    IHttpSession(IHttpSession&&) = delete;
    IHttpSession& operator=(IHttpSession&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

protected:
    IHttpSession() = default;
};

} // namespace pbi_scan
