#include <pbi_scan/api/http_session.hpp>
#include <pbi_scan/core/log.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <optional>

namespace pbi_scan {

namespace {

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

Error MakeTransportError(const std::string& operation,
                         const std::string& endpoint,
                         httplib::Error error) {
    return Error{operation, endpoint, std::nullopt,
                 "HTTP request failed: " + httplib::to_string(error),
                 std::nullopt, CategoryFromHttpTransportError(error)};
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

bool IsSensitiveHeader(std::string_view key) {
    std::string lower_key(key);
    std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower_key == "authorization" || lower_key == "cookie" ||
           lower_key == "set-cookie";
}

void LogRequestHeaders(const httplib::Headers& hdrs) {
    for (const auto& [k, v] : hdrs) {
        LogDebug("http", "  > " + k + ": " +
                             (IsSensitiveHeader(k) ? std::string("<redacted>") : v));
    }
}

void LogResponse(const httplib::Response& res) {
    LogInfo("http", "  < " + std::to_string(res.status));
    // The request id is what support asks for when a scan misbehaves.
    auto rid = res.headers.find("RequestId");
    if (rid != res.headers.end()) {
        LogDebug("http", "  < RequestId: " + rid->second);
    }
    if (res.status >= 400 && !res.body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        if (res.body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + res.body);
        } else {
            LogDebug("http", "  < body: " + res.body.substr(0, kMaxBodyLog) +
                                 "... (truncated)");
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl: pimpl body holding the httplib::Client and the bearer token.
// ---------------------------------------------------------------------------
struct HttpSession::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string access_token;

    Impl(const std::string& base_url,
         const std::string& token,
         const HttpSessionOptions& opts)
        : client(std::make_unique<httplib::Client>(base_url)),
          access_token(token) {
        client->set_connection_timeout(opts.connect_timeout);
        client->set_read_timeout(opts.read_timeout);
        client->set_follow_location(true);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        if (opts.disable_tls_verify) {
            client->enable_server_certificate_verification(false);
        }
#endif
    }

    httplib::Headers BuildHeaders(const HttpHeaders& extra) const {
        httplib::Headers hdrs;
        hdrs.emplace("Authorization", "Bearer " + access_token);
        if (extra.find("Accept") == extra.end()) {
            hdrs.emplace("Accept", "application/json");
        }
        for (const auto& [key, value] : extra) {
            hdrs.emplace(key, value);
        }
        return hdrs;
    }

    Result<HttpResponse, Error> DoGet(std::string_view path,
                                      const HttpHeaders& extra) {
        auto hdrs = BuildHeaders(extra);
        LogInfo("http", "GET " + std::string(path));
        LogRequestHeaders(hdrs);
        auto res = client->Get(std::string(path), hdrs);
        if (!res) {
            return Result<HttpResponse, Error>::Err(
                MakeTransportError("Get", std::string(path), res.error()));
        }
        LogResponse(*res);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }

    Result<HttpResponse, Error> DoPost(std::string_view path,
                                       std::string_view body,
                                       std::string_view content_type,
                                       const HttpHeaders& extra) {
        auto hdrs = BuildHeaders(extra);
        LogInfo("http", "POST " + std::string(path));
        LogRequestHeaders(hdrs);
        auto res = client->Post(std::string(path), hdrs, std::string(body),
                                std::string(content_type));
        if (!res) {
            return Result<HttpResponse, Error>::Err(
                MakeTransportError("Post", std::string(path), res.error()));
        }
        LogResponse(*res);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }
};

HttpSession::HttpSession(const std::string& base_url,
                         const std::string& access_token,
                         const HttpSessionOptions& options)
    : impl_(std::make_unique<Impl>(base_url, access_token, options)) {}

HttpSession::~HttpSession() = default;

Result<HttpResponse, Error> HttpSession::Get(std::string_view path,
                                             const HttpHeaders& headers) {
    return impl_->DoGet(path, headers);
}

Result<HttpResponse, Error> HttpSession::Post(std::string_view path,
                                              std::string_view body,
                                              std::string_view content_type,
                                              const HttpHeaders& headers) {
    return impl_->DoPost(path, body, content_type, headers);
}

} // namespace pbi_scan
