#include <pbi_scan/core/result.hpp>

#include <nlohmann/json.hpp>

namespace pbi_scan {

namespace {

// The admin API reports failures as
//   {"error": {"code": "ItemNotFound", "message": "..."}}
// and occasionally as a bare {"code": ..., "message": ...} or
// {"Message": "..."} object. Prefer message, then code.
std::optional<std::string> ExtractServiceError(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto doc = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;

    const nlohmann::json* node = &doc;
    auto err = doc.find("error");
    if (err != doc.end() && err->is_object()) {
        node = &*err;
    }

    for (const char* key : {"message", "Message", "code"}) {
        auto it = node->find(key);
        if (it != node->end() && it->is_string() &&
            !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto service_error = ExtractServiceError(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::Internal;
            message = service_error.has_value()
                ? "Bad request: " + *service_error
                : "Bad request";
            break;
        case 401:
            category = ErrorCategory::Authentication;
            message = "Authentication failed - access token missing or expired";
            break;
        case 403:
            category = ErrorCategory::Authentication;
            message = "Forbidden - the signed-in principal lacks admin API permissions";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Not found";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 429:
            category = ErrorCategory::Throttled;
            message = "Too many requests - retry later";
            break;
        case 500:
            category = ErrorCategory::Internal;
            message = service_error.has_value()
                ? "Service error: " + *service_error
                : "Service internal error";
            break;
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::Connection;
            message = "Service unavailable";
            break;
        default:
            category = ErrorCategory::Internal;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, endpoint, status_code, message, service_error, category};
}

std::string Error::ToJson() const {
    nlohmann::json inner;
    inner["category"] = CategoryName();
    inner["operation"] = operation;
    if (!endpoint.empty()) {
        inner["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        inner["http_status"] = *http_status;
    }
    inner["message"] = message;
    if (service_error.has_value() && !service_error->empty()) {
        inner["service_error"] = *service_error;
    }
    inner["exit_code"] = ExitCode();

    nlohmann::json out;
    out["error"] = std::move(inner);
    return out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace pbi_scan
