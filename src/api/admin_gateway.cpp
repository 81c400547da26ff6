#include <pbi_scan/api/admin_gateway.hpp>

#include <pbi_scan/core/log.hpp>

#include <thread>

namespace pbi_scan {

namespace {

bool IsSuccess(int status) {
    return status >= 200 && status < 300;
}

Result<nlohmann::json, Error> ParseJsonBody(const std::string& operation,
                                            const std::string& path,
                                            const std::string& body) {
    // 202/204 responses may carry no body at all.
    if (body.empty()) {
        return Result<nlohmann::json, Error>::Ok(nlohmann::json::object());
    }
    auto doc = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return Result<nlohmann::json, Error>::Err(Error{
            operation, path, std::nullopt,
            "Response is not valid JSON", std::nullopt,
            ErrorCategory::Internal});
    }
    return Result<nlohmann::json, Error>::Ok(std::move(doc));
}

} // anonymous namespace

SleepFn RealSleep() {
    return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

AdminGateway::AdminGateway(IHttpSession& session, RetryPolicy policy, SleepFn sleep)
    : session_(session), policy_(policy), sleep_(std::move(sleep)) {
    if (policy_.max_retries < 0) {
        policy_.max_retries = 0;
    }
}

Result<std::string, Error> AdminGateway::Execute(
    const std::string& operation,
    const std::string& path,
    const std::function<Result<HttpResponse, Error>()>& send) {
    const int attempts = policy_.max_retries + 1;
    std::optional<Error> last_error;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1) {
            if (operation == "PostJson") {
                LogWarn("gateway", "Retrying POST " + path +
                                       " - a previous attempt may already have created the job");
            }
            if (sleep_) {
                sleep_(policy_.delay);
            }
        }

        auto response = send();
        if (response.IsOk()) {
            const auto& http = response.Value();
            if (IsSuccess(http.status_code)) {
                return Result<std::string, Error>::Ok(http.body);
            }
            last_error = Error::FromHttpStatus(operation, path, http.status_code, http.body);
        } else {
            last_error = std::move(response).Error();
        }

        if (last_error->IsNotFound()) {
            LogDebug("gateway", operation + " " + path + ": not found, not retrying");
            break;
        }
        LogWarn("gateway", "Attempt " + std::to_string(attempt) + "/" +
                               std::to_string(attempts) + " failed: " +
                               last_error->ToString());
    }

    return Result<std::string, Error>::Err(std::move(*last_error));
}

Result<nlohmann::json, Error> AdminGateway::GetJson(const std::string& path) {
    auto body = Execute("GetJson", path, [&] { return session_.Get(path); });
    if (body.IsErr()) {
        return Result<nlohmann::json, Error>::Err(std::move(body).Error());
    }
    return ParseJsonBody("GetJson", path, body.Value());
}

Result<nlohmann::json, Error> AdminGateway::PostJson(const std::string& path,
                                                     const nlohmann::json& body) {
    const auto payload = body.dump();
    auto response = Execute("PostJson", path, [&] {
        return session_.Post(path, payload, "application/json");
    });
    if (response.IsErr()) {
        return Result<nlohmann::json, Error>::Err(std::move(response).Error());
    }
    return ParseJsonBody("PostJson", path, response.Value());
}

Result<std::string, Error> AdminGateway::GetText(const std::string& path) {
    return Execute("GetText", path, [&] { return session_.Get(path); });
}

} // namespace pbi_scan
