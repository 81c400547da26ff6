#pragma once

#include <cassert>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace pbi_scan {

// ---------------------------------------------------------------------------
// Result<T, E>: a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    // -- Factories ----------------------------------------------------------

    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    // -- Query --------------------------------------------------------------

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    // -- Access (const&) ----------------------------------------------------

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    // -- Access (&&) --------------------------------------------------------

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    // -- ValueOr ------------------------------------------------------------

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

    [[nodiscard]] T ValueOr(T default_value) && {
        if (IsOk()) {
            return std::get<0>(std::move(storage_));
        }
        return default_value;
    }

    // -- Monadic: AndThen ---------------------------------------------------
    // fn: T -> Result<U, E>

    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using ReturnType = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(storage_));
        }
        return ReturnType::Err(std::get<1>(storage_));
    }

    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using ReturnType = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
        }
        return ReturnType::Err(std::get<1>(std::move(storage_)));
    }

    // -- Monadic: Map -------------------------------------------------------
    // fn: T -> U

    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
        }
        return Result<U, E>::Err(std::get<1>(storage_));
    }

    template <typename Fn>
    auto Map(Fn&& fn) && -> Result<std::invoke_result_t<Fn, T&&>, E> {
        using U = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(std::move(storage_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(storage_)));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory: classifies errors for retry decisions and exit codes.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Connection,
    Authentication,
    NotFound,
    Throttled,
    Timeout,
    ScanFailed,
    Config,
    Output,
    NothingToScan,
    Internal,
};

// ---------------------------------------------------------------------------
// Error: structured error type for admin API and pipeline operations.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string endpoint;
    std::optional<int> http_status;
    std::string message;
    std::optional<std::string> service_error;
    ErrorCategory category = ErrorCategory::Internal;

    /// Create an Error from an HTTP status code with human-readable messages.
    /// Extracts the service error text from a JSON `{"error": {...}}` body.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body = "");

    /// Not-found is a semantic answer ("this resource does not exist"),
    /// not a transient fault. The gateway never retries it.
    [[nodiscard]] bool IsNotFound() const noexcept {
        return category == ErrorCategory::NotFound;
    }

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Connection:     return 1;
            case ErrorCategory::Authentication: return 1;
            case ErrorCategory::NotFound:       return 2;
            case ErrorCategory::Throttled:      return 3;
            case ErrorCategory::Timeout:        return 3;
            case ErrorCategory::ScanFailed:     return 4;
            case ErrorCategory::Config:         return 5;
            case ErrorCategory::Output:         return 6;
            case ErrorCategory::NothingToScan:  return 7;
            case ErrorCategory::Internal:       return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::Connection:     return "connection";
            case ErrorCategory::Authentication: return "authentication";
            case ErrorCategory::NotFound:       return "not_found";
            case ErrorCategory::Throttled:      return "throttled";
            case ErrorCategory::Timeout:        return "timeout";
            case ErrorCategory::ScanFailed:     return "scan_failed";
            case ErrorCategory::Config:         return "config";
            case ErrorCategory::Output:         return "output";
            case ErrorCategory::NothingToScan:  return "nothing_to_scan";
            case ErrorCategory::Internal:       return "internal";
        }
        return "internal";
    }

    [[nodiscard]] std::string ToString() const {
        std::ostringstream oss;
        oss << operation;
        if (!endpoint.empty()) {
            oss << " [" << endpoint << "]";
        }
        if (http_status.has_value()) {
            oss << " (HTTP " << *http_status << ")";
        }
        oss << ": " << message;
        if (service_error.has_value() && !service_error->empty()) {
            oss << " - service: " << *service_error;
        }
        return oss.str();
    }

    /// Serialize as `{"error": {...}}` for --json output.
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               endpoint == other.endpoint &&
               http_status == other.http_status &&
               message == other.message &&
               service_error == other.service_error &&
               category == other.category;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace pbi_scan
