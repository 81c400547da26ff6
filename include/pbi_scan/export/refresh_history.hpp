#pragma once

#include <pbi_scan/api/admin_gateway.hpp>

#include <optional>
#include <string>
#include <vector>

namespace pbi_scan {

// ---------------------------------------------------------------------------
// RefreshHistoryOutcome: exactly one per lookup.
//
// NotSupported (the endpoint answered not-found because the dataset's
// content type has no refresh history) and Error (anything else went wrong)
// are distinct answers and must not be conflated.
// ---------------------------------------------------------------------------
enum class RefreshHistoryOutcome {
    HasRefreshHistory,
    NoHistory,
    NotSupported,
    Error,
};

[[nodiscard]] const char* RefreshHistoryOutcomeName(RefreshHistoryOutcome outcome);

struct RefreshEntry {
    std::string request_id;
    std::string refresh_type;
    std::string status;
    std::string start_time;
    std::string end_time;
    std::optional<double> duration_minutes;   // null if a timestamp is unparsable
    std::string service_exception;            // serviceExceptionJson, if any
};

struct RefreshHistory {
    RefreshHistoryOutcome outcome = RefreshHistoryOutcome::NoHistory;
    std::vector<RefreshEntry> entries;        // newest first, as returned
    std::string error_message;                // set for Error only

    [[nodiscard]] bool HasRefreshHistory() const noexcept {
        return outcome == RefreshHistoryOutcome::HasRefreshHistory;
    }
};

// ---------------------------------------------------------------------------
// IRefreshHistorySource: per-dataset refresh history lookup.
// ---------------------------------------------------------------------------
class IRefreshHistorySource {
public:
    virtual ~IRefreshHistorySource() = default;

    [[nodiscard]] virtual RefreshHistory GetRefreshHistory(const std::string& workspace_id,
                                                           const std::string& dataset_id,
                                                           int top) = 0;
};

// ---------------------------------------------------------------------------
// RefreshHistoryClient: reads refresh history through the gateway.
//
// Endpoint: GET /v1.0/myorg/groups/{workspaceId}/datasets/{datasetId}/refreshes?$top=N
// ---------------------------------------------------------------------------
class RefreshHistoryClient : public IRefreshHistorySource {
public:
    explicit RefreshHistoryClient(AdminGateway& gateway) : gateway_(gateway) {}

    [[nodiscard]] RefreshHistory GetRefreshHistory(const std::string& workspace_id,
                                                   const std::string& dataset_id,
                                                   int top) override;

private:
    AdminGateway& gateway_;
};

/// Parse "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]" into seconds since the
/// Unix epoch (UTC). A missing zone designator is read as UTC.
[[nodiscard]] std::optional<double> ParseIsoTimestamp(const std::string& text);

/// end - start in minutes, rounded to two decimals; null if either side is
/// unparsable.
[[nodiscard]] std::optional<double> DurationMinutes(const std::string& start,
                                                    const std::string& end);

} // namespace pbi_scan
