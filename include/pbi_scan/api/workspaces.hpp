#pragma once

#include <pbi_scan/api/admin_gateway.hpp>
#include <pbi_scan/core/result.hpp>

#include <optional>
#include <string>
#include <vector>

namespace pbi_scan {

// ---------------------------------------------------------------------------
// WorkspaceRef: one workspace as listed by the admin API. Immutable once
// enumerated; only `id` is used as a selection key downstream.
// ---------------------------------------------------------------------------
struct WorkspaceRef {
    std::string id;
    std::string name;
    std::string state;           // "Active", "Deleted", "Removing", ...
    std::string type;            // "Workspace", "PersonalGroup", ...
    std::optional<std::string> capacity_id;
    bool is_on_dedicated_capacity = false;
};

constexpr int kDefaultWorkspacePageSize = 5000;

// ---------------------------------------------------------------------------
// ListAllWorkspaces: page through every workspace visible to the admin.
//
// Endpoint: GET /v1.0/myorg/admin/groups?$top={page_size}&$skip={offset}
//
// Requests the next page while the previous one came back full
// (exactly page_size entries); stops on a short or empty page. An empty
// tenant view is a valid, empty result.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::vector<WorkspaceRef>, Error> ListAllWorkspaces(
    AdminGateway& gateway,
    int page_size = kDefaultWorkspacePageSize);

} // namespace pbi_scan
