#include <pbi_scan/api/workspaces.hpp>

#include <pbi_scan/core/log.hpp>
#include <pbi_scan/core/url.hpp>

namespace pbi_scan {

namespace {

const char* kAdminGroupsPath = "/v1.0/myorg/admin/groups";

std::string StringField(const nlohmann::json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

WorkspaceRef ParseWorkspace(const nlohmann::json& node) {
    WorkspaceRef ws;
    ws.id = StringField(node, "id");
    ws.name = StringField(node, "name");
    ws.state = StringField(node, "state");
    ws.type = StringField(node, "type");
    auto cap = node.find("capacityId");
    if (cap != node.end() && cap->is_string()) {
        ws.capacity_id = cap->get<std::string>();
    }
    auto dedicated = node.find("isOnDedicatedCapacity");
    if (dedicated != node.end() && dedicated->is_boolean()) {
        ws.is_on_dedicated_capacity = dedicated->get<bool>();
    }
    return ws;
}

} // anonymous namespace

Result<std::vector<WorkspaceRef>, Error> ListAllWorkspaces(AdminGateway& gateway,
                                                           int page_size) {
    if (page_size <= 0) {
        return Result<std::vector<WorkspaceRef>, Error>::Err(Error{
            "ListAllWorkspaces", kAdminGroupsPath, std::nullopt,
            "Page size must be positive, got " + std::to_string(page_size),
            std::nullopt, ErrorCategory::Config});
    }

    std::vector<WorkspaceRef> all;
    int skip = 0;
    while (true) {
        auto path = WithQuery(kAdminGroupsPath, {
            {"$top", std::to_string(page_size)},
            {"$skip", std::to_string(skip)},
        });
        auto page = gateway.GetJson(path);
        if (page.IsErr()) {
            return Result<std::vector<WorkspaceRef>, Error>::Err(std::move(page).Error());
        }

        size_t count = 0;
        auto value = page.Value().find("value");
        if (value != page.Value().end() && value->is_array()) {
            for (const auto& node : *value) {
                if (node.is_object()) {
                    all.push_back(ParseWorkspace(node));
                }
            }
            count = value->size();
        }
        LogDebug("workspaces", "Page at $skip=" + std::to_string(skip) + " returned " +
                                   std::to_string(count) + " workspace(s)");

        if (count != static_cast<size_t>(page_size)) {
            break;
        }
        skip += page_size;
    }

    LogInfo("workspaces", "Enumerated " + std::to_string(all.size()) + " workspace(s)");
    return Result<std::vector<WorkspaceRef>, Error>::Ok(std::move(all));
}

} // namespace pbi_scan
