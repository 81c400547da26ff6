#include <pbi_scan/export/flattener.hpp>

#include <pbi_scan/core/log.hpp>
#include <pbi_scan/scan/scan_document.hpp>

#include <unordered_map>

namespace pbi_scan {

namespace {

using Row = std::vector<nlohmann::json>;

FlatTable MakeTable(const char* name, std::vector<std::string> columns) {
    return FlatTable{name, std::move(columns), {}};
}

nlohmann::json Nested(const nlohmann::json& node, const char* outer, const char* inner) {
    return Field(Field(node, outer), inner);
}

nlohmann::json OptionalNumber(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

// Parent keys carried down from the enclosing workspace and dataset.
struct DatasetContext {
    nlohmann::json workspace_id;
    nlohmann::json workspace_name;
    nlohmann::json dataset_id;
    nlohmann::json dataset_name;
};

class FlattenRun {
public:
    FlattenRun(const FlattenOptions& options, IRefreshHistorySource* refresh,
               RunStatistics& stats)
        : options_(options), refresh_(refresh), stats_(stats),
          workspaces_(MakeTable(kWorkspacesFamily,
              {"workspaceId", "workspaceName", "description", "type", "state",
               "isOnDedicatedCapacity", "capacityId", "reportCount",
               "datasetCount", "dataflowCount"})),
          reports_(MakeTable(kReportsFamily,
              {"workspaceId", "workspaceName", "reportId", "reportName",
               "datasetId", "reportType", "createdDateTime", "modifiedDateTime",
               "modifiedBy", "endorsement"})),
          datasets_(MakeTable(kDatasetsFamily,
              {"workspaceId", "workspaceName", "datasetId", "datasetName",
               "configuredBy", "createdDate", "contentProviderType",
               "targetStorageMode", "isEffectiveIdentityRequired",
               "isEffectiveIdentityRolesRequired", "endorsement", "tableCount",
               "hasSchemaData", "refreshHistoryStatus", "hasRefreshHistory",
               "lastRefreshType", "lastRefreshStatus", "lastRefreshStartTime",
               "lastRefreshEndTime", "lastRefreshDurationMinutes",
               "refreshHistoryError"})),
          tables_(MakeTable(kTablesFamily,
              {"workspaceId", "workspaceName", "datasetId", "datasetName",
               "tableName", "isHidden", "storageMode", "columnCount",
               "measureCount", "sourceExpression"})),
          columns_(MakeTable(kColumnsFamily,
              {"workspaceId", "datasetId", "datasetName", "tableName",
               "columnName", "dataType", "columnType", "isHidden",
               "expression"})),
          measures_(MakeTable(kMeasuresFamily,
              {"workspaceId", "datasetId", "datasetName", "tableName",
               "measureName", "expression", "description", "isHidden"})),
          datasources_(MakeTable(kDatasourcesFamily,
              {"workspaceId", "workspaceName", "datasetId", "datasetName",
               "datasourceId", "datasourceType", "server", "database", "url",
               "path", "connectionDetails", "gatewayId"})),
          lineage_(MakeTable(kLineageFamily,
              {"workspaceId", "workspaceName", "datasetId", "datasetName",
               "upstreamType", "upstreamId", "upstreamWorkspaceId"})),
          refreshes_(MakeTable(kRefreshHistoryFamily,
              {"workspaceId", "workspaceName", "datasetId", "datasetName",
               "requestId", "refreshType", "status", "startTime", "endTime",
               "durationMinutes", "serviceExceptionJson"})) {}

    std::vector<FlatTable> Run(const nlohmann::json& merged) {
        for (const auto& instance : Children(merged, "datasourceInstances")) {
            auto id = StringOr(instance, "datasourceId");
            if (!id.empty()) {
                instances_.emplace(id, &instance);
            }
        }

        for (const auto& ws : Children(merged, "workspaces")) {
            AddWorkspace(ws);
        }

        std::vector<FlatTable> out;
        out.push_back(std::move(workspaces_));
        out.push_back(std::move(reports_));
        out.push_back(std::move(datasets_));
        out.push_back(std::move(tables_));
        out.push_back(std::move(columns_));
        out.push_back(std::move(measures_));
        out.push_back(std::move(datasources_));
        out.push_back(std::move(lineage_));
        out.push_back(std::move(refreshes_));
        return out;
    }

private:
    void AddWorkspace(const nlohmann::json& ws) {
        ++stats_.workspaces;
        const auto ws_id = Field(ws, "id");
        const auto ws_name = Field(ws, "name");
        const auto& reports = Children(ws, "reports");
        const auto& datasets = Children(ws, "datasets");

        workspaces_.rows.push_back(Row{
            ws_id, ws_name, Field(ws, "description"), Field(ws, "type"),
            Field(ws, "state"), Field(ws, "isOnDedicatedCapacity"),
            Field(ws, "capacityId"), reports.size(), datasets.size(),
            Children(ws, "dataflows").size()});

        for (const auto& report : reports) {
            reports_.rows.push_back(Row{
                ws_id, ws_name, Field(report, "id"), Field(report, "name"),
                Field(report, "datasetId"), Field(report, "reportType"),
                Field(report, "createdDateTime"), Field(report, "modifiedDateTime"),
                Field(report, "modifiedBy"),
                Nested(report, "endorsementDetails", "endorsement")});
        }

        for (const auto& ds : datasets) {
            AddDataset(ws, DatasetContext{ws_id, ws_name, Field(ds, "id"), Field(ds, "name")},
                       ds);
        }
    }

    void AddDataset(const nlohmann::json& ws, const DatasetContext& ctx,
                    const nlohmann::json& ds) {
        ++stats_.datasets;
        const auto& tables = Children(ds, "tables");
        if (!tables.empty()) {
            ++stats_.datasets_with_schema;
        }

        Row row{
            ctx.workspace_id, ctx.workspace_name, ctx.dataset_id, ctx.dataset_name,
            Field(ds, "configuredBy"), Field(ds, "createdDate"),
            Field(ds, "contentProviderType"), Field(ds, "targetStorageMode"),
            Field(ds, "isEffectiveIdentityRequired"),
            Field(ds, "isEffectiveIdentityRolesRequired"),
            Nested(ds, "endorsementDetails", "endorsement"),
            tables.size(), !tables.empty()};
        AppendRefreshColumns(ws, ctx, row);
        datasets_.rows.push_back(std::move(row));

        for (const auto& table : tables) {
            AddTable(ctx, table);
        }
        AddDatasources(ctx, ds);
        AddLineage(ctx, ds);
    }

    void AddTable(const DatasetContext& ctx, const nlohmann::json& table) {
        ++stats_.tables;
        const auto table_name = Field(table, "name");
        const auto& columns = Children(table, "columns");
        const auto& measures = Children(table, "measures");
        const auto& sources = Children(table, "source");

        tables_.rows.push_back(Row{
            ctx.workspace_id, ctx.workspace_name, ctx.dataset_id, ctx.dataset_name,
            table_name, Field(table, "isHidden"), Field(table, "storageMode"),
            columns.size(), measures.size(),
            sources.empty() ? nlohmann::json(nullptr) : Field(sources[0], "expression")});

        for (const auto& column : columns) {
            ++stats_.columns;
            columns_.rows.push_back(Row{
                ctx.workspace_id, ctx.dataset_id, ctx.dataset_name, table_name,
                Field(column, "name"), Field(column, "dataType"),
                Field(column, "columnType"), Field(column, "isHidden"),
                Field(column, "expression")});
        }
        for (const auto& measure : measures) {
            ++stats_.measures;
            measures_.rows.push_back(Row{
                ctx.workspace_id, ctx.dataset_id, ctx.dataset_name, table_name,
                Field(measure, "name"), Field(measure, "expression"),
                Field(measure, "description"), Field(measure, "isHidden")});
        }
    }

    void AddDatasourceRow(const DatasetContext& ctx, const nlohmann::json& source,
                          const nlohmann::json& fallback_id) {
        const auto details = Field(source, "connectionDetails");
        auto id = Field(source, "datasourceId");
        if (id.is_null()) {
            id = fallback_id;
        }
        datasources_.rows.push_back(Row{
            ctx.workspace_id, ctx.workspace_name, ctx.dataset_id, ctx.dataset_name,
            id, Field(source, "datasourceType"), Field(details, "server"),
            Field(details, "database"), Field(details, "url"), Field(details, "path"),
            details.is_null() ? nlohmann::json(nullptr) : nlohmann::json(details.dump()),
            Field(source, "gatewayId")});
    }

    void AddDatasources(const DatasetContext& ctx, const nlohmann::json& ds) {
        // Current scan results reference top-level datasourceInstances by id.
        for (const auto& usage : Children(ds, "datasourceUsages")) {
            const auto instance_id = Field(usage, "datasourceInstanceId");
            auto it = instance_id.is_string()
                          ? instances_.find(instance_id.get<std::string>())
                          : instances_.end();
            if (it != instances_.end()) {
                AddDatasourceRow(ctx, *it->second, instance_id);
            } else {
                AddDatasourceRow(ctx, nlohmann::json::object(), instance_id);
            }
        }
        // Older results inline the datasources on the dataset.
        for (const auto& source : Children(ds, "datasources")) {
            AddDatasourceRow(ctx, source, nullptr);
        }
    }

    void AddLineage(const DatasetContext& ctx, const nlohmann::json& ds) {
        for (const auto& up : Children(ds, "upstreamDatasets")) {
            lineage_.rows.push_back(Row{
                ctx.workspace_id, ctx.workspace_name, ctx.dataset_id, ctx.dataset_name,
                "Dataset", Field(up, "targetDatasetId"), Field(up, "groupId")});
        }
        for (const auto& up : Children(ds, "upstreamDataflows")) {
            lineage_.rows.push_back(Row{
                ctx.workspace_id, ctx.workspace_name, ctx.dataset_id, ctx.dataset_name,
                "Dataflow", Field(up, "targetDataflowId"), Field(up, "groupId")});
        }
    }

    void AppendRefreshColumns(const nlohmann::json& ws, const DatasetContext& ctx,
                              Row& row) {
        const auto ws_id = WorkspaceIdOf(ws);
        const auto ds_id = ctx.dataset_id.is_string() ? ctx.dataset_id.get<std::string>()
                                                      : std::string();
        if (!options_.refresh_history || refresh_ == nullptr || ws_id.empty() ||
            ds_id.empty()) {
            for (int i = 0; i < 8; ++i) {
                row.emplace_back(nullptr);
            }
            return;
        }

        auto summary = refresh_->GetRefreshHistory(ws_id, ds_id, options_.refresh_summary_top);
        row.emplace_back(RefreshHistoryOutcomeName(summary.outcome));
        row.emplace_back(summary.HasRefreshHistory());
        if (summary.HasRefreshHistory()) {
            ++stats_.refresh_history_hits;
            const auto& last = summary.entries.front();
            row.emplace_back(last.refresh_type);
            row.emplace_back(last.status);
            row.emplace_back(last.start_time);
            row.emplace_back(last.end_time);
            row.emplace_back(OptionalNumber(last.duration_minutes));
        } else {
            for (int i = 0; i < 5; ++i) {
                row.emplace_back(nullptr);
            }
        }
        if (summary.outcome == RefreshHistoryOutcome::Error) {
            row.emplace_back(summary.error_message);
            stats_.AddError("Refresh history for dataset " + ds_id + " in workspace " +
                            ws_id + ": " + summary.error_message);
        } else {
            row.emplace_back(nullptr);
        }

        // The detailed lookup only runs when the summary found something.
        if (!summary.HasRefreshHistory()) {
            return;
        }
        auto detail = refresh_->GetRefreshHistory(ws_id, ds_id, options_.refresh_detail_top);
        if (detail.outcome == RefreshHistoryOutcome::Error) {
            stats_.AddError("Refresh history detail for dataset " + ds_id +
                            " in workspace " + ws_id + ": " + detail.error_message);
            return;
        }
        for (const auto& entry : detail.entries) {
            refreshes_.rows.push_back(Row{
                ctx.workspace_id, ctx.workspace_name, ctx.dataset_id, ctx.dataset_name,
                entry.request_id, entry.refresh_type, entry.status, entry.start_time,
                entry.end_time, OptionalNumber(entry.duration_minutes),
                entry.service_exception.empty() ? nlohmann::json(nullptr)
                                                : nlohmann::json(entry.service_exception)});
        }
    }

    const FlattenOptions& options_;
    IRefreshHistorySource* refresh_;
    RunStatistics& stats_;
    std::unordered_map<std::string, const nlohmann::json*> instances_;

    FlatTable workspaces_;
    FlatTable reports_;
    FlatTable datasets_;
    FlatTable tables_;
    FlatTable columns_;
    FlatTable measures_;
    FlatTable datasources_;
    FlatTable lineage_;
    FlatTable refreshes_;
};

} // anonymous namespace

size_t FlatTable::ColumnIndex(const std::string& column) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i] == column) {
            return i;
        }
    }
    return columns.size();
}

Flattener::Flattener(FlattenOptions options, IRefreshHistorySource* refresh_source)
    : options_(options), refresh_source_(refresh_source) {}

std::vector<FlatTable> Flattener::Flatten(const nlohmann::json& merged,
                                          RunStatistics& stats) {
    auto tables = FlattenRun(options_, refresh_source_, stats).Run(merged);
    for (const auto& table : tables) {
        LogDebug("export", table.name + ": " + std::to_string(table.rows.size()) +
                               " record(s)");
    }
    return tables;
}

} // namespace pbi_scan
