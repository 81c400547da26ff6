#include <pbi_scan/scan/result_merger.hpp>

#include <pbi_scan/core/log.hpp>
#include <pbi_scan/scan/scan_document.hpp>

namespace pbi_scan {

Result<void, Error> ResultMerger::AddRaw(const std::string& text,
                                         const DocumentVisitor& visit) {
    auto doc = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return Result<void, Error>::Err(Error{
            "MergeScanResult", "", std::nullopt,
            "Scan result is not valid JSON (" + std::to_string(text.size()) + " bytes)",
            std::nullopt, ErrorCategory::Internal});
    }
    if (visit) {
        visit(doc);
    }
    Add(doc);
    return Result<void, Error>::Ok();
}

void ResultMerger::Add(const nlohmann::json& document) {
    for (const auto& ws : Children(document, "workspaces")) {
        auto id = WorkspaceIdOf(ws);
        if (!id.empty() && !seen_workspaces_.insert(id).second) {
            ++duplicates_dropped_;
            LogDebug("merge", "Dropping duplicate workspace " + id);
            continue;
        }
        workspaces_.push_back(ws);
    }

    for (const auto& instance : Children(document, "datasourceInstances")) {
        auto id = StringOr(instance, "datasourceId");
        if (!id.empty() && !seen_datasources_.insert(id).second) {
            continue;
        }
        datasource_instances_.push_back(instance);
    }
}

nlohmann::json ResultMerger::Build() const {
    nlohmann::json merged = nlohmann::json::object();
    merged["workspaces"] = workspaces_;
    merged["datasourceInstances"] = datasource_instances_;
    return merged;
}

nlohmann::json MergeScanResults(const std::vector<std::string>& raw_documents,
                                RunStatistics& stats,
                                const IndexedDocumentVisitor& on_document) {
    ResultMerger merger;
    for (size_t i = 0; i < raw_documents.size(); ++i) {
        ResultMerger::DocumentVisitor visit;
        if (on_document) {
            visit = [&on_document, i](const nlohmann::json& doc) { on_document(i, doc); };
        }
        auto added = merger.AddRaw(raw_documents[i], visit);
        if (added.IsErr()) {
            auto message = "Scan result " + std::to_string(i + 1) +
                           " skipped: " + added.Error().message;
            LogError("merge", message);
            stats.AddError(std::move(message));
        }
    }
    if (merger.DuplicatesDropped() > 0) {
        LogInfo("merge", "Dropped " + std::to_string(merger.DuplicatesDropped()) +
                             " duplicate workspace(s)");
    }
    return merger.Build();
}

} // namespace pbi_scan
