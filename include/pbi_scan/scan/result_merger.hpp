#pragma once

#include <pbi_scan/core/result.hpp>
#include <pbi_scan/scan/run_statistics.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

namespace pbi_scan {

// ---------------------------------------------------------------------------
// ResultMerger: concatenate per-batch scan documents into one.
//
// Workspaces are deduplicated by id: the first occurrence wins and later
// ones are dropped whole, never merged field by field. Workspaces without
// an id are always kept. Top-level datasourceInstances are deduplicated the
// same way by datasourceId so that dataset datasourceUsages still resolve.
//
// Output order is input order, so the result is deterministic.
// ---------------------------------------------------------------------------
class ResultMerger {
public:
    using DocumentVisitor = std::function<void(const nlohmann::json& document)>;

    /// Parse and add one raw scan document. `visit`, when set, sees the
    /// parsed document before it is merged. Invalid JSON is an Err and leaves
    /// the merger unchanged.
    [[nodiscard]] Result<void, Error> AddRaw(const std::string& text,
                                             const DocumentVisitor& visit = nullptr);

    void Add(const nlohmann::json& document);

    /// {"workspaces": [...], "datasourceInstances": [...]}
    [[nodiscard]] nlohmann::json Build() const;

    [[nodiscard]] size_t WorkspaceCount() const noexcept { return workspaces_.size(); }
    [[nodiscard]] size_t DuplicatesDropped() const noexcept { return duplicates_dropped_; }

private:
    std::vector<nlohmann::json> workspaces_;
    std::vector<nlohmann::json> datasource_instances_;
    std::unordered_set<std::string> seen_workspaces_;
    std::unordered_set<std::string> seen_datasources_;
    size_t duplicates_dropped_ = 0;
};

// ---------------------------------------------------------------------------
// MergeScanResults: merge raw documents in order. A document that fails to
// parse is recorded in stats.errors and skipped. `on_document` receives the
// index and parsed form of every document that is merged.
// ---------------------------------------------------------------------------
using IndexedDocumentVisitor =
    std::function<void(size_t index, const nlohmann::json& document)>;

[[nodiscard]] nlohmann::json MergeScanResults(
    const std::vector<std::string>& raw_documents, RunStatistics& stats,
    const IndexedDocumentVisitor& on_document = nullptr);

} // namespace pbi_scan
