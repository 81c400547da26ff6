#pragma once

#include <pbi_scan/export/flattener.hpp>

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>

namespace pbi_scan {

/// Text of one cell: null is empty, strings are verbatim, booleans are
/// "true"/"false", numbers and nested values are their JSON text.
[[nodiscard]] std::string CsvCellText(const nlohmann::json& cell);

/// RFC 4180 field quoting: a field containing a comma, double quote, CR or
/// LF is wrapped in double quotes with embedded quotes doubled.
[[nodiscard]] std::string CsvEscape(const std::string& field);

/// Header row, then one CRLF-terminated record per row.
void WriteCsv(std::ostream& out, const FlatTable& table);

/// The table as a JSON array of objects keyed by column name.
[[nodiscard]] nlohmann::json TableToJson(const FlatTable& table);

} // namespace pbi_scan
