#include <pbi_scan/export/csv_writer.hpp>

namespace pbi_scan {

std::string CsvCellText(const nlohmann::json& cell) {
    if (cell.is_null()) {
        return "";
    }
    if (cell.is_string()) {
        return cell.get<std::string>();
    }
    if (cell.is_boolean()) {
        return cell.get<bool>() ? "true" : "false";
    }
    return cell.dump();
}

std::string CsvEscape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string out;
    out.reserve(field.size() + 2);
    out += '"';
    for (char c : field) {
        if (c == '"') {
            out += '"';
        }
        out += c;
    }
    out += '"';
    return out;
}

void WriteCsv(std::ostream& out, const FlatTable& table) {
    for (size_t i = 0; i < table.columns.size(); ++i) {
        if (i > 0) out << ',';
        out << CsvEscape(table.columns[i]);
    }
    out << "\r\n";

    for (const auto& row : table.rows) {
        for (size_t i = 0; i < table.columns.size(); ++i) {
            if (i > 0) out << ',';
            if (i < row.size()) {
                out << CsvEscape(CsvCellText(row[i]));
            }
        }
        out << "\r\n";
    }
}

nlohmann::json TableToJson(const FlatTable& table) {
    auto records = nlohmann::json::array();
    for (const auto& row : table.rows) {
        nlohmann::json record = nlohmann::json::object();
        for (size_t i = 0; i < table.columns.size(); ++i) {
            record[table.columns[i]] = i < row.size() ? row[i] : nlohmann::json(nullptr);
        }
        records.push_back(std::move(record));
    }
    return records;
}

} // namespace pbi_scan
