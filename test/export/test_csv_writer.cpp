#include <catch2/catch_test_macros.hpp>

#include <pbi_scan/export/csv_writer.hpp>

#include <sstream>

using namespace pbi_scan;
using nlohmann::json;

TEST_CASE("CsvCellText: scalar rendering", "[export][csv]") {
    CHECK(CsvCellText(nullptr) == "");
    CHECK(CsvCellText("text") == "text");
    CHECK(CsvCellText(true) == "true");
    CHECK(CsvCellText(false) == "false");
    CHECK(CsvCellText(42) == "42");
    CHECK(CsvCellText(1.5) == "1.5");
}

TEST_CASE("CsvEscape: plain fields are untouched", "[export][csv]") {
    CHECK(CsvEscape("Sales") == "Sales");
    CHECK(CsvEscape("") == "");
}

TEST_CASE("CsvEscape: special characters force quoting", "[export][csv]") {
    CHECK(CsvEscape("a,b") == "\"a,b\"");
    CHECK(CsvEscape("say \"hi\"") == "\"say \"\"hi\"\"\"");
    CHECK(CsvEscape("line1\nline2") == "\"line1\nline2\"");
    CHECK(CsvEscape("cr\rhere") == "\"cr\rhere\"");
}

TEST_CASE("WriteCsv: header and CRLF records", "[export][csv]") {
    FlatTable table{"Reports", {"reportId", "reportName", "isHidden"}, {}};
    table.rows.push_back({json("r-1"), json("Revenue, by region"), json(false)});
    table.rows.push_back({json("r-2"), json(nullptr), json(true)});

    std::ostringstream out;
    WriteCsv(out, table);
    CHECK(out.str() ==
          "reportId,reportName,isHidden\r\n"
          "r-1,\"Revenue, by region\",false\r\n"
          "r-2,,true\r\n");
}

TEST_CASE("WriteCsv: empty table writes header only", "[export][csv]") {
    FlatTable table{"Lineage", {"a", "b"}, {}};
    std::ostringstream out;
    WriteCsv(out, table);
    CHECK(out.str() == "a,b\r\n");
}

TEST_CASE("TableToJson: array of objects keyed by column", "[export][csv]") {
    FlatTable table{"Columns", {"columnName", "isHidden"}, {}};
    table.rows.push_back({json("Amount"), json(nullptr)});

    auto j = TableToJson(table);
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 1);
    CHECK(j[0]["columnName"] == "Amount");
    CHECK(j[0].contains("isHidden"));
    CHECK(j[0]["isHidden"].is_null());
}
