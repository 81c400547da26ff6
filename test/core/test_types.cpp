#include <catch2/catch_test_macros.hpp>

#include <pbi_scan/core/types.hpp>

#include <string>

using namespace pbi_scan;

// ===========================================================================
// ScanId
// ===========================================================================

TEST_CASE("ScanId: accepts GUID-shaped ids", "[types][ScanId]") {
    auto r = ScanId::Create("e7d03602-4873-4760-b37e-1563ef5358e3");
    REQUIRE(r.IsOk());
    CHECK(r.Value().Value() == "e7d03602-4873-4760-b37e-1563ef5358e3");
}

TEST_CASE("ScanId: rejects invalid ids", "[types][ScanId]") {
    SECTION("empty") {
        CHECK(ScanId::Create("").IsErr());
    }
    SECTION("too long") {
        CHECK(ScanId::Create(std::string(65, 'a')).IsErr());
    }
    SECTION("path characters") {
        CHECK(ScanId::Create("../scanResult").IsErr());
        CHECK(ScanId::Create("a/b").IsErr());
    }
    SECTION("whitespace") {
        CHECK(ScanId::Create("abc def").IsErr());
    }
}

TEST_CASE("ScanId: equality", "[types][ScanId]") {
    auto a = ScanId::Create("abc").Value();
    auto b = ScanId::Create("abc").Value();
    auto c = ScanId::Create("abd").Value();
    CHECK(a == b);
    CHECK(a != c);
}

// ===========================================================================
// IsGuid
// ===========================================================================

TEST_CASE("IsGuid", "[types]") {
    CHECK(IsGuid("e7d03602-4873-4760-b37e-1563ef5358e3"));
    CHECK(IsGuid("E7D03602-4873-4760-B37E-1563EF5358E3"));
    CHECK_FALSE(IsGuid("e7d0360248734760b37e1563ef5358e3"));
    CHECK_FALSE(IsGuid("e7d03602-4873-4760-b37e-1563ef5358eg"));
    CHECK_FALSE(IsGuid(""));
}
