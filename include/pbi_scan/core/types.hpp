#pragma once

#include <pbi_scan/core/result.hpp>

#include <string>
#include <string_view>

namespace pbi_scan {

// ---------------------------------------------------------------------------
// ScanId: opaque scan job identifier returned by the submit endpoint.
//
// Rules:
//   - Non-empty, max 64 characters
//   - ASCII letters, digits and '-' only (it is spliced into URL paths)
// ---------------------------------------------------------------------------
class ScanId {
public:
    static Result<ScanId, std::string> Create(std::string_view id);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ScanId& other) const { return value_ == other.value_; }
    bool operator!=(const ScanId& other) const { return value_ != other.value_; }

    ScanId(const ScanId&) = default;
    ScanId& operator=(const ScanId&) = default;
    ScanId(ScanId&&) noexcept = default;
    ScanId& operator=(ScanId&&) noexcept = default;

private:
    explicit ScanId(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// True for the 8-4-4-4-12 hex layout used for workspace and dataset ids.
[[nodiscard]] bool IsGuid(std::string_view value);

} // namespace pbi_scan
