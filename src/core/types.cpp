#include <pbi_scan/core/types.hpp>

#include <algorithm>
#include <cctype>

namespace pbi_scan {

namespace {

bool IsIdChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ScanId
// ---------------------------------------------------------------------------
Result<ScanId, std::string> ScanId::Create(std::string_view id) {
    if (id.empty()) {
        return Result<ScanId, std::string>::Err("Scan id must not be empty");
    }
    if (id.size() > 64) {
        return Result<ScanId, std::string>::Err(
            "Scan id must be at most 64 characters, got " +
            std::to_string(id.size()));
    }
    if (!std::all_of(id.begin(), id.end(), IsIdChar)) {
        return Result<ScanId, std::string>::Err(
            "Scan id must contain only letters, digits and '-'");
    }
    return Result<ScanId, std::string>::Ok(ScanId(std::string(id)));
}

// ---------------------------------------------------------------------------
// IsGuid
// ---------------------------------------------------------------------------
bool IsGuid(std::string_view value) {
    if (value.size() != 36) {
        return false;
    }
    for (size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (std::isxdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

} // namespace pbi_scan
