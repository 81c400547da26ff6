#pragma once

#include <string>
#include <utility>
#include <vector>

namespace pbi_scan {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(const std::string& value);

// Append "?k=v&k2=v2" to a path. Keys are emitted verbatim (the admin API
// uses OData names like "$top"); values are percent-encoded. Pairs keep
// their order. An empty list returns the path unchanged.
std::string WithQuery(const std::string& path,
                      const std::vector<std::pair<std::string, std::string>>& query);

} // namespace pbi_scan
