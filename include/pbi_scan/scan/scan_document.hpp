#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace pbi_scan {

// ---------------------------------------------------------------------------
// Permissive accessors over a scan document.
//
// A scan document is loosely typed and every nested field is optional.
// These helpers never throw: an absent key, a null, or a value of the wrong
// type yields null / an empty array / the fallback.
// ---------------------------------------------------------------------------

/// node[key] if node is an object holding a non-null key, otherwise null.
[[nodiscard]] nlohmann::json Field(const nlohmann::json& node, const char* key);

/// node[key] if it is an array, otherwise a shared empty array.
[[nodiscard]] const nlohmann::json& Children(const nlohmann::json& node, const char* key);

/// node[key] as a string; numbers and booleans are stringified.
[[nodiscard]] std::string StringOr(const nlohmann::json& node, const char* key,
                                   const std::string& fallback = "");

/// The workspace id used as merge key ("" if absent).
[[nodiscard]] inline std::string WorkspaceIdOf(const nlohmann::json& workspace) {
    return StringOr(workspace, "id");
}

} // namespace pbi_scan
