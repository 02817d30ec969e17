#pragma once

#include <optional>
#include <string>

namespace catalog_graph {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(const std::string& value);

// Inverse of UrlEncode. nullopt on a malformed escape.
std::optional<std::string> UrlDecode(const std::string& value);

} // namespace catalog_graph
