#pragma once

#include <catalog_graph/core/result.hpp>
#include <catalog_graph/graph/graph_model.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace catalog_graph {

// ---------------------------------------------------------------------------
// Document codec: graph elements as graph store documents.
//
// Node:  {_key, label, kind, <typed attributes>, extra}
// Edge:  {_key, _from, _to, kind, label, <typed attributes>, extra}
//
// `_key` is the percent-encoded node id, so ids with ':' or '.' stay legal
// store keys; `label` keeps the id verbatim. Edge keys are "e<index>".
// ---------------------------------------------------------------------------

[[nodiscard]] std::string DocumentKey(const std::string& node_id);

/// Inverse of DocumentKey; nullopt on a malformed key.
[[nodiscard]] std::optional<std::string> NodeIdFromKey(const std::string& key);

[[nodiscard]] nlohmann::json NodeToDocument(const Node& node);

[[nodiscard]] nlohmann::json EdgeToDocument(const Edge& edge, size_t index,
                                            const std::string& node_collection);

[[nodiscard]] Result<Node, Error> NodeFromDocument(const nlohmann::json& document);

[[nodiscard]] Result<Edge, Error> EdgeFromDocument(const nlohmann::json& document);

} // namespace catalog_graph
