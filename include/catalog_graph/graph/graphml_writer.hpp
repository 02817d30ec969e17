#pragma once

#include <catalog_graph/core/result.hpp>
#include <catalog_graph/graph/graph_model.hpp>

#include <string>

namespace catalog_graph {

/// Serialize a graph as GraphML. Nodes and edges appear in sorted order.
/// Every attribute gets a typed <key> declaration; open `extra` entries are
/// declared as string keys named "extra.<name>".
[[nodiscard]] std::string WriteGraphMl(const Graph& graph);

/// WriteGraphMl to a file.
Result<void, Error> WriteGraphMlFile(const Graph& graph, const std::string& path);

} // namespace catalog_graph
