#pragma once

#include <catalog_graph/graph/graph_model.hpp>

#include <map>
#include <string>

namespace catalog_graph {

struct GraphStats {
    size_t node_count = 0;
    size_t edge_count = 0;
    bool directed = true;
    std::map<std::string, size_t> nodes_by_kind;          // "table" -> 12
    std::map<std::string, size_t> edges_by_label;         // "CAN_MEAN" -> 4, "ELEVATES" -> 2
    std::map<std::string, size_t> joins_by_relationship;  // "foreign_key" -> 9
};

[[nodiscard]] GraphStats ComputeStats(const Graph& graph);

} // namespace catalog_graph
