#include <catalog_graph/graph/graph_stats.hpp>

namespace catalog_graph {

GraphStats ComputeStats(const Graph& graph) {
    GraphStats stats;
    stats.node_count = graph.NodeCount();
    stats.edge_count = graph.EdgeCount();
    stats.directed = graph.IsDirected();

    for (const auto& [id, node] : graph.Nodes()) {
        ++stats.nodes_by_kind[NodeKindName(node.Kind())];
    }
    for (const Edge* edge : graph.Edges()) {
        ++stats.edges_by_label[edge->Label()];
        if (auto* join = std::get_if<JoinEdge>(&edge->data)) {
            const auto& rel = join->relationship_kind.empty()
                                  ? std::string("unspecified")
                                  : join->relationship_kind;
            ++stats.joins_by_relationship[rel];
        }
    }
    return stats;
}

} // namespace catalog_graph
