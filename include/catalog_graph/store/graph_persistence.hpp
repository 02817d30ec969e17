#pragma once

#include <catalog_graph/core/deadline.hpp>
#include <catalog_graph/core/result.hpp>
#include <catalog_graph/graph/graph_model.hpp>
#include <catalog_graph/store/i_graph_store.hpp>

#include <string>

namespace catalog_graph {

struct PersistOptions {
    std::string store_name;
    size_t batch_size = 1000;
    bool overwrite = false;
    Deadline deadline;
};

struct PersistReport {
    GraphDefinition definition;
    int generation = 0;
    size_t nodes_written = 0;
    size_t edges_written = 0;
    size_t batches = 0;
    bool replaced_existing = false;
};

struct LoadOptions {
    std::string store_name;
    bool directed = true;
    size_t batch_size = 1000;
    Deadline deadline;
};

// Collection names of one write generation.
[[nodiscard]] std::string NodeCollectionName(const std::string& graph_name, int generation);
[[nodiscard]] std::string EdgeCollectionName(const std::string& graph_name, int generation);

/// Generation encoded in a collection name of `graph_name`; nullopt when
/// the name does not follow the generation scheme.
[[nodiscard]] std::optional<int> CollectionGeneration(const std::string& graph_name,
                                                      const std::string& collection);

// ---------------------------------------------------------------------------
// PersistGraph: write `graph` under `options.store_name`.
//
// Nodes then edges are inserted in batches into fresh generation
// collections. The graph definition is switched to them only after the last
// batch; the previous generation is dropped afterwards. On a batch failure
// (PartialWrite, with the 0-based batch index counted across nodes and
// edges) or cancellation (Cancelled) the new collections are dropped and the
// stored graph is left as it was. A failed definition switch restores the
// previous definition.
//
// Callers serialize overwrites of one store name.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<PersistReport, Error> PersistGraph(IGraphStore& store,
                                                        const Graph& graph,
                                                        const PersistOptions& options);

/// Rebuild a graph written by PersistGraph. GraphNotFound when absent.
[[nodiscard]] Result<Graph, Error> LoadGraph(IGraphStore& store, const LoadOptions& options);

} // namespace catalog_graph
