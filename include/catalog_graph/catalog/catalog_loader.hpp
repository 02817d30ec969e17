#pragma once

#include <catalog_graph/catalog/i_catalog_reader.hpp>
#include <catalog_graph/core/deadline.hpp>
#include <catalog_graph/core/result.hpp>
#include <catalog_graph/graph/graph_model.hpp>

namespace catalog_graph {

// ---------------------------------------------------------------------------
// Catalog loader: builds graphs from catalog relations.
//
// Nodes load before edges and every relation is consumed in primary-key
// order, so identical catalogs give identical graphs. Any dangling reference
// or graph invariant violation fails the whole build with a CatalogIntegrity
// error naming the relation and row keys; no partial graph is returned.
// ---------------------------------------------------------------------------

struct CatalogGraphs {
    Graph schema;
    Graph semantic;
};

/// Tables and their join relationships (schema_nodes, schema_edges).
Result<Graph, Error> BuildSchemaGraph(ICatalogReader& reader,
                                      const Deadline& deadline = {});

/// Intents, perspectives, concepts, fields and the edges between them.
Result<Graph, Error> BuildSemanticGraph(ICatalogReader& reader,
                                        const Deadline& deadline = {});

/// Both graphs from one reader.
Result<CatalogGraphs, Error> LoadCatalog(ICatalogReader& reader,
                                         const Deadline& deadline = {});

} // namespace catalog_graph
