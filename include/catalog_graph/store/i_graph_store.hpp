#pragma once

#include <catalog_graph/core/result.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace catalog_graph {

// ---------------------------------------------------------------------------
// GraphDefinition: a named graph over one node and one edge collection.
// ---------------------------------------------------------------------------
struct GraphDefinition {
    std::string name;
    std::string node_collection;
    std::string edge_collection;

    bool operator==(const GraphDefinition& o) const {
        return name == o.name && node_collection == o.node_collection &&
               edge_collection == o.edge_collection;
    }
    bool operator!=(const GraphDefinition& o) const { return !(*this == o); }
};

enum class CollectionType {
    Document,
    Edge,
};

// ---------------------------------------------------------------------------
// IGraphStore: the primitives graph persistence is built from.
//
// Each call is a single store request (or a cursor walk for reads) and
// returns an Err on transport failure or a store-side error response.
// ---------------------------------------------------------------------------
class IGraphStore {
public:
    virtual ~IGraphStore() = default;

    IGraphStore(const IGraphStore&) = delete;
    IGraphStore& operator=(const IGraphStore&) = delete;
    IGraphStore(IGraphStore&&) = delete;
    IGraphStore& operator=(IGraphStore&&) = delete;

    /// nullopt when no graph of that name exists.
    [[nodiscard]] virtual Result<std::optional<GraphDefinition>, Error> GetGraph(
        const std::string& name) = 0;

    [[nodiscard]] virtual Result<std::vector<std::string>, Error> ListCollections() = 0;

    [[nodiscard]] virtual Result<void, Error> CreateCollection(
        const std::string& name, CollectionType type) = 0;

    /// Dropping a collection that does not exist succeeds.
    [[nodiscard]] virtual Result<void, Error> DropCollection(const std::string& name) = 0;

    [[nodiscard]] virtual Result<void, Error> InsertDocuments(
        const std::string& collection, const std::vector<nlohmann::json>& documents) = 0;

    [[nodiscard]] virtual Result<void, Error> CreateGraph(
        const GraphDefinition& definition) = 0;

    /// Removes the definition only; its collections are left in place.
    [[nodiscard]] virtual Result<void, Error> DeleteGraph(const std::string& name) = 0;

    /// Every document of `collection`, fetched `batch_size` at a time,
    /// ordered by `_key`.
    [[nodiscard]] virtual Result<std::vector<nlohmann::json>, Error> ReadCollection(
        const std::string& collection, size_t batch_size) = 0;

protected:
    IGraphStore() = default;
};

} // namespace catalog_graph
