#pragma once

#include <catalog_graph/store/i_graph_store.hpp>
#include <catalog_graph/store/i_store_session.hpp>

#include <memory>

namespace catalog_graph {

// ---------------------------------------------------------------------------
// ArangoGraphStore: IGraphStore over ArangoDB's HTTP API.
//
//   GET    /_api/gharial/{graph}                  graph definition
//   POST   /_api/gharial                          create definition
//   DELETE /_api/gharial/{graph}?dropCollections=false
//   GET    /_api/collection?excludeSystem=true
//   POST   /_api/collection                       type 2 document, 3 edge
//   DELETE /_api/collection/{name}
//   POST   /_api/document/{collection}            batch insert
//   POST   /_api/cursor, PUT /_api/cursor/{id}    batched reads
//
// The reference constructor borrows the session; the unique_ptr one owns it.
// ---------------------------------------------------------------------------
class ArangoGraphStore : public IGraphStore {
public:
    explicit ArangoGraphStore(IStoreSession& session);
    explicit ArangoGraphStore(std::unique_ptr<IStoreSession> session);

    [[nodiscard]] Result<std::optional<GraphDefinition>, Error> GetGraph(
        const std::string& name) override;
    [[nodiscard]] Result<std::vector<std::string>, Error> ListCollections() override;
    [[nodiscard]] Result<void, Error> CreateCollection(
        const std::string& name, CollectionType type) override;
    [[nodiscard]] Result<void, Error> DropCollection(const std::string& name) override;
    [[nodiscard]] Result<void, Error> InsertDocuments(
        const std::string& collection,
        const std::vector<nlohmann::json>& documents) override;
    [[nodiscard]] Result<void, Error> CreateGraph(
        const GraphDefinition& definition) override;
    [[nodiscard]] Result<void, Error> DeleteGraph(const std::string& name) override;
    [[nodiscard]] Result<std::vector<nlohmann::json>, Error> ReadCollection(
        const std::string& collection, size_t batch_size) override;

private:
    std::unique_ptr<IStoreSession> owned_;
    IStoreSession& session_;
};

} // namespace catalog_graph
