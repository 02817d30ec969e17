#pragma once

#include <catalog_graph/catalog/i_catalog_reader.hpp>
#include <catalog_graph/catalog/sqlite_database.hpp>

#include <memory>
#include <string>

namespace catalog_graph {

// ---------------------------------------------------------------------------
// SqliteCatalogReader: reads the catalog relations (schema_nodes,
// schema_edges, schema_intents, ...) from a SQLite database.
//
// Issues only SELECT and PRAGMA table_info statements. Optional columns are
// detected per relation and read when present.
// ---------------------------------------------------------------------------
class SqliteCatalogReader : public ICatalogReader {
public:
    explicit SqliteCatalogReader(std::unique_ptr<SqliteDatabase> db);

    /// Open `path` read-only.
    static Result<std::unique_ptr<SqliteCatalogReader>, Error> Open(
        const std::string& path);

    Result<std::vector<TableRow>, Error> ReadTables() override;
    Result<std::vector<RelationshipRow>, Error> ReadRelationships() override;
    Result<std::vector<IntentRow>, Error> ReadIntents() override;
    Result<std::vector<PerspectiveRow>, Error> ReadPerspectives() override;
    Result<std::vector<ConceptRow>, Error> ReadConcepts() override;
    Result<std::vector<ConceptFieldRow>, Error> ReadConceptFields() override;
    Result<std::vector<IntentPerspectiveRow>, Error> ReadIntentPerspectives() override;
    Result<std::vector<PerspectiveConceptRow>, Error> ReadPerspectiveConcepts() override;
    Result<std::vector<IntentConceptRow>, Error> ReadIntentConcepts() override;

private:
    std::unique_ptr<SqliteDatabase> db_;
};

} // namespace catalog_graph
