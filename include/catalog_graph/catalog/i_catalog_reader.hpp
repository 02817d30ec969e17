#pragma once

#include <catalog_graph/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace catalog_graph {

// ---------------------------------------------------------------------------
// Catalog rows. One struct per catalog relation; optional members mirror
// optional catalog columns (absent column or NULL value).
// ---------------------------------------------------------------------------

struct TableRow {
    std::string table_name;
    std::string table_type;
    std::string description;
};

struct RelationshipRow {
    int64_t edge_id = 0;
    std::string from_table;
    std::string to_table;
    std::string relationship_type;
    std::string join_column;
    double weight = 1.0;
    std::optional<std::string> join_column_description;
    std::optional<std::string> natural_language_alias;
    std::optional<std::string> example_query;
    std::optional<std::string> context;
};

struct IntentRow {
    int64_t intent_id = 0;
    std::string intent_name;
    std::string description;
};

struct PerspectiveRow {
    int64_t perspective_id = 0;
    std::string perspective_name;
    std::string description;
};

struct ConceptRow {
    int64_t concept_id = 0;
    std::string concept_name;
    std::string description;
    std::optional<std::string> concept_type;
    std::optional<std::string> domain;
};

struct ConceptFieldRow {
    int64_t id = 0;
    int64_t concept_id = 0;
    std::string table_name;
    std::string field_name;
    bool is_primary_meaning = false;
    std::string table_alias;
    std::optional<std::string> context_hint;
};

struct IntentPerspectiveRow {
    int64_t intent_id = 0;
    int64_t perspective_id = 0;
    double intent_factor_weight = 1.0;
};

struct PerspectiveConceptRow {
    int64_t perspective_id = 0;
    int64_t concept_id = 0;
    std::optional<double> elevation_weight;
    std::optional<std::string> relationship_type;
    std::optional<std::string> collision_resolution;
};

struct IntentConceptRow {
    int64_t intent_id = 0;
    int64_t concept_id = 0;
    double intent_factor_weight = 0.0;
    std::optional<std::string> explanation;
};

// ---------------------------------------------------------------------------
// ICatalogReader: read-only access to the catalog relations.
//
// Every method returns its relation ordered by primary key. A missing
// relation is a CatalogIntegrity error; an unreachable catalog is
// CatalogUnavailable.
// ---------------------------------------------------------------------------
class ICatalogReader {
public:
    virtual ~ICatalogReader() = default;

    virtual Result<std::vector<TableRow>, Error> ReadTables() = 0;
    virtual Result<std::vector<RelationshipRow>, Error> ReadRelationships() = 0;
    virtual Result<std::vector<IntentRow>, Error> ReadIntents() = 0;
    virtual Result<std::vector<PerspectiveRow>, Error> ReadPerspectives() = 0;
    virtual Result<std::vector<ConceptRow>, Error> ReadConcepts() = 0;
    virtual Result<std::vector<ConceptFieldRow>, Error> ReadConceptFields() = 0;
    virtual Result<std::vector<IntentPerspectiveRow>, Error> ReadIntentPerspectives() = 0;
    virtual Result<std::vector<PerspectiveConceptRow>, Error> ReadPerspectiveConcepts() = 0;
    virtual Result<std::vector<IntentConceptRow>, Error> ReadIntentConcepts() = 0;

    ICatalogReader(const ICatalogReader&) = delete;
    ICatalogReader& operator=(const ICatalogReader&) = delete;
    ICatalogReader(ICatalogReader&&) = delete;
    ICatalogReader& operator=(ICatalogReader&&) = delete;

protected:
    ICatalogReader() = default;
};

} // namespace catalog_graph
