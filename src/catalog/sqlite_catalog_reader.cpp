#include <catalog_graph/catalog/sqlite_catalog_reader.hpp>

#include <catalog_graph/core/log.hpp>

#include <set>
#include <vector>

namespace catalog_graph {

namespace {

// A selected column: the first name present in the relation is used.
// Missing optional columns select NULL.
struct ColumnSpec {
    std::vector<std::string> names;
    bool required;
};

ColumnSpec Required(std::string name) { return {{std::move(name)}, true}; }
ColumnSpec Optional(std::string name) { return {{std::move(name)}, false}; }

std::string QuoteIdent(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    return quoted + "\"";
}

Error MakeCatalogError(const std::string& relation, const std::string& message,
                       std::vector<std::string> details = {}) {
    return MakeError(ErrorCategory::CatalogIntegrity, "SqliteCatalogReader",
                     relation, message, std::move(details));
}

// Build and prepare "SELECT ... FROM relation ORDER BY ...". `order_by`
// entries are ColumnSpecs too, so a relation without its usual key column
// falls back to rowid order.
Result<SqliteStatement, Error> PrepareSelect(SqliteDatabase& db,
                                             const std::string& relation,
                                             const std::vector<ColumnSpec>& columns,
                                             const std::vector<ColumnSpec>& order_by) {
    using R = Result<SqliteStatement, Error>;

    auto exists = db.TableExists(relation);
    if (exists.IsErr()) return R::Err(exists.Error());
    if (!exists.Value()) {
        return R::Err(MakeCatalogError(relation, "Catalog relation is missing",
                                       {relation}));
    }

    auto present_result = db.Columns(relation);
    if (present_result.IsErr()) return R::Err(present_result.Error());
    const auto& present = present_result.Value();

    auto resolve = [&](const ColumnSpec& spec) -> std::optional<std::string> {
        for (const auto& name : spec.names) {
            if (present.count(name) > 0) return QuoteIdent(name);
        }
        return std::nullopt;
    };

    std::string sql = "SELECT ";
    for (size_t i = 0; i < columns.size(); ++i) {
        auto expr = resolve(columns[i]);
        if (!expr && columns[i].required) {
            return R::Err(MakeCatalogError(
                relation, "Catalog relation lacks required column " +
                              columns[i].names.front(),
                {relation + "." + columns[i].names.front()}));
        }
        if (i > 0) sql += ", ";
        sql += expr ? *expr : "NULL";
    }
    sql += " FROM " + QuoteIdent(relation) + " ORDER BY ";
    bool first = true;
    for (const auto& key : order_by) {
        auto expr = resolve(key);
        if (!first) sql += ", ";
        sql += expr ? *expr : "rowid";
        first = false;
    }

    LogDebug("catalog", sql);
    return db.Prepare(sql);
}

// Run a prepared statement and map every row.
template <typename Row, typename MapFn>
Result<std::vector<Row>, Error> CollectRows(Result<SqliteStatement, Error> prepared,
                                            MapFn&& map_row) {
    using R = Result<std::vector<Row>, Error>;
    if (prepared.IsErr()) return R::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();

    std::vector<Row> rows;
    while (true) {
        auto step = stmt.Step();
        if (step.IsErr()) return R::Err(step.Error());
        if (!step.Value()) break;
        rows.push_back(map_row(stmt));
    }
    return R::Ok(std::move(rows));
}

} // anonymous namespace

SqliteCatalogReader::SqliteCatalogReader(std::unique_ptr<SqliteDatabase> db)
    : db_(std::move(db)) {}

Result<std::unique_ptr<SqliteCatalogReader>, Error> SqliteCatalogReader::Open(
    const std::string& path) {
    using R = Result<std::unique_ptr<SqliteCatalogReader>, Error>;
    auto db = SqliteDatabase::Open(path, /*read_only=*/true);
    if (db.IsErr()) return R::Err(std::move(db).Error());
    return R::Ok(std::make_unique<SqliteCatalogReader>(std::move(db).Value()));
}

Result<std::vector<TableRow>, Error> SqliteCatalogReader::ReadTables() {
    auto stmt = PrepareSelect(*db_, "schema_nodes",
        {Required("table_name"), Optional("table_type"), Optional("description")},
        {Required("table_name")});
    return CollectRows<TableRow>(std::move(stmt), [](const SqliteStatement& s) {
        return TableRow{s.Text(0), s.Text(1), s.Text(2)};
    });
}

Result<std::vector<RelationshipRow>, Error> SqliteCatalogReader::ReadRelationships() {
    auto stmt = PrepareSelect(*db_, "schema_edges",
        {Optional("edge_id"), Required("from_table"), Required("to_table"),
         Optional("relationship_type"), Optional("join_column"), Optional("weight"),
         Optional("join_column_description"), Optional("natural_language_alias"),
         ColumnSpec{{"example_query", "few_shot_example"}, false},
         Optional("context")},
        {Optional("edge_id")});
    return CollectRows<RelationshipRow>(std::move(stmt), [](const SqliteStatement& s) {
        RelationshipRow row;
        row.edge_id = s.Int(0);
        row.from_table = s.Text(1);
        row.to_table = s.Text(2);
        row.relationship_type = s.Text(3);
        row.join_column = s.Text(4);
        row.weight = s.OptionalReal(5).value_or(1.0);
        row.join_column_description = s.OptionalText(6);
        row.natural_language_alias = s.OptionalText(7);
        row.example_query = s.OptionalText(8);
        row.context = s.OptionalText(9);
        return row;
    });
}

Result<std::vector<IntentRow>, Error> SqliteCatalogReader::ReadIntents() {
    auto stmt = PrepareSelect(*db_, "schema_intents",
        {Required("intent_id"), Required("intent_name"), Optional("description")},
        {Required("intent_id")});
    return CollectRows<IntentRow>(std::move(stmt), [](const SqliteStatement& s) {
        return IntentRow{s.Int(0), s.Text(1), s.Text(2)};
    });
}

Result<std::vector<PerspectiveRow>, Error> SqliteCatalogReader::ReadPerspectives() {
    auto stmt = PrepareSelect(*db_, "schema_perspectives",
        {Required("perspective_id"), Required("perspective_name"),
         Optional("description")},
        {Required("perspective_id")});
    return CollectRows<PerspectiveRow>(std::move(stmt), [](const SqliteStatement& s) {
        return PerspectiveRow{s.Int(0), s.Text(1), s.Text(2)};
    });
}

Result<std::vector<ConceptRow>, Error> SqliteCatalogReader::ReadConcepts() {
    auto stmt = PrepareSelect(*db_, "schema_concepts",
        {Required("concept_id"), Required("concept_name"), Optional("description"),
         Optional("concept_type"), Optional("domain")},
        {Required("concept_id")});
    return CollectRows<ConceptRow>(std::move(stmt), [](const SqliteStatement& s) {
        return ConceptRow{s.Int(0), s.Text(1), s.Text(2),
                          s.OptionalText(3), s.OptionalText(4)};
    });
}

Result<std::vector<ConceptFieldRow>, Error> SqliteCatalogReader::ReadConceptFields() {
    auto stmt = PrepareSelect(*db_, "schema_concept_fields",
        {Optional("id"), Required("concept_id"), Required("table_name"),
         Required("field_name"), Optional("is_primary_meaning"),
         Optional("table_alias"), Optional("context_hint")},
        {Optional("id")});
    return CollectRows<ConceptFieldRow>(std::move(stmt), [](const SqliteStatement& s) {
        ConceptFieldRow row;
        row.id = s.Int(0);
        row.concept_id = s.Int(1);
        row.table_name = s.Text(2);
        row.field_name = s.Text(3);
        row.is_primary_meaning = !s.IsNull(4) && s.Int(4) != 0;
        row.table_alias = s.Text(5);
        row.context_hint = s.OptionalText(6);
        return row;
    });
}

Result<std::vector<IntentPerspectiveRow>, Error>
SqliteCatalogReader::ReadIntentPerspectives() {
    auto stmt = PrepareSelect(*db_, "schema_intent_perspectives",
        {Required("intent_id"), Required("perspective_id"),
         Optional("intent_factor_weight")},
        {Required("intent_id"), Required("perspective_id")});
    return CollectRows<IntentPerspectiveRow>(std::move(stmt), [](const SqliteStatement& s) {
        return IntentPerspectiveRow{s.Int(0), s.Int(1), s.OptionalReal(2).value_or(1.0)};
    });
}

Result<std::vector<PerspectiveConceptRow>, Error>
SqliteCatalogReader::ReadPerspectiveConcepts() {
    auto stmt = PrepareSelect(*db_, "schema_perspective_concepts",
        {Required("perspective_id"), Required("concept_id"),
         Optional("elevation_weight"), Optional("relationship_type"),
         Optional("collision_resolution")},
        {Required("perspective_id"), Required("concept_id")});
    return CollectRows<PerspectiveConceptRow>(std::move(stmt), [](const SqliteStatement& s) {
        return PerspectiveConceptRow{s.Int(0), s.Int(1), s.OptionalReal(2),
                                     s.OptionalText(3), s.OptionalText(4)};
    });
}

Result<std::vector<IntentConceptRow>, Error> SqliteCatalogReader::ReadIntentConcepts() {
    auto stmt = PrepareSelect(*db_, "schema_intent_concepts",
        {Required("intent_id"), Required("concept_id"),
         Optional("intent_factor_weight"), Optional("explanation")},
        {Required("intent_id"), Required("concept_id")});
    return CollectRows<IntentConceptRow>(std::move(stmt), [](const SqliteStatement& s) {
        return IntentConceptRow{s.Int(0), s.Int(1), s.OptionalReal(2).value_or(0.0),
                                s.OptionalText(3)};
    });
}

} // namespace catalog_graph
