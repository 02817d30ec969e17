#include <catalog_graph/catalog/catalog_loader.hpp>

#include <catalog_graph/core/log.hpp>

#include <map>

namespace catalog_graph {

namespace {

constexpr const char* kComponent = "catalog";
constexpr const char* kOperation = "LoadCatalog";

std::string RowRef(const std::string& relation, const std::string& key) {
    return relation + "(" + key + ")";
}

// Wrap a graph invariant violation raised while applying a catalog row.
Error IntegrityError(const std::string& relation, const std::string& key,
                     const Error& cause) {
    std::vector<std::string> details{RowRef(relation, key)};
    details.insert(details.end(), cause.details.begin(), cause.details.end());
    return MakeError(ErrorCategory::CatalogIntegrity, kOperation, relation,
                     cause.message, std::move(details));
}

Error DanglingError(const std::string& relation, const std::string& key,
                    std::vector<std::string> missing) {
    std::vector<std::string> details{RowRef(relation, key)};
    details.insert(details.end(), missing.begin(), missing.end());
    return MakeError(ErrorCategory::CatalogIntegrity, kOperation, relation,
                     "Row references an unknown catalog entry", std::move(details));
}

Error NamedIntegrityError(const std::string& relation, const std::string& key,
                          const std::string& message) {
    return MakeError(ErrorCategory::CatalogIntegrity, kOperation, relation,
                     message, {RowRef(relation, key)});
}

std::string Key(const char* a, int64_t va) {
    return std::string(a) + "=" + std::to_string(va);
}

std::string Key(const char* a, int64_t va, const char* b, int64_t vb) {
    return Key(a, va) + ", " + Key(b, vb);
}

void PutIfPresent(Attributes& attrs, const char* name,
                  const std::optional<std::string>& value) {
    if (value.has_value() && !value->empty()) {
        attrs[name] = *value;
    }
}

// catalog id -> node id, per semantic relation.
using IdMap = std::map<int64_t, std::string>;

std::optional<std::string> Lookup(const IdMap& ids, int64_t id) {
    auto it = ids.find(id);
    if (it == ids.end()) return std::nullopt;
    return it->second;
}

Result<void, Error> LoadTables(ICatalogReader& reader, Graph& graph) {
    auto rows = reader.ReadTables();
    if (rows.IsErr()) return Result<void, Error>::Err(rows.Error());

    for (const auto& row : rows.Value()) {
        auto added = graph.AddNode(TableId(row.table_name),
                                   TableNode{row.table_name, row.table_type,
                                             row.description});
        if (added.IsErr()) {
            return Result<void, Error>::Err(IntegrityError(
                "schema_nodes", "table_name=" + row.table_name, added.Error()));
        }
    }
    LogDebug(kComponent, "loaded " + std::to_string(rows.Value().size()) + " tables");
    return Result<void, Error>::Ok();
}

Result<void, Error> LoadRelationships(ICatalogReader& reader, Graph& graph) {
    auto rows = reader.ReadRelationships();
    if (rows.IsErr()) return Result<void, Error>::Err(rows.Error());

    for (const auto& row : rows.Value()) {
        const auto key = Key("edge_id", row.edge_id);
        std::vector<std::string> missing;
        if (!graph.HasNode(TableId(row.from_table))) missing.push_back(row.from_table);
        if (!graph.HasNode(TableId(row.to_table))) missing.push_back(row.to_table);
        if (!missing.empty()) {
            return Result<void, Error>::Err(
                DanglingError("schema_edges", key, std::move(missing)));
        }

        Attributes extra;
        PutIfPresent(extra, "join_column_description", row.join_column_description);
        PutIfPresent(extra, "natural_language_alias", row.natural_language_alias);
        PutIfPresent(extra, "example_query", row.example_query);
        PutIfPresent(extra, "context", row.context);

        auto added = graph.AddEdge(
            TableId(row.from_table), TableId(row.to_table),
            JoinEdge{row.relationship_type, row.join_column, row.weight},
            std::move(extra));
        if (added.IsErr()) {
            return Result<void, Error>::Err(
                IntegrityError("schema_edges", key, added.Error()));
        }
    }
    LogDebug(kComponent, "loaded " + std::to_string(rows.Value().size()) +
                             " relationships");
    return Result<void, Error>::Ok();
}

// Intents, perspectives and concepts share one shape: id, name, description.
template <typename Row, typename MakeNode>
Result<void, Error> LoadNamedNodes(const std::vector<Row>& rows,
                                   const char* relation, const char* id_column,
                                   Graph& graph, IdMap& ids, MakeNode&& make) {
    for (const auto& row : rows) {
        auto [catalog_id, node_id, data, extra] = make(row);
        const auto key = Key(id_column, catalog_id);
        if (ids.count(catalog_id) > 0) {
            return Result<void, Error>::Err(NamedIntegrityError(
                relation, key, "Duplicate catalog id"));
        }
        extra["catalog_id"] = std::to_string(catalog_id);
        auto added = graph.AddNode(node_id, std::move(data), std::move(extra));
        if (added.IsErr()) {
            return Result<void, Error>::Err(IntegrityError(relation, key, added.Error()));
        }
        ids.emplace(catalog_id, node_id);
    }
    return Result<void, Error>::Ok();
}

struct NodeSeed {
    int64_t catalog_id;
    std::string node_id;
    NodeData data;
    Attributes extra;
};

Polarity PolarityFromWeight(double weight) {
    if (weight > 0) return Polarity::Elevates;
    if (weight < 0) return Polarity::Suppresses;
    return Polarity::Neutral;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// BuildSchemaGraph
// ---------------------------------------------------------------------------
Result<Graph, Error> BuildSchemaGraph(ICatalogReader& reader, const Deadline& deadline) {
    using R = Result<Graph, Error>;
    Graph graph(/*directed=*/true);

    if (auto c = deadline.Check(kOperation, "schema_nodes"); c.IsErr()) {
        return R::Err(c.Error());
    }
    if (auto r = LoadTables(reader, graph); r.IsErr()) {
        return R::Err(r.Error());
    }
    if (auto c = deadline.Check(kOperation, "schema_edges"); c.IsErr()) {
        return R::Err(c.Error());
    }
    if (auto r = LoadRelationships(reader, graph); r.IsErr()) {
        return R::Err(r.Error());
    }

    LogInfo(kComponent, "schema graph: " + std::to_string(graph.NodeCount()) +
                            " tables, " + std::to_string(graph.EdgeCount()) +
                            " relationships");
    return R::Ok(std::move(graph));
}

// ---------------------------------------------------------------------------
// BuildSemanticGraph
// ---------------------------------------------------------------------------
Result<Graph, Error> BuildSemanticGraph(ICatalogReader& reader, const Deadline& deadline) {
    using R = Result<Graph, Error>;
    Graph graph(/*directed=*/true);
    IdMap intents;
    IdMap perspectives;
    IdMap concepts;

    auto check = [&](const char* relation) { return deadline.Check(kOperation, relation); };

    // -- Nodes --------------------------------------------------------------

    if (auto c = check("schema_intents"); c.IsErr()) return R::Err(c.Error());
    {
        auto rows = reader.ReadIntents();
        if (rows.IsErr()) return R::Err(rows.Error());
        auto loaded = LoadNamedNodes(rows.Value(), "schema_intents", "intent_id",
            graph, intents, [](const IntentRow& row) {
                return NodeSeed{row.intent_id, IntentId(row.intent_name),
                                IntentNode{row.intent_name, row.description}, {}};
            });
        if (loaded.IsErr()) return R::Err(loaded.Error());
    }

    if (auto c = check("schema_perspectives"); c.IsErr()) return R::Err(c.Error());
    {
        auto rows = reader.ReadPerspectives();
        if (rows.IsErr()) return R::Err(rows.Error());
        auto loaded = LoadNamedNodes(rows.Value(), "schema_perspectives",
            "perspective_id", graph, perspectives, [](const PerspectiveRow& row) {
                return NodeSeed{row.perspective_id, PerspectiveId(row.perspective_name),
                                PerspectiveNode{row.perspective_name, row.description},
                                {}};
            });
        if (loaded.IsErr()) return R::Err(loaded.Error());
    }

    if (auto c = check("schema_concepts"); c.IsErr()) return R::Err(c.Error());
    {
        auto rows = reader.ReadConcepts();
        if (rows.IsErr()) return R::Err(rows.Error());
        auto loaded = LoadNamedNodes(rows.Value(), "schema_concepts", "concept_id",
            graph, concepts, [](const ConceptRow& row) {
                Attributes extra;
                PutIfPresent(extra, "concept_type", row.concept_type);
                PutIfPresent(extra, "domain", row.domain);
                return NodeSeed{row.concept_id, ConceptId(row.concept_name),
                                ConceptNode{row.concept_name, row.description},
                                std::move(extra)};
            });
        if (loaded.IsErr()) return R::Err(loaded.Error());
    }

    // -- Fields and CAN_MEAN ------------------------------------------------

    if (auto c = check("schema_concept_fields"); c.IsErr()) return R::Err(c.Error());
    {
        auto rows = reader.ReadConceptFields();
        if (rows.IsErr()) return R::Err(rows.Error());
        for (const auto& row : rows.Value()) {
            const auto key = Key("id", row.id);
            auto concept_node = Lookup(concepts, row.concept_id);
            if (!concept_node) {
                return R::Err(DanglingError("schema_concept_fields", key,
                                            {Key("concept_id", row.concept_id)}));
            }
            const auto field_id = FieldId(row.table_name, row.field_name);
            if (!graph.HasNode(field_id)) {
                auto added = graph.AddNode(field_id,
                                           FieldNode{row.table_name, row.field_name});
                if (added.IsErr()) {
                    return R::Err(IntegrityError("schema_concept_fields", key,
                                                 added.Error()));
                }
            }
            Attributes extra;
            PutIfPresent(extra, "context_hint", row.context_hint);
            auto added = graph.AddEdge(field_id, *concept_node,
                                       CanMeanEdge{row.is_primary_meaning, row.table_alias},
                                       std::move(extra));
            if (added.IsErr()) {
                return R::Err(IntegrityError("schema_concept_fields", key, added.Error()));
            }
        }
    }

    // -- OPERATES_WITHIN ----------------------------------------------------

    if (auto c = check("schema_intent_perspectives"); c.IsErr()) return R::Err(c.Error());
    {
        auto rows = reader.ReadIntentPerspectives();
        if (rows.IsErr()) return R::Err(rows.Error());
        for (const auto& row : rows.Value()) {
            const auto key = Key("intent_id", row.intent_id,
                                 "perspective_id", row.perspective_id);
            auto intent = Lookup(intents, row.intent_id);
            auto perspective = Lookup(perspectives, row.perspective_id);
            std::vector<std::string> missing;
            if (!intent) missing.push_back(Key("intent_id", row.intent_id));
            if (!perspective) missing.push_back(Key("perspective_id", row.perspective_id));
            if (!missing.empty()) {
                return R::Err(DanglingError("schema_intent_perspectives", key,
                                            std::move(missing)));
            }
            auto added = graph.AddEdge(*intent, *perspective,
                                       OperatesWithinEdge{row.intent_factor_weight});
            if (added.IsErr()) {
                return R::Err(IntegrityError("schema_intent_perspectives", key,
                                             added.Error()));
            }
        }
    }

    // -- USES_DEFINITION and perspective elevation --------------------------

    if (auto c = check("schema_perspective_concepts"); c.IsErr()) return R::Err(c.Error());
    {
        auto rows = reader.ReadPerspectiveConcepts();
        if (rows.IsErr()) return R::Err(rows.Error());
        for (const auto& row : rows.Value()) {
            const auto key = Key("perspective_id", row.perspective_id,
                                 "concept_id", row.concept_id);
            auto perspective = Lookup(perspectives, row.perspective_id);
            auto concept_node = Lookup(concepts, row.concept_id);
            std::vector<std::string> missing;
            if (!perspective) missing.push_back(Key("perspective_id", row.perspective_id));
            if (!concept_node) missing.push_back(Key("concept_id", row.concept_id));
            if (!missing.empty()) {
                return R::Err(DanglingError("schema_perspective_concepts", key,
                                            std::move(missing)));
            }

            auto uses = graph.AddEdge(*perspective, *concept_node, UsesDefinitionEdge{});
            if (uses.IsErr()) {
                return R::Err(IntegrityError("schema_perspective_concepts", key,
                                             uses.Error()));
            }

            std::optional<Polarity> polarity;
            if (row.relationship_type.has_value() && !row.relationship_type->empty()) {
                polarity = ParsePolarity(*row.relationship_type);
                if (!polarity) {
                    return R::Err(NamedIntegrityError(
                        "schema_perspective_concepts", key,
                        "Unknown relationship_type '" + *row.relationship_type +
                            "' (expected ELEVATES, SUPPRESSES or NEUTRAL)"));
                }
            }
            if (!row.elevation_weight && !polarity) {
                continue;
            }

            double weight = row.elevation_weight
                ? *row.elevation_weight
                : (*polarity == Polarity::Elevates ? 1.0 : 0.0);
            if (!polarity) {
                polarity = weight > 0.0 ? Polarity::Elevates : Polarity::Suppresses;
            }

            Attributes extra;
            PutIfPresent(extra, "collision_resolution", row.collision_resolution);
            auto influence = graph.AddEdge(*perspective, *concept_node,
                                           InfluenceEdge{*polarity, weight},
                                           std::move(extra));
            if (influence.IsErr()) {
                return R::Err(IntegrityError("schema_perspective_concepts", key,
                                             influence.Error()));
            }
        }
    }

    // -- Intent -> Concept influence ----------------------------------------

    if (auto c = check("schema_intent_concepts"); c.IsErr()) return R::Err(c.Error());
    {
        auto rows = reader.ReadIntentConcepts();
        if (rows.IsErr()) return R::Err(rows.Error());
        for (const auto& row : rows.Value()) {
            const auto key = Key("intent_id", row.intent_id, "concept_id", row.concept_id);
            auto intent = Lookup(intents, row.intent_id);
            auto concept_node = Lookup(concepts, row.concept_id);
            std::vector<std::string> missing;
            if (!intent) missing.push_back(Key("intent_id", row.intent_id));
            if (!concept_node) missing.push_back(Key("concept_id", row.concept_id));
            if (!missing.empty()) {
                return R::Err(DanglingError("schema_intent_concepts", key,
                                            std::move(missing)));
            }
            Attributes extra;
            PutIfPresent(extra, "explanation", row.explanation);
            auto added = graph.AddEdge(
                *intent, *concept_node,
                InfluenceEdge{PolarityFromWeight(row.intent_factor_weight),
                              row.intent_factor_weight},
                std::move(extra));
            if (added.IsErr()) {
                return R::Err(IntegrityError("schema_intent_concepts", key,
                                             added.Error()));
            }
        }
    }

    LogInfo(kComponent, "semantic graph: " + std::to_string(graph.NodeCount()) +
                            " nodes, " + std::to_string(graph.EdgeCount()) + " edges");
    return R::Ok(std::move(graph));
}

// ---------------------------------------------------------------------------
// LoadCatalog
// ---------------------------------------------------------------------------
Result<CatalogGraphs, Error> LoadCatalog(ICatalogReader& reader, const Deadline& deadline) {
    using R = Result<CatalogGraphs, Error>;
    auto schema = BuildSchemaGraph(reader, deadline);
    if (schema.IsErr()) return R::Err(std::move(schema).Error());
    auto semantic = BuildSemanticGraph(reader, deadline);
    if (semantic.IsErr()) return R::Err(std::move(semantic).Error());
    return R::Ok(CatalogGraphs{std::move(schema).Value(), std::move(semantic).Value()});
}

} // namespace catalog_graph
