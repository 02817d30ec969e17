#include <catalog_graph/store/graph_persistence.hpp>

#include <catalog_graph/core/log.hpp>
#include <catalog_graph/core/types.hpp>
#include <catalog_graph/store/document_codec.hpp>

#include <algorithm>
#include <cctype>

namespace catalog_graph {

namespace {

constexpr const char* kPersist = "PersistGraph";
constexpr const char* kLoad = "LoadGraph";

Result<void, Error> ValidateRequest(const char* operation, const std::string& name,
                                    size_t batch_size) {
    using R = Result<void, Error>;
    auto valid = GraphName::Create(name);
    if (valid.IsErr()) {
        return R::Err(MakeError(ErrorCategory::Config, operation, name,
                                "Invalid graph name", {valid.Error()}));
    }
    if (batch_size == 0) {
        return R::Err(MakeError(ErrorCategory::Config, operation, name,
                                "Batch size must be positive"));
    }
    return R::Ok();
}

// Best effort: the caller is already reporting a failure, so a failed drop
// is logged rather than returned.
void DropQuietly(IGraphStore& store, const std::string& collection) {
    auto dropped = store.DropCollection(collection);
    if (dropped.IsErr()) {
        LogWarn("store", "could not drop collection " + collection + ": " +
                             dropped.Error().message);
    }
}

void Rollback(IGraphStore& store, const GraphDefinition& created) {
    LogWarn("store", "rolling back write of " + created.name + " (" +
                         created.node_collection + ", " + created.edge_collection + ")");
    DropQuietly(store, created.edge_collection);
    DropQuietly(store, created.node_collection);
}

Error BatchFailure(const std::string& name, size_t batch_index, const Error& cause) {
    auto err = MakeError(ErrorCategory::PartialWrite, kPersist, name,
                         "Batch " + std::to_string(batch_index) +
                             " failed; the stored graph was left unchanged",
                         cause.details);
    err.details.insert(err.details.begin(), cause.CategoryName() + ": " + cause.message);
    err.batch_index = batch_index;
    err.http_status = cause.http_status;
    err.store_error = cause.store_error ? cause.store_error : cause.message;
    return err;
}

int CurrentGeneration(const std::string& name,
                      const std::optional<GraphDefinition>& existing) {
    if (!existing) return 0;
    int gen = 0;
    for (const auto& c : {existing->node_collection, existing->edge_collection}) {
        gen = std::max(gen, CollectionGeneration(name, c).value_or(0));
    }
    return gen;
}

} // anonymous namespace

std::string NodeCollectionName(const std::string& graph_name, int generation) {
    return graph_name + "_node_g" + std::to_string(generation);
}

std::string EdgeCollectionName(const std::string& graph_name, int generation) {
    return graph_name + "_edge_g" + std::to_string(generation);
}

std::optional<int> CollectionGeneration(const std::string& graph_name,
                                        const std::string& collection) {
    for (const char* infix : {"_node_g", "_edge_g"}) {
        const auto prefix = graph_name + infix;
        if (collection.size() <= prefix.size() ||
            collection.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        const auto digits = collection.substr(prefix.size());
        if (digits.size() > 9 ||
            !std::all_of(digits.begin(), digits.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::nullopt;
        }
        return std::stoi(digits);
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// PersistGraph
// ---------------------------------------------------------------------------

Result<PersistReport, Error> PersistGraph(IGraphStore& store, const Graph& graph,
                                          const PersistOptions& options) {
    using R = Result<PersistReport, Error>;
    const auto& name = options.store_name;

    if (auto v = ValidateRequest(kPersist, name, options.batch_size); v.IsErr()) {
        return R::Err(v.Error());
    }
    if (auto c = options.deadline.Check(kPersist, name); c.IsErr()) {
        return R::Err(c.Error());
    }

    auto existing_result = store.GetGraph(name);
    if (existing_result.IsErr()) return R::Err(std::move(existing_result).Error());
    const auto existing = std::move(existing_result).Value();
    if (existing && !options.overwrite) {
        return R::Err(MakeError(ErrorCategory::GraphExists, kPersist, name,
                                "Graph already exists; pass overwrite to replace it",
                                {name}));
    }

    // Collections of earlier interrupted writes are cleared and never reused.
    auto collections = store.ListCollections();
    if (collections.IsErr()) return R::Err(std::move(collections).Error());
    int max_generation = CurrentGeneration(name, existing);
    for (const auto& c : collections.Value()) {
        auto gen = CollectionGeneration(name, c);
        if (!gen) continue;
        max_generation = std::max(max_generation, *gen);
        if (existing && (c == existing->node_collection || c == existing->edge_collection)) {
            continue;
        }
        LogInfo("store", "dropping leftover collection " + c);
        if (auto d = store.DropCollection(c); d.IsErr()) {
            return R::Err(d.Error());
        }
    }

    PersistReport report;
    report.generation = max_generation + 1;
    report.replaced_existing = existing.has_value();
    report.definition = GraphDefinition{name, NodeCollectionName(name, report.generation),
                                        EdgeCollectionName(name, report.generation)};
    const auto& def = report.definition;

    if (auto c = store.CreateCollection(def.node_collection, CollectionType::Document);
        c.IsErr()) {
        return R::Err(c.Error());
    }
    if (auto c = store.CreateCollection(def.edge_collection, CollectionType::Edge);
        c.IsErr()) {
        DropQuietly(store, def.node_collection);
        return R::Err(c.Error());
    }

    // -- Batches ------------------------------------------------------------

    std::vector<nlohmann::json> pending;
    pending.reserve(options.batch_size);
    auto flush = [&](const std::string& collection) -> Result<void, Error> {
        using V = Result<void, Error>;
        if (pending.empty()) return V::Ok();
        if (auto c = options.deadline.Check(kPersist, name); c.IsErr()) {
            return V::Err(c.Error());
        }
        auto inserted = store.InsertDocuments(collection, pending);
        if (inserted.IsErr()) {
            return V::Err(BatchFailure(name, report.batches, inserted.Error()));
        }
        LogDebug("store", "batch " + std::to_string(report.batches) + ": " +
                              std::to_string(pending.size()) + " document(s) into " +
                              collection);
        ++report.batches;
        pending.clear();
        return V::Ok();
    };

    for (const auto& [id, node] : graph.Nodes()) {
        pending.push_back(NodeToDocument(node));
        if (pending.size() == options.batch_size) {
            if (auto f = flush(def.node_collection); f.IsErr()) {
                Rollback(store, def);
                return R::Err(f.Error());
            }
        }
        ++report.nodes_written;
    }
    if (auto f = flush(def.node_collection); f.IsErr()) {
        Rollback(store, def);
        return R::Err(f.Error());
    }

    size_t edge_index = 0;
    for (const Edge* edge : graph.Edges()) {
        pending.push_back(EdgeToDocument(*edge, edge_index++, def.node_collection));
        if (pending.size() == options.batch_size) {
            if (auto f = flush(def.edge_collection); f.IsErr()) {
                Rollback(store, def);
                return R::Err(f.Error());
            }
        }
        ++report.edges_written;
    }
    if (auto f = flush(def.edge_collection); f.IsErr()) {
        Rollback(store, def);
        return R::Err(f.Error());
    }

    if (auto c = options.deadline.Check(kPersist, name); c.IsErr()) {
        Rollback(store, def);
        return R::Err(c.Error());
    }

    // -- Definition switch --------------------------------------------------

    if (existing) {
        if (auto d = store.DeleteGraph(name); d.IsErr()) {
            Rollback(store, def);
            return R::Err(d.Error());
        }
    }
    if (auto created = store.CreateGraph(def); created.IsErr()) {
        auto err = created.Error();
        if (existing) {
            auto restored = store.CreateGraph(*existing);
            if (restored.IsErr()) {
                LogError("store", "could not restore previous definition of " + name +
                                      ": " + restored.Error().message);
                err.details.push_back("previous definition not restored: " +
                                      restored.Error().message);
            } else {
                LogWarn("store", "restored previous definition of " + name);
            }
        }
        Rollback(store, def);
        return R::Err(std::move(err));
    }

    if (existing) {
        for (const auto& old : {existing->node_collection, existing->edge_collection}) {
            if (old != def.node_collection && old != def.edge_collection) {
                DropQuietly(store, old);
            }
        }
    }

    LogInfo("store", "persisted " + name + " generation " +
                         std::to_string(report.generation) + ": " +
                         std::to_string(report.nodes_written) + " node(s), " +
                         std::to_string(report.edges_written) + " edge(s) in " +
                         std::to_string(report.batches) + " batch(es)");
    return R::Ok(std::move(report));
}

// ---------------------------------------------------------------------------
// LoadGraph
// ---------------------------------------------------------------------------

Result<Graph, Error> LoadGraph(IGraphStore& store, const LoadOptions& options) {
    using R = Result<Graph, Error>;
    const auto& name = options.store_name;

    if (auto v = ValidateRequest(kLoad, name, options.batch_size); v.IsErr()) {
        return R::Err(v.Error());
    }
    if (auto c = options.deadline.Check(kLoad, name); c.IsErr()) {
        return R::Err(c.Error());
    }

    auto def_result = store.GetGraph(name);
    if (def_result.IsErr()) return R::Err(std::move(def_result).Error());
    const auto def = std::move(def_result).Value();
    if (!def) {
        return R::Err(MakeError(ErrorCategory::GraphNotFound, kLoad, name,
                                "Graph does not exist in the store", {name}));
    }

    Graph graph(options.directed);

    auto nodes = store.ReadCollection(def->node_collection, options.batch_size);
    if (nodes.IsErr()) return R::Err(std::move(nodes).Error());
    for (const auto& doc : nodes.Value()) {
        auto node = NodeFromDocument(doc);
        if (node.IsErr()) return R::Err(std::move(node).Error());
        auto n = std::move(node).Value();
        if (auto added = graph.AddNode(std::move(n.id), std::move(n.data), std::move(n.extra));
            added.IsErr()) {
            return R::Err(added.Error());
        }
    }

    if (auto c = options.deadline.Check(kLoad, name); c.IsErr()) {
        return R::Err(c.Error());
    }

    if (!def->edge_collection.empty()) {
        auto edges = store.ReadCollection(def->edge_collection, options.batch_size);
        if (edges.IsErr()) return R::Err(std::move(edges).Error());
        for (const auto& doc : edges.Value()) {
            auto edge = EdgeFromDocument(doc);
            if (edge.IsErr()) return R::Err(std::move(edge).Error());
            auto e = std::move(edge).Value();
            if (!options.directed) {
                // A mirrored pair from a directed graph is one undirected edge.
                const Edge* mirror = graph.FindEdge(e.to, e.from, e.Kind());
                if (mirror != nullptr && mirror->data == e.data && mirror->extra == e.extra) {
                    LogDebug("store", "folded mirrored edge " + e.from + " -> " + e.to);
                    continue;
                }
            }
            if (auto added = graph.AddEdge(std::move(e.from), std::move(e.to),
                                           std::move(e.data), std::move(e.extra));
                added.IsErr()) {
                return R::Err(added.Error());
            }
        }
    }

    LogInfo("store", "loaded " + name + ": " + std::to_string(graph.NodeCount()) +
                         " node(s), " + std::to_string(graph.EdgeCount()) + " edge(s)");
    return R::Ok(std::move(graph));
}

} // namespace catalog_graph
