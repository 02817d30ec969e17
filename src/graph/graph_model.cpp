#include <catalog_graph/graph/graph_model.hpp>

#include <cmath>
#include <type_traits>

namespace catalog_graph {

namespace {

Error MakeGraphError(ErrorCategory category, const std::string& operation,
                     const std::string& subject, const std::string& message,
                     std::vector<std::string> details = {}) {
    return MakeError(category, "Graph::" + operation, subject, message,
                     std::move(details));
}

std::string EdgeSubject(const std::string& from, const std::string& to,
                        EdgeKind kind) {
    return from + " -" + EdgeKindName(kind) + "-> " + to;
}

bool IsUnitWeight(double w) {
    return w == -1.0 || w == 0.0 || w == 1.0;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Names and ids
// ---------------------------------------------------------------------------

const char* NodeKindName(NodeKind kind) {
    switch (kind) {
        case NodeKind::Table:       return "table";
        case NodeKind::Field:       return "field";
        case NodeKind::Intent:      return "intent";
        case NodeKind::Perspective: return "perspective";
        case NodeKind::Concept:     return "concept";
    }
    return "unknown";
}

std::optional<NodeKind> ParseNodeKind(std::string_view name) {
    if (name == "table") return NodeKind::Table;
    if (name == "field") return NodeKind::Field;
    if (name == "intent") return NodeKind::Intent;
    if (name == "perspective") return NodeKind::Perspective;
    if (name == "concept") return NodeKind::Concept;
    return std::nullopt;
}

const char* EdgeKindName(EdgeKind kind) {
    switch (kind) {
        case EdgeKind::Join:           return "JOIN";
        case EdgeKind::OperatesWithin: return "OPERATES_WITHIN";
        case EdgeKind::UsesDefinition: return "USES_DEFINITION";
        case EdgeKind::CanMean:        return "CAN_MEAN";
        case EdgeKind::Influence:      return "INFLUENCE";
    }
    return "UNKNOWN";
}

std::optional<EdgeKind> ParseEdgeKind(std::string_view name) {
    if (name == "JOIN") return EdgeKind::Join;
    if (name == "OPERATES_WITHIN") return EdgeKind::OperatesWithin;
    if (name == "USES_DEFINITION") return EdgeKind::UsesDefinition;
    if (name == "CAN_MEAN") return EdgeKind::CanMean;
    if (name == "INFLUENCE") return EdgeKind::Influence;
    return std::nullopt;
}

const char* PolarityName(Polarity polarity) {
    switch (polarity) {
        case Polarity::Elevates:   return "ELEVATES";
        case Polarity::Suppresses: return "SUPPRESSES";
        case Polarity::Neutral:    return "NEUTRAL";
    }
    return "NEUTRAL";
}

std::optional<Polarity> ParsePolarity(std::string_view name) {
    if (name == "ELEVATES") return Polarity::Elevates;
    if (name == "SUPPRESSES") return Polarity::Suppresses;
    if (name == "NEUTRAL") return Polarity::Neutral;
    return std::nullopt;
}

std::string TableId(const std::string& table) { return table; }

std::string FieldId(const std::string& table, const std::string& column) {
    return "field:" + table + "." + column;
}

std::string IntentId(const std::string& name) { return "intent:" + name; }
std::string PerspectiveId(const std::string& name) { return "perspective:" + name; }
std::string ConceptId(const std::string& name) { return "concept:" + name; }

std::string Node::Name() const {
    return std::visit([](const auto& n) -> std::string {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, FieldNode>) {
            return n.table + "." + n.column;
        } else {
            return n.name;
        }
    }, data);
}

std::string Edge::Label() const {
    if (auto* influence = std::get_if<InfluenceEdge>(&data)) {
        return PolarityName(influence->polarity);
    }
    return EdgeKindName(Kind());
}

// ---------------------------------------------------------------------------
// Insertion
// ---------------------------------------------------------------------------

Result<void, Error> Graph::AddNode(std::string id, NodeData data, Attributes extra) {
    if (id.empty()) {
        return Result<void, Error>::Err(MakeGraphError(
            ErrorCategory::Internal, "AddNode", id, "Node id must not be empty"));
    }
    if (nodes_.count(id) > 0) {
        return Result<void, Error>::Err(MakeGraphError(
            ErrorCategory::DuplicateNode, "AddNode", id,
            "Node already exists", {id}));
    }
    Node node{id, std::move(data), std::move(extra)};
    nodes_.emplace(std::move(id), std::move(node));
    return Result<void, Error>::Ok();
}

Result<void, Error> Graph::ValidateEdge(const Node& from, const Node& to,
                                        const EdgeData& data) const {
    const auto kind = static_cast<EdgeKind>(data.index());
    const auto subject = EdgeSubject(from.id, to.id, kind);
    auto invalid = [&](const std::string& message) {
        return Result<void, Error>::Err(MakeGraphError(
            ErrorCategory::InvalidEdge, "AddEdge", subject, message,
            {from.id, to.id}));
    };
    auto expect = [&](NodeKind f, NodeKind t) {
        return from.Kind() == f && to.Kind() == t;
    };

    switch (kind) {
        case EdgeKind::Join: {
            if (!expect(NodeKind::Table, NodeKind::Table)) {
                return invalid("JOIN edges connect two tables");
            }
            double w = std::get<JoinEdge>(data).weight;
            if (!std::isfinite(w) || w < kMinJoinWeight) {
                return invalid("Join weight must be a finite number of at least " +
                               std::to_string(kMinJoinWeight) + ", got " +
                               std::to_string(w));
            }
            break;
        }
        case EdgeKind::OperatesWithin: {
            if (!expect(NodeKind::Intent, NodeKind::Perspective)) {
                return invalid("OPERATES_WITHIN edges run from an intent to a perspective");
            }
            double w = std::get<OperatesWithinEdge>(data).weight;
            if (!std::isfinite(w)) {
                return invalid("OPERATES_WITHIN weight must be finite");
            }
            break;
        }
        case EdgeKind::UsesDefinition:
            if (!expect(NodeKind::Perspective, NodeKind::Concept)) {
                return invalid("USES_DEFINITION edges run from a perspective to a concept");
            }
            break;
        case EdgeKind::CanMean:
            if (!expect(NodeKind::Field, NodeKind::Concept)) {
                return invalid("CAN_MEAN edges run from a field to a concept");
            }
            break;
        case EdgeKind::Influence: {
            const auto& influence = std::get<InfluenceEdge>(data);
            if (to.Kind() != NodeKind::Concept) {
                return invalid("Influence edges must target a concept");
            }
            if (from.Kind() == NodeKind::Perspective) {
                if (!(influence.weight >= 0.0 && influence.weight <= 1.0)) {
                    return invalid("Elevation weight must be within [0, 1], got " +
                                   std::to_string(influence.weight));
                }
            } else if (from.Kind() == NodeKind::Intent) {
                if (!IsUnitWeight(influence.weight)) {
                    return invalid("Intent influence weight must be -1, 0 or 1, got " +
                                   std::to_string(influence.weight));
                }
                Polarity expected = influence.weight > 0 ? Polarity::Elevates
                                  : influence.weight < 0 ? Polarity::Suppresses
                                                         : Polarity::Neutral;
                if (influence.polarity != expected) {
                    return invalid(std::string("Intent influence polarity ") +
                                   PolarityName(influence.polarity) +
                                   " does not match weight " +
                                   std::to_string(influence.weight));
                }
            } else {
                return invalid("Influence edges start at a perspective or an intent");
            }
            break;
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> Graph::AddEdge(std::string from, std::string to,
                                   EdgeData data, Attributes extra) {
    const auto kind = static_cast<EdgeKind>(data.index());
    const auto subject = EdgeSubject(from, to, kind);

    std::vector<std::string> missing;
    auto from_it = nodes_.find(from);
    auto to_it = nodes_.find(to);
    if (from_it == nodes_.end()) missing.push_back(from);
    if (to_it == nodes_.end()) missing.push_back(to);
    if (!missing.empty()) {
        return Result<void, Error>::Err(MakeGraphError(
            ErrorCategory::UnknownNode, "AddEdge", subject,
            "Edge endpoint is not in the graph", std::move(missing)));
    }

    EdgeKey key{from, to, kind};
    bool duplicate = edges_.count(key) > 0;
    if (!directed_ && !duplicate) {
        // Reciprocal edges stay apart when they describe different
        // relationships; a mirrored copy is the same undirected edge.
        auto reverse = edges_.find(EdgeKey{to, from, kind});
        duplicate = reverse != edges_.end() && reverse->second.data == data &&
                    reverse->second.extra == extra;
    }
    if (duplicate) {
        return Result<void, Error>::Err(MakeGraphError(
            ErrorCategory::DuplicateEdge, "AddEdge", subject,
            "An edge of this kind already connects these nodes", {from, to}));
    }

    auto valid = ValidateEdge(from_it->second, to_it->second, data);
    if (valid.IsErr()) {
        return valid;
    }

    std::optional<std::pair<std::string, std::string>> primary_key;
    if (auto* can_mean = std::get_if<CanMeanEdge>(&data);
        can_mean != nullptr && can_mean->is_primary) {
        const auto& field = std::get<FieldNode>(from_it->second.data);
        primary_key = std::make_pair(to, field.table);
        if (primary_meanings_.count(*primary_key) > 0) {
            return Result<void, Error>::Err(MakeGraphError(
                ErrorCategory::InvalidEdge, "AddEdge", subject,
                "Concept already has a primary field in table " + field.table,
                {to, field.table}));
        }
    }

    if (primary_key) {
        primary_meanings_.insert(*primary_key);
    }
    out_[from].insert(key);
    in_[to].insert(key);
    edges_.emplace(key, Edge{std::move(from), std::move(to),
                             std::move(data), std::move(extra)});
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool Graph::HasNode(const std::string& id) const {
    return nodes_.count(id) > 0;
}

const Node* Graph::FindNode(const std::string& id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

std::vector<std::string> Graph::Neighbors(const std::string& id,
                                          std::optional<EdgeKind> kind) const {
    std::set<std::string> ids;
    if (auto it = out_.find(id); it != out_.end()) {
        for (const auto& key : it->second) {
            if (!kind || std::get<2>(key) == *kind) ids.insert(std::get<1>(key));
        }
    }
    if (auto it = in_.find(id); it != in_.end()) {
        for (const auto& key : it->second) {
            if (!kind || std::get<2>(key) == *kind) ids.insert(std::get<0>(key));
        }
    }
    return {ids.begin(), ids.end()};
}

std::optional<EdgeRef> Graph::GetEdge(const std::string& a, const std::string& b,
                                      std::optional<EdgeKind> kind) const {
    auto first_between = [&](const std::string& from,
                             const std::string& to) -> const Edge* {
        auto it = out_.find(from);
        if (it == out_.end()) return nullptr;
        for (const auto& key : it->second) {
            if (std::get<1>(key) == to && (!kind || std::get<2>(key) == *kind)) {
                return &edges_.at(key);
            }
        }
        return nullptr;
    };

    if (const Edge* e = first_between(a, b)) {
        return EdgeRef{e, false};
    }
    if (const Edge* e = first_between(b, a)) {
        return EdgeRef{e, true};
    }
    return std::nullopt;
}

const Edge* Graph::FindEdge(const std::string& from, const std::string& to,
                            EdgeKind kind) const {
    auto it = edges_.find(EdgeKey{from, to, kind});
    return it == edges_.end() ? nullptr : &it->second;
}

std::vector<const Edge*> Graph::OutEdges(const std::string& id,
                                         std::optional<EdgeKind> kind) const {
    std::vector<const Edge*> result;
    if (auto it = out_.find(id); it != out_.end()) {
        for (const auto& key : it->second) {
            if (!kind || std::get<2>(key) == *kind) result.push_back(&edges_.at(key));
        }
    }
    return result;
}

std::vector<const Edge*> Graph::InEdges(const std::string& id,
                                        std::optional<EdgeKind> kind) const {
    std::vector<const Edge*> result;
    if (auto it = in_.find(id); it != in_.end()) {
        for (const auto& key : it->second) {
            if (!kind || std::get<2>(key) == *kind) result.push_back(&edges_.at(key));
        }
    }
    return result;
}

std::vector<const Node*> Graph::NodesOfKind(NodeKind kind) const {
    std::vector<const Node*> result;
    for (const auto& [id, node] : nodes_) {
        if (node.Kind() == kind) result.push_back(&node);
    }
    return result;
}

std::vector<const Edge*> Graph::Edges() const {
    std::vector<const Edge*> result;
    result.reserve(edges_.size());
    for (const auto& [key, edge] : edges_) {
        result.push_back(&edge);
    }
    return result;
}

bool Graph::operator==(const Graph& other) const {
    return directed_ == other.directed_ &&
           nodes_ == other.nodes_ &&
           edges_ == other.edges_;
}

} // namespace catalog_graph
