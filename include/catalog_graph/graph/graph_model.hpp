#pragma once

#include <catalog_graph/core/result.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

namespace catalog_graph {

using Attributes = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// Node kinds
// ---------------------------------------------------------------------------

struct TableNode {
    std::string name;
    std::string kind;         // "fact", "dimension", "staging", ...
    std::string description;
    bool operator==(const TableNode& o) const {
        return name == o.name && kind == o.kind && description == o.description;
    }
};

struct FieldNode {
    std::string table;
    std::string column;
    bool operator==(const FieldNode& o) const {
        return table == o.table && column == o.column;
    }
};

struct IntentNode {
    std::string name;
    std::string description;
    bool operator==(const IntentNode& o) const {
        return name == o.name && description == o.description;
    }
};

struct PerspectiveNode {
    std::string name;
    std::string description;
    bool operator==(const PerspectiveNode& o) const {
        return name == o.name && description == o.description;
    }
};

struct ConceptNode {
    std::string name;
    std::string description;
    bool operator==(const ConceptNode& o) const {
        return name == o.name && description == o.description;
    }
};

// Index order matches NodeKind.
using NodeData = std::variant<TableNode, FieldNode, IntentNode,
                              PerspectiveNode, ConceptNode>;

enum class NodeKind { Table, Field, Intent, Perspective, Concept };

[[nodiscard]] const char* NodeKindName(NodeKind kind);
[[nodiscard]] std::optional<NodeKind> ParseNodeKind(std::string_view name);

struct Node {
    std::string id;
    NodeData data;
    Attributes extra;

    [[nodiscard]] NodeKind Kind() const {
        return static_cast<NodeKind>(data.index());
    }
    /// Display name: the table, intent, perspective or concept name, or
    /// `table.column` for fields.
    [[nodiscard]] std::string Name() const;

    bool operator==(const Node& o) const {
        return id == o.id && data == o.data && extra == o.extra;
    }
};

// Node id conventions. Table ids are bare table names.
[[nodiscard]] std::string TableId(const std::string& table);
[[nodiscard]] std::string FieldId(const std::string& table, const std::string& column);
[[nodiscard]] std::string IntentId(const std::string& name);
[[nodiscard]] std::string PerspectiveId(const std::string& name);
[[nodiscard]] std::string ConceptId(const std::string& name);

// ---------------------------------------------------------------------------
// Edge kinds
// ---------------------------------------------------------------------------

enum class Polarity { Elevates, Suppresses, Neutral };

[[nodiscard]] const char* PolarityName(Polarity polarity);
[[nodiscard]] std::optional<Polarity> ParsePolarity(std::string_view name);

// Smallest accepted join weight. Path costs are compared with a relative
// tolerance, which needs every step to be clearly above rounding noise.
constexpr double kMinJoinWeight = 1e-6;

// Table -> Table. Enrichment (join_column_description,
// natural_language_alias, example_query, context) lives in Edge::extra.
struct JoinEdge {
    std::string relationship_kind;
    std::string join_column;
    double weight = 1.0;
    bool operator==(const JoinEdge& o) const {
        return relationship_kind == o.relationship_kind &&
               join_column == o.join_column && weight == o.weight;
    }
};

// Intent -> Perspective.
struct OperatesWithinEdge {
    double weight = 1.0;
    bool operator==(const OperatesWithinEdge& o) const { return weight == o.weight; }
};

// Perspective -> Concept.
struct UsesDefinitionEdge {
    bool operator==(const UsesDefinitionEdge&) const { return true; }
};

// Field -> Concept.
struct CanMeanEdge {
    bool is_primary = false;
    std::string table_alias;
    bool operator==(const CanMeanEdge& o) const {
        return is_primary == o.is_primary && table_alias == o.table_alias;
    }
};

// Perspective -> Concept (weight in [0, 1]) or Intent -> Concept
// (weight in {-1, 0, +1}).
struct InfluenceEdge {
    Polarity polarity = Polarity::Neutral;
    double weight = 0.0;
    bool operator==(const InfluenceEdge& o) const {
        return polarity == o.polarity && weight == o.weight;
    }
};

// Index order matches EdgeKind.
using EdgeData = std::variant<JoinEdge, OperatesWithinEdge, UsesDefinitionEdge,
                              CanMeanEdge, InfluenceEdge>;

enum class EdgeKind { Join, OperatesWithin, UsesDefinition, CanMean, Influence };

[[nodiscard]] const char* EdgeKindName(EdgeKind kind);
[[nodiscard]] std::optional<EdgeKind> ParseEdgeKind(std::string_view name);

struct Edge {
    std::string from;
    std::string to;
    EdgeData data;
    Attributes extra;

    [[nodiscard]] EdgeKind Kind() const {
        return static_cast<EdgeKind>(data.index());
    }
    /// Relationship label: the influence polarity for Influence edges,
    /// otherwise the kind name.
    [[nodiscard]] std::string Label() const;

    bool operator==(const Edge& o) const {
        return from == o.from && to == o.to && data == o.data && extra == o.extra;
    }
};

// Result of an orientation-agnostic lookup. `reversed` is true when the
// stored edge runs b -> a for a query GetEdge(a, b).
struct EdgeRef {
    const Edge* edge = nullptr;
    bool reversed = false;
};

// ---------------------------------------------------------------------------
// Graph: typed nodes and attributed edges, append-only.
//
// Insertion enforces: unique node ids, existing endpoints, one edge per
// (from, to, kind), edge kind matching the endpoint kinds, weight bounds, and
// at most one primary CAN_MEAN edge per (concept, table). An undirected graph
// also rejects the mirrored copy of an existing edge; a reverse edge with
// different attributes is kept beside it with its own orientation.
//
// Adjacency is kept in ordered containers, so every enumeration is sorted.
// ---------------------------------------------------------------------------
class Graph {
public:
    explicit Graph(bool directed = true) : directed_(directed) {}

    Result<void, Error> AddNode(std::string id, NodeData data,
                                Attributes extra = {});
    Result<void, Error> AddEdge(std::string from, std::string to,
                                EdgeData data, Attributes extra = {});

    [[nodiscard]] bool HasNode(const std::string& id) const;
    [[nodiscard]] const Node* FindNode(const std::string& id) const;

    /// Ids adjacent to `id` in either direction, ascending. With `kind`,
    /// only edges of that kind count. Unknown ids have no neighbors.
    [[nodiscard]] std::vector<std::string> Neighbors(
        const std::string& id, std::optional<EdgeKind> kind = std::nullopt) const;

    /// The edge a -> b, else b -> a. With several kinds on one pair, the
    /// first in EdgeKind order wins unless `kind` narrows the lookup.
    [[nodiscard]] std::optional<EdgeRef> GetEdge(
        const std::string& a, const std::string& b,
        std::optional<EdgeKind> kind = std::nullopt) const;

    /// Exact directed lookup.
    [[nodiscard]] const Edge* FindEdge(const std::string& from,
                                       const std::string& to,
                                       EdgeKind kind) const;

    [[nodiscard]] std::vector<const Edge*> OutEdges(
        const std::string& id, std::optional<EdgeKind> kind = std::nullopt) const;
    [[nodiscard]] std::vector<const Edge*> InEdges(
        const std::string& id, std::optional<EdgeKind> kind = std::nullopt) const;

    [[nodiscard]] const std::map<std::string, Node>& Nodes() const { return nodes_; }
    /// All nodes of one kind, in id order.
    [[nodiscard]] std::vector<const Node*> NodesOfKind(NodeKind kind) const;
    /// All edges ordered by (from, to, kind).
    [[nodiscard]] std::vector<const Edge*> Edges() const;

    [[nodiscard]] size_t NodeCount() const { return nodes_.size(); }
    [[nodiscard]] size_t EdgeCount() const { return edges_.size(); }
    [[nodiscard]] bool IsDirected() const { return directed_; }

    bool operator==(const Graph& other) const;
    bool operator!=(const Graph& other) const { return !(*this == other); }

private:
    using EdgeKey = std::tuple<std::string, std::string, EdgeKind>;

    Result<void, Error> ValidateEdge(const Node& from, const Node& to,
                                     const EdgeData& data) const;

    bool directed_;
    std::map<std::string, Node> nodes_;
    std::map<EdgeKey, Edge> edges_;
    std::map<std::string, std::set<EdgeKey>> out_;
    std::map<std::string, std::set<EdgeKey>> in_;
    // (concept id, table) pairs that already carry a primary CAN_MEAN edge.
    std::set<std::pair<std::string, std::string>> primary_meanings_;
};

} // namespace catalog_graph
