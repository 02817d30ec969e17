#pragma once

#include <catalog_graph/core/deadline.hpp>
#include <catalog_graph/core/result.hpp>
#include <catalog_graph/graph/graph_model.hpp>

#include <memory>
#include <string>
#include <vector>

namespace catalog_graph {

// One hop of a join path. `forward` is false when the hop runs against the
// stored relationship (the catalog edge is to -> from), so the owner of
// `join_column` stays recoverable.
struct JoinStep {
    std::string from;
    std::string to;
    std::string relationship_kind;
    std::string join_column;
    double weight = 1.0;
    bool forward = true;
    Attributes extra;

    bool operator==(const JoinStep& o) const {
        return from == o.from && to == o.to &&
               relationship_kind == o.relationship_kind &&
               join_column == o.join_column && weight == o.weight &&
               forward == o.forward && extra == o.extra;
    }
};

// ---------------------------------------------------------------------------
// JoinPathResolver: cheapest join path between two tables.
//
// JOIN edges are traversable in both directions with their weight as cost.
// Among equal-cost paths the lexicographically smallest table sequence wins,
// computed from the smaller endpoint name, so Resolve(a, b) is exactly the
// reverse of Resolve(b, a). Between two tables joined both ways the cheaper
// edge is used; on equal weight, the one whose `from` sorts first.
//
// Holds a graph snapshot; safe to call from several threads.
// ---------------------------------------------------------------------------
class JoinPathResolver {
public:
    explicit JoinPathResolver(std::shared_ptr<const Graph> schema);

    /// Ordered steps from `source` to `target`; empty when they are equal.
    /// UnknownNode when a table is absent, NoPath when disconnected.
    [[nodiscard]] Result<std::vector<JoinStep>, Error> Resolve(
        const std::string& source, const std::string& target,
        const Deadline& deadline = {}) const;

    /// Total cost of a resolved path.
    [[nodiscard]] static double PathCost(const std::vector<JoinStep>& steps);

private:
    std::shared_ptr<const Graph> graph_;
};

} // namespace catalog_graph
