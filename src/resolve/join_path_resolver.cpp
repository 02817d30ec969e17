#include <catalog_graph/resolve/join_path_resolver.hpp>

#include <catalog_graph/core/log.hpp>

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <map>
#include <queue>

namespace catalog_graph {

namespace {

constexpr const char* kOperation = "JoinPathResolver::Resolve";
constexpr double kRelativeEpsilon = 1e-9;
constexpr double kInfinity = std::numeric_limits<double>::infinity();

bool CostsEqual(double a, double b) {
    return std::fabs(a - b) <= kRelativeEpsilon * std::max(std::fabs(a), std::fabs(b));
}

// The JOIN edge used to traverse between u and v in either direction.
const Edge* BestJoinEdge(const Graph& graph, const std::string& u,
                         const std::string& v) {
    const Edge* uv = graph.FindEdge(u, v, EdgeKind::Join);
    const Edge* vu = graph.FindEdge(v, u, EdgeKind::Join);
    if (uv == nullptr) return vu;
    if (vu == nullptr) return uv;
    double wuv = std::get<JoinEdge>(uv->data).weight;
    double wvu = std::get<JoinEdge>(vu->data).weight;
    if (!CostsEqual(wuv, wvu)) {
        return wuv < wvu ? uv : vu;
    }
    return uv->from < vu->from ? uv : vu;
}

double JoinWeight(const Edge* edge) {
    return std::get<JoinEdge>(edge->data).weight;
}

// Distances from `origin` over the undirected JOIN projection.
Result<std::map<std::string, double>, Error> ShortestDistances(
    const Graph& graph, const std::string& origin, const Deadline& deadline) {
    using R = Result<std::map<std::string, double>, Error>;
    using Entry = std::pair<double, std::string>;

    std::map<std::string, double> dist;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> frontier;
    dist[origin] = 0.0;
    frontier.emplace(0.0, origin);

    size_t pops = 0;
    while (!frontier.empty()) {
        auto [d, u] = frontier.top();
        frontier.pop();
        if (++pops % 256 == 0) {
            if (auto c = deadline.Check(kOperation, origin); c.IsErr()) {
                return R::Err(c.Error());
            }
        }
        if (d > dist[u]) continue;

        for (const auto& v : graph.Neighbors(u, EdgeKind::Join)) {
            if (v == u) continue;
            double nd = d + JoinWeight(BestJoinEdge(graph, u, v));
            auto it = dist.find(v);
            if (it == dist.end() || nd < it->second) {
                dist[v] = nd;
                frontier.emplace(nd, v);
            }
        }
    }
    return R::Ok(std::move(dist));
}

std::vector<std::string> TableRoles(const Graph& graph, const std::string& source,
                                    const std::string& target) {
    std::vector<std::string> missing;
    for (const auto& id : {source, target}) {
        const Node* node = graph.FindNode(id);
        if (node == nullptr || node->Kind() != NodeKind::Table) {
            if (std::find(missing.begin(), missing.end(), id) == missing.end()) {
                missing.push_back(id);
            }
        }
    }
    return missing;
}

} // anonymous namespace

JoinPathResolver::JoinPathResolver(std::shared_ptr<const Graph> schema)
    : graph_(std::move(schema)) {}

double JoinPathResolver::PathCost(const std::vector<JoinStep>& steps) {
    double cost = 0.0;
    for (const auto& step : steps) cost += step.weight;
    return cost;
}

Result<std::vector<JoinStep>, Error> JoinPathResolver::Resolve(
    const std::string& source, const std::string& target,
    const Deadline& deadline) const {
    using R = Result<std::vector<JoinStep>, Error>;
    const auto subject = source + " -> " + target;

    if (auto c = deadline.Check(kOperation, subject); c.IsErr()) {
        return R::Err(c.Error());
    }

    auto missing = TableRoles(*graph_, source, target);
    if (!missing.empty()) {
        return R::Err(MakeError(ErrorCategory::UnknownNode, kOperation, subject,
                                "Table is not in the schema graph", std::move(missing)));
    }
    if (source == target) {
        return R::Ok(std::vector<JoinStep>{});
    }

    // Canonical orientation: search from the smaller name to the larger.
    const bool flipped = target < source;
    const std::string& first = flipped ? target : source;
    const std::string& last = flipped ? source : target;

    auto dist_result = ShortestDistances(*graph_, last, deadline);
    if (dist_result.IsErr()) return R::Err(std::move(dist_result).Error());
    const auto& dist = dist_result.Value();

    if (dist.count(first) == 0) {
        return R::Err(MakeError(ErrorCategory::NoPath, kOperation, subject,
                                "Tables are not connected by any join path",
                                {source, target}));
    }

    // Walk from `first`, always taking the smallest neighbor that is strictly
    // closer to `last` and stays on a shortest path to it.
    std::vector<JoinStep> steps;
    std::string current = first;
    const size_t max_steps = graph_->NodeCount();
    while (current != last) {
        if (steps.size() > max_steps) {
            return R::Err(MakeError(ErrorCategory::Internal, kOperation, subject,
                                    "Shortest path walk did not terminate"));
        }
        const double here = dist.at(current);
        const Edge* chosen = nullptr;
        std::string next;
        for (const auto& v : graph_->Neighbors(current, EdgeKind::Join)) {
            auto it = dist.find(v);
            if (v == current || it == dist.end() || !(it->second < here)) continue;
            const Edge* edge = BestJoinEdge(*graph_, current, v);
            if (CostsEqual(JoinWeight(edge) + it->second, here)) {
                chosen = edge;
                next = v;
                break;
            }
        }
        if (chosen == nullptr) {
            return R::Err(MakeError(ErrorCategory::Internal, kOperation, subject,
                                    "No shortest-path successor for " + current));
        }
        const auto& join = std::get<JoinEdge>(chosen->data);
        steps.push_back(JoinStep{current, next, join.relationship_kind,
                                 join.join_column, join.weight,
                                 chosen->from == current, chosen->extra});
        current = next;
    }

    if (flipped) {
        std::reverse(steps.begin(), steps.end());
        for (auto& step : steps) {
            std::swap(step.from, step.to);
            step.forward = !step.forward;
        }
    }

    LogDebug("resolve", "join path " + subject + ": " +
                            std::to_string(steps.size()) + " step(s), cost " +
                            std::to_string(PathCost(steps)));
    return R::Ok(std::move(steps));
}

} // namespace catalog_graph
