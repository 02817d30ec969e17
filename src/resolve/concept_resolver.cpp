#include <catalog_graph/resolve/concept_resolver.hpp>

#include <catalog_graph/core/log.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>

namespace catalog_graph {

namespace {

constexpr const char* kOperation = "ConceptResolver::Resolve";
constexpr const char* kRankOperation = "ConceptResolver::RankIntents";

// Scores compare at nine decimal places, so sums such as 0.1 + 0.2 and 0.3
// tie while the ranking stays a strict weak ordering.
long long ScoreKey(double score) {
    return std::llround(score * 1e9);
}

bool ScoresEqual(double a, double b) {
    return ScoreKey(a) == ScoreKey(b);
}

std::string FormatWeight(double w) {
    std::ostringstream oss;
    oss << w;
    return oss.str();
}

bool RanksBefore(const ScoredConcept& a, const ScoredConcept& b) {
    const auto sa = ScoreKey(a.score);
    const auto sb = ScoreKey(b.score);
    if (sa != sb) {
        return sa > sb;
    }
    auto ka = a.TieBreakKey();
    auto kb = b.TieBreakKey();
    if (ka != kb) {
        return ka < kb;
    }
    return a.concept_name < b.concept_name;
}

struct Elevation {
    double weight = 0.0;
    const Edge* operates_within = nullptr;
    const Edge* influence = nullptr;
};

// Strongest elevation of `concept_id` through the perspectives `intent_id`
// engages with positive weight. Perspectives are visited in id order and
// only a strictly larger weight displaces the current best.
Elevation PerspectiveElevation(const Graph& graph, const std::string& intent_id,
                               const std::string& concept_id) {
    Elevation best;
    for (const Edge* ow : graph.OutEdges(intent_id, EdgeKind::OperatesWithin)) {
        if (std::get<OperatesWithinEdge>(ow->data).weight <= 0.0) continue;
        const auto& perspective = ow->to;
        if (graph.FindEdge(perspective, concept_id, EdgeKind::UsesDefinition) == nullptr) {
            continue;
        }
        const Edge* influence = graph.FindEdge(perspective, concept_id, EdgeKind::Influence);
        if (influence == nullptr) continue;
        double w = std::get<InfluenceEdge>(influence->data).weight;
        if (best.influence == nullptr || w > best.weight) {
            best = Elevation{w, ow, influence};
        }
    }
    return best;
}

// Whether a perspective the intent engages with positive weight
// USES_DEFINITION the concept.
bool EngagedDefinition(const Graph& graph, const std::string& intent_id,
                       const std::string& concept_id) {
    for (const Edge* ow : graph.OutEdges(intent_id, EdgeKind::OperatesWithin)) {
        if (std::get<OperatesWithinEdge>(ow->data).weight <= 0.0) continue;
        if (graph.FindEdge(ow->to, concept_id, EdgeKind::UsesDefinition) != nullptr) {
            return true;
        }
    }
    return false;
}

// Tables, other than `resolved_table`, with a field that CAN_MEAN a concept
// the intent elevates directly.
std::vector<std::string> SuggestedJoins(const Graph& graph, const std::string& intent_id,
                                        const std::string& resolved_table) {
    std::set<std::string> tables;
    for (const Edge* direct : graph.OutEdges(intent_id, EdgeKind::Influence)) {
        if (std::get<InfluenceEdge>(direct->data).weight <= 0.0) continue;
        for (const Edge* can_mean : graph.InEdges(direct->to, EdgeKind::CanMean)) {
            const auto& f = std::get<FieldNode>(graph.FindNode(can_mean->from)->data);
            if (f.table != resolved_table) tables.insert(f.table);
        }
    }
    return {tables.begin(), tables.end()};
}

std::string DescribeWinner(const std::string& intent_name, const ScoredConcept& winner,
                           const Elevation& elevation, const Edge* intent_edge,
                           const ScoredConcept* runner_up, bool tie_broken) {
    std::ostringstream out;
    out << "Intent '" << intent_name << "' resolves to " << winner.concept_name
        << " (score " << FormatWeight(winner.score) << ")";
    if (elevation.influence != nullptr) {
        out << "; OPERATES_WITHIN "
            << winner.deciding_perspective.value_or(std::string()) << " (weight "
            << FormatWeight(std::get<OperatesWithinEdge>(elevation.operates_within->data).weight)
            << "), which " << elevation.influence->Label() << " " << winner.concept_name
            << " (elevation " << FormatWeight(elevation.weight) << ")";
    } else {
        out << "; no engaged perspective elevates it";
    }
    if (intent_edge != nullptr) {
        out << "; intent " << intent_edge->Label() << " " << winner.concept_name
            << " directly (weight "
            << FormatWeight(std::get<InfluenceEdge>(intent_edge->data).weight) << ")";
    }
    if (runner_up != nullptr) {
        out << "; runner-up " << runner_up->concept_name << " (score "
            << FormatWeight(runner_up->score) << ")";
    }
    if (tie_broken) {
        out << "; tie broken on table alias '" << winner.TieBreakKey()
            << "' then concept name";
    }
    return out.str();
}

} // anonymous namespace

std::string ScoredConcept::TieBreakKey() const {
    std::optional<std::string> best;
    for (const auto& f : fields) {
        const auto& key = f.table_alias.empty() ? f.table : f.table_alias;
        if (!best || key < *best) best = key;
    }
    return best.value_or(std::string());
}

ConceptResolver::ConceptResolver(std::shared_ptr<const Graph> semantic)
    : graph_(std::move(semantic)) {}

Result<ConceptResolution, Error> ConceptResolver::Resolve(
    const std::string& intent, const std::string& field,
    const std::optional<std::string>& table_scope,
    const Deadline& deadline) const {
    using R = Result<ConceptResolution, Error>;
    const Graph& graph = *graph_;
    const auto subject = intent + " / " +
                         (table_scope ? *table_scope + "." : std::string()) + field;

    if (auto c = deadline.Check(kOperation, subject); c.IsErr()) {
        return R::Err(c.Error());
    }

    const auto intent_id = IntentId(intent);
    const Node* intent_node = graph.FindNode(intent_id);
    if (intent_node == nullptr || intent_node->Kind() != NodeKind::Intent) {
        return R::Err(MakeError(ErrorCategory::UnknownNode, kOperation, subject,
                                "Unknown intent", {intent}));
    }

    // -- Candidates ---------------------------------------------------------

    std::map<std::string, ScoredConcept> by_concept;   // keyed by concept id
    for (const Node* node : graph.NodesOfKind(NodeKind::Field)) {
        const auto& f = std::get<FieldNode>(node->data);
        if (f.column != field) continue;
        if (table_scope && f.table != *table_scope) continue;
        for (const Edge* e : graph.OutEdges(node->id, EdgeKind::CanMean)) {
            const auto& can_mean = std::get<CanMeanEdge>(e->data);
            auto& scored = by_concept[e->to];
            if (scored.concept_name.empty()) {
                scored.concept_name = graph.FindNode(e->to)->Name();
            }
            scored.fields.push_back(CandidateField{f.table, f.column,
                                                   can_mean.table_alias,
                                                   can_mean.is_primary});
        }
    }
    if (by_concept.empty()) {
        std::vector<std::string> details{field};
        if (table_scope) details.push_back(*table_scope);
        return R::Err(MakeError(ErrorCategory::NoApplicableConcept, kOperation, subject,
                                "No concept is mapped to this field", std::move(details)));
    }

    // -- Scoring ------------------------------------------------------------

    std::map<std::string, Elevation> elevations;
    std::map<std::string, const Edge*> intent_edges;
    std::set<std::string> elevated;
    std::set<std::string> suppressed;
    auto note_polarity = [&](const Edge* edge, const std::string& name) {
        auto polarity = std::get<InfluenceEdge>(edge->data).polarity;
        if (polarity == Polarity::Elevates) elevated.insert(name);
        if (polarity == Polarity::Suppresses) suppressed.insert(name);
    };

    std::vector<ScoredConcept> ranked;
    for (auto& [concept_id, scored] : by_concept) {
        auto elevation = PerspectiveElevation(graph, intent_id, concept_id);
        const Edge* direct = graph.FindEdge(intent_id, concept_id, EdgeKind::Influence);

        scored.perspective_elevation = elevation.influence ? elevation.weight : 0.0;
        scored.intent_weight = direct ? std::get<InfluenceEdge>(direct->data).weight : 0.0;
        scored.score = scored.perspective_elevation + scored.intent_weight;
        if (elevation.operates_within != nullptr) {
            scored.deciding_perspective =
                graph.FindNode(elevation.operates_within->to)->Name();
            note_polarity(elevation.influence, scored.concept_name);
        }
        if (direct != nullptr) {
            note_polarity(direct, scored.concept_name);
        }
        std::sort(scored.fields.begin(), scored.fields.end(),
                  [](const CandidateField& a, const CandidateField& b) {
                      return a.table < b.table;
                  });

        elevations[scored.concept_name] = elevation;
        intent_edges[scored.concept_name] = direct;
        ranked.push_back(scored);
    }
    std::sort(ranked.begin(), ranked.end(), RanksBefore);

    const ScoredConcept& winner = ranked.front();
    const ScoredConcept* runner_up = ranked.size() > 1 ? &ranked[1] : nullptr;
    const bool tie_broken = runner_up != nullptr &&
                            ScoresEqual(winner.score, runner_up->score);

    // -- Table choice -------------------------------------------------------

    const CandidateField* chosen = nullptr;
    if (winner.fields.size() == 1) {
        chosen = &winner.fields.front();
    } else {
        std::vector<const CandidateField*> primaries;
        for (const auto& f : winner.fields) {
            if (f.is_primary) primaries.push_back(&f);
        }
        if (primaries.size() != 1) {
            std::vector<std::string> details{winner.concept_name};
            for (const auto& f : winner.fields) {
                details.push_back(f.table + "." + f.column +
                                  (f.is_primary ? " (primary)" : ""));
            }
            return R::Err(MakeError(
                ErrorCategory::AmbiguousResolution, kOperation, subject,
                primaries.empty()
                    ? "Concept maps to several tables and none is marked primary"
                    : "Concept maps to several tables marked primary",
                std::move(details)));
        }
        chosen = primaries.front();
    }

    ConceptResolution resolution;
    resolution.intent = intent;
    resolution.field = field;
    resolution.table_scope = table_scope;
    resolution.concept_name = winner.concept_name;
    resolution.table = chosen->table;
    resolution.column = chosen->column;
    resolution.table_alias = chosen->table_alias;
    resolution.score = winner.score;
    resolution.deciding_perspective = winner.deciding_perspective;
    resolution.deciding_intent_weight = winner.intent_weight;
    resolution.tie_broken = tie_broken;
    resolution.rationale = DescribeWinner(intent, winner,
                                          elevations[winner.concept_name],
                                          intent_edges[winner.concept_name],
                                          runner_up, tie_broken);
    resolution.elevated.assign(elevated.begin(), elevated.end());
    resolution.suppressed.assign(suppressed.begin(), suppressed.end());
    resolution.suggested_joins = SuggestedJoins(graph, intent_id, chosen->table);
    resolution.candidates = std::move(ranked);

    LogDebug("resolve", resolution.rationale);
    return R::Ok(std::move(resolution));
}

Result<std::vector<IntentComparison>, Error> ConceptResolver::Compare(
    const std::string& field, const std::optional<std::string>& table_scope,
    const Deadline& deadline) const {
    using R = Result<std::vector<IntentComparison>, Error>;

    std::vector<IntentComparison> comparisons;
    for (const Node* node : graph_->NodesOfKind(NodeKind::Intent)) {
        const auto name = node->Name();
        auto result = Resolve(name, field, table_scope, deadline);
        if (result.IsErr()) {
            if (result.Error().category == ErrorCategory::Cancelled) {
                return R::Err(std::move(result).Error());
            }
            comparisons.push_back(IntentComparison{name, std::nullopt,
                                                   std::move(result).Error()});
        } else {
            comparisons.push_back(IntentComparison{name, std::move(result).Value(),
                                                   std::nullopt});
        }
    }
    return R::Ok(std::move(comparisons));
}

Result<std::vector<IntentScore>, Error> ConceptResolver::RankIntents(
    const std::vector<std::pair<std::string, std::string>>& fields,
    const Deadline& deadline) const {
    using R = Result<std::vector<IntentScore>, Error>;
    const Graph& graph = *graph_;
    const auto subject = std::to_string(fields.size()) + " field(s)";

    if (auto c = deadline.Check(kRankOperation, subject); c.IsErr()) {
        return R::Err(c.Error());
    }

    std::vector<std::string> unknown;
    for (const auto& [table, column] : fields) {
        const Node* node = graph.FindNode(FieldId(table, column));
        if (node == nullptr || node->Kind() != NodeKind::Field) {
            unknown.push_back(table + "." + column);
        }
    }
    if (!unknown.empty()) {
        return R::Err(MakeError(ErrorCategory::UnknownNode, kRankOperation, subject,
                                "Field is not in the semantic graph", std::move(unknown)));
    }

    std::vector<IntentScore> scores;
    for (const Node* intent : graph.NodesOfKind(NodeKind::Intent)) {
        if (auto c = deadline.Check(kRankOperation, subject); c.IsErr()) {
            return R::Err(c.Error());
        }

        IntentScore score;
        score.intent = intent->Name();
        double total_weight = 0.0;
        for (const auto& [table, column] : fields) {
            // First matching concept in id order counts for the field.
            for (const Edge* can_mean : graph.OutEdges(FieldId(table, column),
                                                       EdgeKind::CanMean)) {
                const Edge* direct =
                    graph.FindEdge(intent->id, can_mean->to, EdgeKind::Influence);
                if (direct == nullptr) continue;
                double w = std::get<InfluenceEdge>(direct->data).weight;
                if (w <= 0.0 || !EngagedDefinition(graph, intent->id, can_mean->to)) {
                    continue;
                }
                score.matched_fields.push_back(table + "." + column);
                score.matched_concepts.push_back(graph.FindNode(can_mean->to)->Name());
                total_weight += w;
                break;
            }
        }
        if (score.matched_fields.empty()) continue;

        const auto matched = static_cast<double>(score.matched_fields.size());
        const double average = total_weight / matched;
        score.confidence = matched / static_cast<double>(fields.size()) * average;

        std::ostringstream why;
        why << "Matched " << score.matched_fields.size() << "/" << fields.size()
            << " fields with average weight " << std::fixed << std::setprecision(2)
            << average;
        score.explanation = why.str();
        scores.push_back(std::move(score));
    }

    std::sort(scores.begin(), scores.end(), [](const IntentScore& a, const IntentScore& b) {
        const auto ka = ScoreKey(a.confidence);
        const auto kb = ScoreKey(b.confidence);
        if (ka != kb) return ka > kb;
        return a.intent < b.intent;
    });

    LogDebug("resolve", "ranked " + std::to_string(scores.size()) + " intent(s) for " +
                            subject);
    return R::Ok(std::move(scores));
}

} // namespace catalog_graph
