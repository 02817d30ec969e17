#pragma once

#include <catalog_graph/core/deadline.hpp>
#include <catalog_graph/core/result.hpp>
#include <catalog_graph/graph/graph_model.hpp>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace catalog_graph {

// A field that CAN_MEAN a candidate concept.
struct CandidateField {
    std::string table;
    std::string column;
    std::string table_alias;
    bool is_primary = false;
};

struct ScoredConcept {
    std::string concept_name;
    double score = 0.0;
    double perspective_elevation = 0.0;
    double intent_weight = 0.0;
    std::optional<std::string> deciding_perspective;
    std::vector<CandidateField> fields;   // ordered by table

    /// Smallest table alias among the fields, or the table name where the
    /// alias is empty. Used to break score ties.
    [[nodiscard]] std::string TieBreakKey() const;
};

struct ConceptResolution {
    std::string intent;
    std::string field;
    std::optional<std::string> table_scope;

    std::string concept_name;
    std::string table;
    std::string column;
    std::string table_alias;
    double score = 0.0;
    std::optional<std::string> deciding_perspective;
    double deciding_intent_weight = 0.0;
    std::string rationale;

    std::vector<ScoredConcept> candidates;   // ranked, winner first
    std::vector<std::string> elevated;       // concept names
    std::vector<std::string> suppressed;
    /// Other tables holding fields of concepts the intent elevates directly,
    /// ascending. Candidates for joining into the same query.
    std::vector<std::string> suggested_joins;
    bool tie_broken = false;
};

// How well an intent explains a set of fields.
struct IntentScore {
    std::string intent;
    double confidence = 0.0;                   // matched/total * average weight
    std::vector<std::string> matched_fields;   // "table.column", input order
    std::vector<std::string> matched_concepts; // parallel to matched_fields
    std::string explanation;
};

// Resolution of one field under one intent; exactly one of the two is set.
struct IntentComparison {
    std::string intent;
    std::optional<ConceptResolution> resolution;
    std::optional<Error> error;
};

// ---------------------------------------------------------------------------
// ConceptResolver: decides which concept an ambiguous field name means
// under an analytical intent.
//
// score(C) = perspective_elevation(C) + intent_direct_weight(C)
//
// perspective_elevation is the largest Influence weight toward C from a
// perspective the intent OPERATES_WITHIN (weight > 0) that also
// USES_DEFINITION C; 0 when there is none. intent_direct_weight is the
// weight of a direct Intent -> C Influence edge, else 0.
//
// Holds a graph snapshot; safe to call from several threads.
// ---------------------------------------------------------------------------
class ConceptResolver {
public:
    explicit ConceptResolver(std::shared_ptr<const Graph> semantic);

    [[nodiscard]] Result<ConceptResolution, Error> Resolve(
        const std::string& intent, const std::string& field,
        const std::optional<std::string>& table_scope = std::nullopt,
        const Deadline& deadline = {}) const;

    /// Resolve `field` under every intent, in intent-name order. Failures
    /// are reported per intent.
    [[nodiscard]] Result<std::vector<IntentComparison>, Error> Compare(
        const std::string& field,
        const std::optional<std::string>& table_scope = std::nullopt,
        const Deadline& deadline = {}) const;

    /// Rank intents by how many of `fields` ((table, column) pairs) they
    /// elevate. A field matches an intent through a concept it CAN_MEAN that
    /// the intent elevates directly and that an engaged perspective
    /// USES_DEFINITION. Intents matching nothing are left out; the rest are
    /// ordered by confidence, then name. UnknownNode lists fields missing
    /// from the graph.
    [[nodiscard]] Result<std::vector<IntentScore>, Error> RankIntents(
        const std::vector<std::pair<std::string, std::string>>& fields,
        const Deadline& deadline = {}) const;

private:
    std::shared_ptr<const Graph> graph_;
};

} // namespace catalog_graph
