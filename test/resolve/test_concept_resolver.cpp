#include <catch2/catch_test_macros.hpp>

#include <catalog_graph/catalog/catalog_loader.hpp>
#include <catalog_graph/resolve/concept_resolver.hpp>

#include "../mocks/catalog_fixture.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace catalog_graph;

namespace {

std::shared_ptr<const Graph> FixtureSemantic() {
    auto reader = testing::FixtureCatalog();
    auto semantic = BuildSemanticGraph(*reader);
    REQUIRE(semantic.IsOk());
    return std::make_shared<const Graph>(std::move(semantic).Value());
}

// Small semantic graphs built in code.
class SemanticBuilder {
public:
    SemanticBuilder& Intent(const std::string& name) {
        Add(IntentId(name), IntentNode{name, ""});
        return *this;
    }
    SemanticBuilder& Perspective(const std::string& name) {
        Add(PerspectiveId(name), PerspectiveNode{name, ""});
        return *this;
    }
    SemanticBuilder& Concept(const std::string& name) {
        Add(ConceptId(name), ConceptNode{name, ""});
        return *this;
    }
    SemanticBuilder& Field(const std::string& table, const std::string& column,
                           const std::string& concept_name, bool primary,
                           const std::string& alias = "") {
        if (!graph_->HasNode(FieldId(table, column))) {
            Add(FieldId(table, column), FieldNode{table, column});
        }
        REQUIRE(graph_->AddEdge(FieldId(table, column), ConceptId(concept_name),
                                CanMeanEdge{primary, alias}).IsOk());
        return *this;
    }
    SemanticBuilder& Within(const std::string& intent, const std::string& perspective,
                            double weight = 1.0) {
        REQUIRE(graph_->AddEdge(IntentId(intent), PerspectiveId(perspective),
                                OperatesWithinEdge{weight}).IsOk());
        return *this;
    }
    SemanticBuilder& Elevate(const std::string& perspective, const std::string& concept_name,
                             double weight) {
        REQUIRE(graph_->AddEdge(PerspectiveId(perspective), ConceptId(concept_name),
                                UsesDefinitionEdge{}).IsOk());
        REQUIRE(graph_->AddEdge(PerspectiveId(perspective), ConceptId(concept_name),
                                InfluenceEdge{weight > 0 ? Polarity::Elevates
                                                         : Polarity::Suppresses,
                                              weight}).IsOk());
        return *this;
    }
    SemanticBuilder& Direct(const std::string& intent, const std::string& concept_name,
                            double weight) {
        Polarity p = weight > 0 ? Polarity::Elevates
                   : weight < 0 ? Polarity::Suppresses : Polarity::Neutral;
        REQUIRE(graph_->AddEdge(IntentId(intent), ConceptId(concept_name),
                                InfluenceEdge{p, weight}).IsOk());
        return *this;
    }
    std::shared_ptr<const Graph> Build() { return graph_; }

private:
    void Add(const std::string& id, NodeData data) {
        REQUIRE(graph_->AddNode(id, std::move(data)).IsOk());
    }
    std::shared_ptr<Graph> graph_ = std::make_shared<Graph>();
};

bool Contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // anonymous namespace

// ===========================================================================
// Catalog scenarios
// ===========================================================================

TEST_CASE("ConceptResolver: quality review reads severity as NCM", "[resolve][concept]") {
    ConceptResolver resolver(FixtureSemantic());
    auto r = resolver.Resolve("quality-review", "severity");
    REQUIRE(r.IsOk());
    const auto& res = r.Value();
    CHECK(res.concept_name == "MATERIAL_NON_CONFORMANCE");
    CHECK(res.table == "non_conformant_materials");
    CHECK(res.column == "severity");
    CHECK(res.table_alias == "ncm");
    CHECK(res.score == 1.0);
    CHECK(res.deciding_perspective == std::optional<std::string>("Quality"));
    CHECK_FALSE(res.tie_broken);
    CHECK(res.elevated == std::vector<std::string>{"MATERIAL_NON_CONFORMANCE"});
    CHECK(res.suppressed == std::vector<std::string>{"PRODUCTION_DEFECT"});

    REQUIRE(res.candidates.size() == 2);
    CHECK(res.candidates[0].concept_name == "MATERIAL_NON_CONFORMANCE");
    CHECK(res.candidates[1].concept_name == "PRODUCTION_DEFECT");
    CHECK(res.candidates[1].score == 0.0);

    CHECK(res.rationale.find("OPERATES_WITHIN Quality") != std::string::npos);
    CHECK(res.rationale.find("runner-up PRODUCTION_DEFECT") != std::string::npos);
}

TEST_CASE("ConceptResolver: cost review reads cost_impact as NCM liability", "[resolve][concept]") {
    ConceptResolver resolver(FixtureSemantic());
    auto r = resolver.Resolve("cost-review", "cost_impact");
    REQUIRE(r.IsOk());
    const auto& res = r.Value();
    CHECK(res.concept_name == "FINANCIAL_LIABILITY_NCM");
    CHECK(res.table == "non_conformant_materials");
    CHECK(res.column == "cost_impact");
    CHECK(res.table != "product_defects");
    CHECK(res.deciding_perspective == std::optional<std::string>("Finance"));
    CHECK(res.deciding_intent_weight == 1.0);
    CHECK(res.score > 1.8);
    CHECK(res.score < 2.0);
}

TEST_CASE("ConceptResolver: the same field resolves differently per intent", "[resolve][concept]") {
    ConceptResolver resolver(FixtureSemantic());
    auto quality = resolver.Resolve("quality-review", "severity");
    auto cost = resolver.Resolve("cost-review", "severity");
    REQUIRE(quality.IsOk());
    REQUIRE(cost.IsOk());
    CHECK(quality.Value().table == "non_conformant_materials");
    CHECK(cost.Value().concept_name == "PRODUCTION_DEFECT");
    CHECK(cost.Value().table == "product_defects");
}

TEST_CASE("ConceptResolver: zero-weight perspective does not elevate", "[resolve][concept]") {
    ConceptResolver resolver(FixtureSemantic());
    auto r = resolver.Resolve("supplier-review", "severity");
    REQUIRE(r.IsOk());
    const auto& res = r.Value();
    CHECK(res.concept_name == "MATERIAL_NON_CONFORMANCE");
    CHECK(res.score == 0.0);
    CHECK_FALSE(res.deciding_perspective.has_value());
    CHECK(res.candidates[1].score == -1.0);
    CHECK(Contains(res.suppressed, "PRODUCTION_DEFECT"));
}

TEST_CASE("ConceptResolver: table scope narrows candidates", "[resolve][concept]") {
    ConceptResolver resolver(FixtureSemantic());
    auto r = resolver.Resolve("quality-review", "severity", std::string("product_defects"));
    REQUIRE(r.IsOk());
    CHECK(r.Value().concept_name == "PRODUCTION_DEFECT");
    CHECK(r.Value().candidates.size() == 1);
    CHECK(r.Value().table_scope == std::optional<std::string>("product_defects"));
}

TEST_CASE("ConceptResolver: unknown intent", "[resolve][concept]") {
    ConceptResolver resolver(FixtureSemantic());
    auto r = resolver.Resolve("forecasting", "severity");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::UnknownNode);
    CHECK(r.Error().details == std::vector<std::string>{"forecasting"});
}

TEST_CASE("ConceptResolver: field without concepts", "[resolve][concept]") {
    ConceptResolver resolver(FixtureSemantic());
    auto r = resolver.Resolve("quality-review", "rework_hours");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::NoApplicableConcept);

    auto scoped = resolver.Resolve("quality-review", "severity", std::string("suppliers"));
    REQUIRE(scoped.IsErr());
    CHECK(scoped.Error().category == ErrorCategory::NoApplicableConcept);
}

// ===========================================================================
// Ties and ambiguity
// ===========================================================================

TEST_CASE("ConceptResolver: score tie breaks on table alias", "[resolve][concept]") {
    auto g = SemanticBuilder()
                 .Intent("explore")
                 .Concept("ALPHA").Concept("BETA")
                 .Field("lots", "lot_id", "ALPHA", true, "zz")
                 .Field("batches", "lot_id", "BETA", true, "aa")
                 .Build();
    ConceptResolver resolver(g);
    auto r = resolver.Resolve("explore", "lot_id");
    REQUIRE(r.IsOk());
    CHECK(r.Value().concept_name == "BETA");
    CHECK(r.Value().table == "batches");
    CHECK(r.Value().tie_broken);
    CHECK(r.Value().rationale.find("tie broken") != std::string::npos);
}

TEST_CASE("ConceptResolver: equal alias falls back to concept name", "[resolve][concept]") {
    auto g = SemanticBuilder()
                 .Intent("explore")
                 .Concept("ZETA").Concept("ETA")
                 .Field("t1", "code", "ZETA", true, "x")
                 .Field("t2", "code", "ETA", true, "x")
                 .Build();
    ConceptResolver resolver(g);
    auto r = resolver.Resolve("explore", "code");
    REQUIRE(r.IsOk());
    CHECK(r.Value().concept_name == "ETA");
}

TEST_CASE("ConceptResolver: several tables without a primary", "[resolve][concept]") {
    auto g = SemanticBuilder()
                 .Intent("explore")
                 .Concept("SCRAP")
                 .Field("scrap_log", "qty", "SCRAP", false)
                 .Field("scrap_summary", "qty", "SCRAP", false)
                 .Build();
    ConceptResolver resolver(g);
    auto r = resolver.Resolve("explore", "qty");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::AmbiguousResolution);
    CHECK(Contains(r.Error().details, "scrap_log.qty"));
    CHECK(Contains(r.Error().details, "scrap_summary.qty"));
}

TEST_CASE("ConceptResolver: several primary tables", "[resolve][concept]") {
    auto g = SemanticBuilder()
                 .Intent("explore")
                 .Concept("SCRAP")
                 .Field("scrap_log", "qty", "SCRAP", true)
                 .Field("scrap_summary", "qty", "SCRAP", true)
                 .Build();
    ConceptResolver resolver(g);
    auto r = resolver.Resolve("explore", "qty");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::AmbiguousResolution);
    CHECK(Contains(r.Error().details, "scrap_log.qty (primary)"));
}

TEST_CASE("ConceptResolver: single primary settles the table", "[resolve][concept]") {
    auto g = SemanticBuilder()
                 .Intent("explore")
                 .Concept("SCRAP")
                 .Field("scrap_log", "qty", "SCRAP", false)
                 .Field("scrap_summary", "qty", "SCRAP", true, "ss")
                 .Build();
    ConceptResolver resolver(g);
    auto r = resolver.Resolve("explore", "qty");
    REQUIRE(r.IsOk());
    CHECK(r.Value().table == "scrap_summary");
    CHECK(r.Value().table_alias == "ss");
}

// ===========================================================================
// Scoring properties
// ===========================================================================

TEST_CASE("ConceptResolver: strongest perspective decides", "[resolve][concept]") {
    auto g = SemanticBuilder()
                 .Intent("audit")
                 .Perspective("Quality").Perspective("Finance")
                 .Concept("NCM").Concept("DEFECT")
                 .Field("ncm", "amount", "NCM", true)
                 .Field("defects", "amount", "DEFECT", true)
                 .Within("audit", "Quality").Within("audit", "Finance")
                 .Elevate("Quality", "NCM", 0.3)
                 .Elevate("Finance", "NCM", 0.8)
                 .Elevate("Finance", "DEFECT", 0.5)
                 .Build();
    ConceptResolver resolver(g);
    auto r = resolver.Resolve("audit", "amount");
    REQUIRE(r.IsOk());
    CHECK(r.Value().concept_name == "NCM");
    CHECK(r.Value().score == 0.8);
    CHECK(r.Value().deciding_perspective == std::optional<std::string>("Finance"));
}

TEST_CASE("ConceptResolver: elevation only counts with USES_DEFINITION", "[resolve][concept]") {
    auto builder = SemanticBuilder();
    builder.Intent("audit").Perspective("Quality")
           .Concept("NCM").Concept("DEFECT")
           .Field("ncm", "amount", "NCM", true, "b")
           .Field("defects", "amount", "DEFECT", true, "a")
           .Within("audit", "Quality");
    auto g = std::const_pointer_cast<Graph>(builder.Build());
    // Influence without USES_DEFINITION.
    REQUIRE(g->AddEdge(PerspectiveId("Quality"), ConceptId("NCM"),
                       InfluenceEdge{Polarity::Elevates, 1.0}).IsOk());
    ConceptResolver resolver(g);
    auto r = resolver.Resolve("audit", "amount");
    REQUIRE(r.IsOk());
    CHECK(r.Value().score == 0.0);
    CHECK(r.Value().concept_name == "DEFECT");  // alias "a" wins the tie
}

TEST_CASE("ConceptResolver: raising an elevation never lowers the score", "[resolve][concept]") {
    double previous = -1.0;
    for (double w : {0.0, 0.1, 0.25, 0.5, 0.75, 1.0}) {
        auto g = SemanticBuilder()
                     .Intent("audit")
                     .Perspective("Quality").Perspective("Finance")
                     .Concept("NCM").Concept("DEFECT")
                     .Field("ncm", "amount", "NCM", true)
                     .Field("defects", "amount", "DEFECT", true)
                     .Within("audit", "Quality").Within("audit", "Finance")
                     .Elevate("Quality", "NCM", w)
                     .Elevate("Finance", "NCM", 0.4)
                     .Elevate("Finance", "DEFECT", 0.6)
                     .Build();
        ConceptResolver resolver(g);
        auto r = resolver.Resolve("audit", "amount");
        REQUIRE(r.IsOk());
        auto it = std::find_if(r.Value().candidates.begin(), r.Value().candidates.end(),
                               [](const ScoredConcept& c) { return c.concept_name == "NCM"; });
        REQUIRE(it != r.Value().candidates.end());
        CHECK(it->score >= previous);
        previous = it->score;
    }
    CHECK(previous == 1.0);
}

TEST_CASE("ConceptResolver: direct intent weight adds to the elevation", "[resolve][concept]") {
    auto g = SemanticBuilder()
                 .Intent("audit")
                 .Perspective("Quality")
                 .Concept("NCM").Concept("DEFECT")
                 .Field("ncm", "amount", "NCM", true)
                 .Field("defects", "amount", "DEFECT", true)
                 .Within("audit", "Quality")
                 .Elevate("Quality", "NCM", 0.9)
                 .Direct("audit", "NCM", -1.0)
                 .Direct("audit", "DEFECT", 1.0)
                 .Build();
    ConceptResolver resolver(g);
    auto r = resolver.Resolve("audit", "amount");
    REQUIRE(r.IsOk());
    CHECK(r.Value().concept_name == "DEFECT");
    CHECK(r.Value().score == 1.0);
    CHECK_FALSE(r.Value().deciding_perspective.has_value());
    CHECK(Contains(r.Value().elevated, "DEFECT"));
    CHECK(Contains(r.Value().suppressed, "NCM"));
}

// ===========================================================================
// Compare
// ===========================================================================

TEST_CASE("ConceptResolver::Compare: every intent in name order", "[resolve][concept]") {
    ConceptResolver resolver(FixtureSemantic());
    auto r = resolver.Compare("severity");
    REQUIRE(r.IsOk());
    const auto& rows = r.Value();
    REQUIRE(rows.size() == 3);
    CHECK(rows[0].intent == "cost-review");
    CHECK(rows[1].intent == "quality-review");
    CHECK(rows[2].intent == "supplier-review");
    REQUIRE(rows[0].resolution.has_value());
    CHECK(rows[0].resolution->concept_name == "PRODUCTION_DEFECT");
    REQUIRE(rows[1].resolution.has_value());
    CHECK(rows[1].resolution->concept_name == "MATERIAL_NON_CONFORMANCE");
    CHECK_FALSE(rows[1].error.has_value());
}

TEST_CASE("ConceptResolver::Compare: keeps per-intent failures", "[resolve][concept]") {
    auto g = SemanticBuilder()
                 .Intent("a-intent").Intent("b-intent")
                 .Perspective("P")
                 .Concept("SPLIT").Concept("SINGLE")
                 .Field("t1", "qty", "SPLIT", false)
                 .Field("t2", "qty", "SPLIT", false)
                 .Field("t3", "qty", "SINGLE", true)
                 .Direct("a-intent", "SPLIT", 1.0)
                 .Direct("b-intent", "SINGLE", 1.0)
                 .Build();
    ConceptResolver resolver(g);
    auto r = resolver.Compare("qty");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().size() == 2);
    REQUIRE(r.Value()[0].error.has_value());
    CHECK(r.Value()[0].error->category == ErrorCategory::AmbiguousResolution);
    REQUIRE(r.Value()[1].resolution.has_value());
    CHECK(r.Value()[1].resolution->table == "t3");
}

TEST_CASE("ConceptResolver::Compare: cancellation aborts", "[resolve][concept]") {
    ConceptResolver resolver(FixtureSemantic());
    CancellationToken token;
    token.Cancel();
    auto r = resolver.Compare("severity", std::nullopt, Deadline().WithToken(token));
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Cancelled);
}

TEST_CASE("ConceptResolver: scores within rounding noise rank consistently", "[resolve][concept]") {
    // Adjacent scores differ by less than 1e-9; only those rounding to the
    // same nine decimals tie.
    auto g = SemanticBuilder()
                 .Intent("review")
                 .Perspective("P")
                 .Within("review", "P")
                 .Concept("LOW").Concept("MID").Concept("HIGH")
                 .Field("t_low", "qty", "LOW", true, "mm")
                 .Field("t_mid", "qty", "MID", true, "zz")
                 .Field("t_high", "qty", "HIGH", true, "aa")
                 .Elevate("P", "LOW", 0.5)
                 .Elevate("P", "MID", 0.5 + 6e-10)
                 .Elevate("P", "HIGH", 0.5 + 1.2e-9)
                 .Build();
    ConceptResolver resolver(g);
    auto r = resolver.Resolve("review", "qty");
    REQUIRE(r.IsOk());
    const auto& res = r.Value();
    REQUIRE(res.candidates.size() == 3);
    CHECK(res.candidates[0].concept_name == "HIGH");
    CHECK(res.candidates[1].concept_name == "MID");
    CHECK(res.candidates[2].concept_name == "LOW");
    CHECK(res.tie_broken);
    CHECK(res.table == "t_high");
}

// ===========================================================================
// Suggested joins
// ===========================================================================

TEST_CASE("ConceptResolver: suggests tables of directly elevated concepts", "[resolve][concept]") {
    ConceptResolver resolver(FixtureSemantic());

    auto severity = resolver.Resolve("cost-review", "severity");
    REQUIRE(severity.IsOk());
    CHECK(severity.Value().table == "product_defects");
    CHECK(severity.Value().suggested_joins ==
          std::vector<std::string>{"non_conformant_materials"});

    // The only elevated concept lives in the resolved table itself.
    auto cost = resolver.Resolve("cost-review", "cost_impact");
    REQUIRE(cost.IsOk());
    CHECK(cost.Value().suggested_joins.empty());

    // Suppressed concepts are not suggested.
    auto supplier = resolver.Resolve("supplier-review", "severity");
    REQUIRE(supplier.IsOk());
    CHECK(supplier.Value().suggested_joins.empty());
}

// ===========================================================================
// Intent ranking
// ===========================================================================

TEST_CASE("ConceptResolver::RankIntents: catalog fields", "[resolve][concept]") {
    ConceptResolver resolver(FixtureSemantic());
    auto r = resolver.RankIntents({{"non_conformant_materials", "cost_impact"},
                                   {"product_defects", "severity"}});
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().size() == 1);
    const auto& top = r.Value()[0];
    CHECK(top.intent == "cost-review");
    CHECK(top.confidence == 0.5);
    CHECK(top.matched_fields == std::vector<std::string>{"non_conformant_materials.cost_impact"});
    CHECK(top.matched_concepts == std::vector<std::string>{"FINANCIAL_LIABILITY_NCM"});
    CHECK(top.explanation == "Matched 1/2 fields with average weight 1.00");
}

TEST_CASE("ConceptResolver::RankIntents: orders by confidence then name", "[resolve][concept]") {
    auto g = SemanticBuilder()
                 .Intent("alpha").Intent("beta").Intent("gamma").Intent("idle")
                 .Perspective("P")
                 .Within("alpha", "P").Within("beta", "P").Within("gamma", "P")
                 .Within("idle", "P", 0.0)
                 .Concept("X").Concept("Y")
                 .Field("t1", "a", "X", true)
                 .Field("t2", "b", "Y", true)
                 .Field("t3", "c", "Y", false)
                 .Elevate("P", "X", 0.5)
                 .Elevate("P", "Y", 0.5)
                 .Direct("alpha", "X", 1.0)
                 .Direct("beta", "X", 1.0)
                 .Direct("beta", "Y", 1.0)
                 .Direct("gamma", "Y", 1.0)
                 .Direct("idle", "X", 1.0)
                 .Build();
    ConceptResolver resolver(g);
    auto r = resolver.RankIntents({{"t1", "a"}, {"t2", "b"}, {"t3", "c"}});
    REQUIRE(r.IsOk());
    const auto& scores = r.Value();
    // idle engages its perspective with weight 0 and matches nothing.
    REQUIRE(scores.size() == 3);
    CHECK(scores[0].intent == "beta");
    CHECK(scores[0].confidence == 1.0);
    CHECK(scores[1].intent == "gamma");
    CHECK(scores[1].matched_fields == std::vector<std::string>{"t2.b", "t3.c"});
    CHECK(scores[2].intent == "alpha");
    CHECK(scores[2].matched_concepts == std::vector<std::string>{"X"});
}

TEST_CASE("ConceptResolver::RankIntents: unknown fields", "[resolve][concept]") {
    ConceptResolver resolver(FixtureSemantic());
    auto r = resolver.RankIntents({{"product_defects", "severity"}, {"nowhere", "qty"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::UnknownNode);
    CHECK(r.Error().details == std::vector<std::string>{"nowhere.qty"});
}

TEST_CASE("ConceptResolver::RankIntents: no fields ranks nothing", "[resolve][concept]") {
    ConceptResolver resolver(FixtureSemantic());
    auto r = resolver.RankIntents({});
    REQUIRE(r.IsOk());
    CHECK(r.Value().empty());
}
