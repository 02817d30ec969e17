#include <catch2/catch_test_macros.hpp>

#include <catalog_graph/graph/graph_model.hpp>

#include <string>
#include <vector>

using namespace catalog_graph;

namespace {

Graph TwoTables(bool directed = true) {
    Graph g(directed);
    REQUIRE(g.AddNode("orders", TableNode{"orders", "fact", ""}).IsOk());
    REQUIRE(g.AddNode("suppliers", TableNode{"suppliers", "dimension", ""}).IsOk());
    return g;
}

} // anonymous namespace

// ===========================================================================
// Nodes
// ===========================================================================

TEST_CASE("Graph: AddNode and FindNode", "[graph]") {
    Graph g;
    REQUIRE(g.AddNode(FieldId("orders", "qty"), FieldNode{"orders", "qty"}).IsOk());
    const Node* n = g.FindNode("field:orders.qty");
    REQUIRE(n != nullptr);
    CHECK(n->Kind() == NodeKind::Field);
    CHECK(n->Name() == "orders.qty");
    CHECK(g.FindNode("missing") == nullptr);
}

TEST_CASE("Graph: duplicate node id is rejected", "[graph]") {
    auto g = TwoTables();
    auto r = g.AddNode("orders", TableNode{"orders", "", ""});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::DuplicateNode);
    CHECK(g.NodeCount() == 2);
}

TEST_CASE("Graph: empty node id is rejected", "[graph]") {
    Graph g;
    CHECK(g.AddNode("", TableNode{}).IsErr());
}

TEST_CASE("Graph: NodesOfKind in id order", "[graph]") {
    Graph g;
    REQUIRE(g.AddNode(IntentId("b"), IntentNode{"b", ""}).IsOk());
    REQUIRE(g.AddNode(IntentId("a"), IntentNode{"a", ""}).IsOk());
    REQUIRE(g.AddNode(ConceptId("c"), ConceptNode{"c", ""}).IsOk());
    auto intents = g.NodesOfKind(NodeKind::Intent);
    REQUIRE(intents.size() == 2);
    CHECK(intents[0]->Name() == "a");
    CHECK(intents[1]->Name() == "b");
}

// ===========================================================================
// Edges
// ===========================================================================

TEST_CASE("Graph: edge to an unknown node", "[graph]") {
    auto g = TwoTables();
    auto r = g.AddEdge("orders", "parts", JoinEdge{"foreign_key", "part_id", 1.0});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::UnknownNode);
    REQUIRE(r.Error().details.size() == 1);
    CHECK(r.Error().details[0] == "parts");
}

TEST_CASE("Graph: duplicate edge of the same kind", "[graph]") {
    auto g = TwoTables();
    REQUIRE(g.AddEdge("orders", "suppliers", JoinEdge{"fk", "supplier_id", 1.0}).IsOk());
    auto r = g.AddEdge("orders", "suppliers", JoinEdge{"fk", "other", 2.0});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::DuplicateEdge);
    // The reverse direction is a different edge in a directed graph.
    CHECK(g.AddEdge("suppliers", "orders", JoinEdge{"fk", "order_id", 1.0}).IsOk());
}

TEST_CASE("Graph: undirected graph rejects the mirrored copy", "[graph]") {
    auto g = TwoTables(false);
    REQUIRE(g.AddEdge("orders", "suppliers", JoinEdge{"fk", "supplier_id", 1.0}).IsOk());
    auto r = g.AddEdge("suppliers", "orders", JoinEdge{"fk", "supplier_id", 1.0});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::DuplicateEdge);
}

TEST_CASE("Graph: undirected graph keeps a distinct reverse relationship", "[graph]") {
    auto g = TwoTables(false);
    REQUIRE(g.AddEdge("orders", "suppliers", JoinEdge{"fk", "supplier_id", 1.0}).IsOk());
    REQUIRE(g.AddEdge("suppliers", "orders", JoinEdge{"fk", "order_id", 2.0}).IsOk());
    CHECK(g.EdgeCount() == 2);
    CHECK(g.Neighbors("orders") == std::vector<std::string>{"suppliers"});
    REQUIRE(g.FindEdge("suppliers", "orders", EdgeKind::Join) != nullptr);
    CHECK(std::get<JoinEdge>(g.FindEdge("suppliers", "orders", EdgeKind::Join)->data).join_column
          == "order_id");
}

TEST_CASE("Graph: join weight must be positive", "[graph]") {
    auto g = TwoTables();
    auto r = g.AddEdge("orders", "suppliers", JoinEdge{"fk", "supplier_id", 0.0});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::InvalidEdge);
    CHECK(g.EdgeCount() == 0);
    CHECK(g.AddEdge("orders", "suppliers", JoinEdge{"fk", "supplier_id", 1e-12}).IsErr());
    CHECK(g.AddEdge("orders", "suppliers", JoinEdge{"fk", "supplier_id", kMinJoinWeight}).IsOk());
}

TEST_CASE("Graph: edge kind must match endpoint kinds", "[graph]") {
    auto g = TwoTables();
    REQUIRE(g.AddNode(ConceptId("c"), ConceptNode{"c", ""}).IsOk());
    auto r = g.AddEdge("orders", ConceptId("c"), CanMeanEdge{false, ""});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::InvalidEdge);
}

TEST_CASE("Graph: influence weight bounds", "[graph]") {
    Graph g;
    REQUIRE(g.AddNode(IntentId("i"), IntentNode{"i", ""}).IsOk());
    REQUIRE(g.AddNode(PerspectiveId("p"), PerspectiveNode{"p", ""}).IsOk());
    REQUIRE(g.AddNode(ConceptId("c"), ConceptNode{"c", ""}).IsOk());

    CHECK(g.AddEdge(PerspectiveId("p"), ConceptId("c"),
                    InfluenceEdge{Polarity::Elevates, 1.5}).IsErr());
    CHECK(g.AddEdge(PerspectiveId("p"), ConceptId("c"),
                    InfluenceEdge{Polarity::Elevates, 0.9}).IsOk());

    CHECK(g.AddEdge(IntentId("i"), ConceptId("c"),
                    InfluenceEdge{Polarity::Elevates, 0.5}).IsErr());
    CHECK(g.AddEdge(IntentId("i"), ConceptId("c"),
                    InfluenceEdge{Polarity::Elevates, -1.0}).IsErr());
    CHECK(g.AddEdge(IntentId("i"), ConceptId("c"),
                    InfluenceEdge{Polarity::Suppresses, -1.0}).IsOk());
}

TEST_CASE("Graph: one primary CAN_MEAN per concept and table", "[graph]") {
    Graph g;
    REQUIRE(g.AddNode(FieldId("t", "a"), FieldNode{"t", "a"}).IsOk());
    REQUIRE(g.AddNode(FieldId("t", "b"), FieldNode{"t", "b"}).IsOk());
    REQUIRE(g.AddNode(ConceptId("c"), ConceptNode{"c", ""}).IsOk());
    REQUIRE(g.AddEdge(FieldId("t", "a"), ConceptId("c"), CanMeanEdge{true, ""}).IsOk());
    auto r = g.AddEdge(FieldId("t", "b"), ConceptId("c"), CanMeanEdge{true, ""});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::InvalidEdge);
    CHECK(g.AddEdge(FieldId("t", "b"), ConceptId("c"), CanMeanEdge{false, ""}).IsOk());
}

// ===========================================================================
// Queries
// ===========================================================================

TEST_CASE("Graph: Neighbors covers both directions, sorted", "[graph]") {
    Graph g;
    for (const char* t : {"c", "a", "b", "d"}) {
        REQUIRE(g.AddNode(t, TableNode{t, "", ""}).IsOk());
    }
    REQUIRE(g.AddEdge("c", "d", JoinEdge{"fk", "x", 1.0}).IsOk());
    REQUIRE(g.AddEdge("a", "c", JoinEdge{"fk", "x", 1.0}).IsOk());
    REQUIRE(g.AddEdge("c", "b", JoinEdge{"fk", "x", 1.0}).IsOk());
    CHECK(g.Neighbors("c") == std::vector<std::string>{"a", "b", "d"});
    CHECK(g.Neighbors("zzz").empty());
}

TEST_CASE("Graph: GetEdge is orientation agnostic", "[graph]") {
    auto g = TwoTables();
    REQUIRE(g.AddEdge("orders", "suppliers", JoinEdge{"fk", "supplier_id", 2.0}).IsOk());

    auto forward = g.GetEdge("orders", "suppliers");
    REQUIRE(forward.has_value());
    CHECK_FALSE(forward->reversed);

    auto backward = g.GetEdge("suppliers", "orders", EdgeKind::Join);
    REQUIRE(backward.has_value());
    CHECK(backward->reversed);
    CHECK(backward->edge->from == "orders");

    CHECK_FALSE(g.GetEdge("suppliers", "orders", EdgeKind::CanMean).has_value());
}

TEST_CASE("Graph: Edge label uses influence polarity", "[graph]") {
    Edge influence{"p", "c", InfluenceEdge{Polarity::Suppresses, 0.2}, {}};
    CHECK(influence.Label() == "SUPPRESSES");
    Edge join{"a", "b", JoinEdge{}, {}};
    CHECK(join.Label() == "JOIN");
}

TEST_CASE("Graph: kind names parse back", "[graph]") {
    CHECK(ParseNodeKind(NodeKindName(NodeKind::Perspective)) == NodeKind::Perspective);
    CHECK(ParseEdgeKind(EdgeKindName(EdgeKind::UsesDefinition)) == EdgeKind::UsesDefinition);
    CHECK(ParsePolarity("NEUTRAL") == Polarity::Neutral);
    CHECK_FALSE(ParseEdgeKind("join").has_value());
}

TEST_CASE("Graph: equality compares nodes, edges and direction", "[graph]") {
    auto a = TwoTables();
    auto b = TwoTables();
    CHECK(a == b);
    REQUIRE(a.AddEdge("orders", "suppliers", JoinEdge{"fk", "s", 1.0},
                      {{"context", "sourcing"}}).IsOk());
    CHECK(a != b);
    REQUIRE(b.AddEdge("orders", "suppliers", JoinEdge{"fk", "s", 1.0},
                      {{"context", "sourcing"}}).IsOk());
    CHECK(a == b);
    CHECK(TwoTables(false) != TwoTables(true));
}
