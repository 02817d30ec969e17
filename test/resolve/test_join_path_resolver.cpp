#include <catch2/catch_test_macros.hpp>

#include <catalog_graph/catalog/catalog_loader.hpp>
#include <catalog_graph/resolve/join_path_resolver.hpp>

#include "../mocks/catalog_fixture.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

using namespace catalog_graph;

namespace {

std::shared_ptr<const Graph> FixtureSchema() {
    auto reader = testing::FixtureCatalog();
    auto schema = BuildSchemaGraph(*reader);
    REQUIRE(schema.IsOk());
    return std::make_shared<const Graph>(std::move(schema).Value());
}

// Tables plus (from, to, weight) join edges.
std::shared_ptr<const Graph> Schema(
    const std::vector<std::string>& tables,
    const std::vector<std::tuple<std::string, std::string, double>>& joins) {
    auto g = std::make_shared<Graph>();
    for (const auto& t : tables) {
        REQUIRE(g->AddNode(t, TableNode{t, "", ""}).IsOk());
    }
    for (const auto& [from, to, w] : joins) {
        REQUIRE(g->AddEdge(from, to, JoinEdge{"foreign_key", to + "_id", w}).IsOk());
    }
    return g;
}

std::vector<std::string> Tables(const std::vector<JoinStep>& steps) {
    std::vector<std::string> seq;
    if (steps.empty()) return seq;
    seq.push_back(steps.front().from);
    for (const auto& s : steps) seq.push_back(s.to);
    return seq;
}

} // anonymous namespace

// ===========================================================================
// Catalog scenarios
// ===========================================================================

TEST_CASE("JoinPathResolver: chain equipment to customer", "[resolve][path]") {
    JoinPathResolver resolver(FixtureSchema());
    auto path = resolver.Resolve("equipment", "customer");
    REQUIRE(path.IsOk());
    const auto& steps = path.Value();
    REQUIRE(steps.size() == 3);
    CHECK(steps[0].from == "equipment");
    CHECK(steps[0].to == "product");
    CHECK(steps[1].from == "product");
    CHECK(steps[1].to == "order");
    CHECK(steps[2].from == "order");
    CHECK(steps[2].to == "customer");
    CHECK(steps[2].join_column == "customer_id");
    CHECK(steps[0].forward);
    CHECK(JoinPathResolver::PathCost(steps) == 3.0);
}

TEST_CASE("JoinPathResolver: traverses edges against their direction", "[resolve][path]") {
    JoinPathResolver resolver(FixtureSchema());
    auto path = resolver.Resolve("customer", "suppliers");
    REQUIRE(path.IsOk());
    CHECK(Tables(path.Value()) ==
          std::vector<std::string>{"customer", "order", "product",
                                   "non_conformant_materials", "suppliers"});
    const auto& steps = path.Value();
    CHECK_FALSE(steps[0].forward);  // stored as order -> customer
    CHECK(steps[3].forward);        // stored as non_conformant_materials -> suppliers
    CHECK(steps[3].extra.at("natural_language_alias") == "responsible supplier");
    CHECK(JoinPathResolver::PathCost(steps) == 5.0);
}

TEST_CASE("JoinPathResolver: disconnected tables raise NoPath", "[resolve][path]") {
    JoinPathResolver resolver(FixtureSchema());
    auto path = resolver.Resolve("audit_log", "customer");
    REQUIRE(path.IsErr());
    CHECK(path.Error().category == ErrorCategory::NoPath);
    CHECK(path.Error().details == std::vector<std::string>{"audit_log", "customer"});
}

TEST_CASE("JoinPathResolver: unknown table", "[resolve][path]") {
    JoinPathResolver resolver(FixtureSchema());
    auto path = resolver.Resolve("equipment", "warehouse");
    REQUIRE(path.IsErr());
    CHECK(path.Error().category == ErrorCategory::UnknownNode);
    CHECK(path.Error().details == std::vector<std::string>{"warehouse"});
}

TEST_CASE("JoinPathResolver: same table is an empty path", "[resolve][path]") {
    JoinPathResolver resolver(FixtureSchema());
    auto path = resolver.Resolve("product", "product");
    REQUIRE(path.IsOk());
    CHECK(path.Value().empty());
}

// ===========================================================================
// Tie-breaking and symmetry
// ===========================================================================

TEST_CASE("JoinPathResolver: equal-cost paths pick the smallest sequence", "[resolve][path]") {
    auto g = Schema({"A", "B", "C", "D"},
                    {{"A", "C", 1.0}, {"C", "D", 1.0}, {"A", "B", 1.0}, {"B", "D", 1.0}});
    JoinPathResolver resolver(g);
    for (int run = 0; run < 20; ++run) {
        auto path = resolver.Resolve("A", "D");
        REQUIRE(path.IsOk());
        CHECK(Tables(path.Value()) == std::vector<std::string>{"A", "B", "D"});
    }
}

TEST_CASE("JoinPathResolver: reverse query is the exact reverse", "[resolve][path]") {
    auto g = Schema({"A", "B", "C", "D", "E"},
                    {{"A", "B", 1.0}, {"A", "C", 1.0}, {"B", "E", 1.0},
                     {"C", "D", 1.0}, {"D", "E", 0.5}, {"C", "E", 2.0}});
    JoinPathResolver resolver(g);
    auto forward = resolver.Resolve("A", "E");
    auto backward = resolver.Resolve("E", "A");
    REQUIRE(forward.IsOk());
    REQUIRE(backward.IsOk());

    auto f = Tables(forward.Value());
    auto b = Tables(backward.Value());
    std::reverse(b.begin(), b.end());
    CHECK(f == b);
    CHECK(JoinPathResolver::PathCost(forward.Value()) ==
          JoinPathResolver::PathCost(backward.Value()));

    const auto& fs = forward.Value();
    const auto& bs = backward.Value();
    REQUIRE(fs.size() == bs.size());
    for (size_t i = 0; i < fs.size(); ++i) {
        const auto& mirrored = bs[bs.size() - 1 - i];
        CHECK(fs[i].from == mirrored.to);
        CHECK(fs[i].forward != mirrored.forward);
    }
}

TEST_CASE("JoinPathResolver: weights beat hop count", "[resolve][path]") {
    auto g = Schema({"A", "B", "C", "D"},
                    {{"A", "D", 5.0}, {"A", "B", 1.0}, {"B", "C", 1.0}, {"C", "D", 1.0}});
    JoinPathResolver resolver(g);
    auto path = resolver.Resolve("A", "D");
    REQUIRE(path.IsOk());
    CHECK(Tables(path.Value()) == std::vector<std::string>{"A", "B", "C", "D"});
    CHECK(JoinPathResolver::PathCost(path.Value()) == 3.0);
}

TEST_CASE("JoinPathResolver: cheaper of two opposite edges is used", "[resolve][path]") {
    auto g = Schema({"A", "B"}, {{"A", "B", 2.0}, {"B", "A", 1.0}});
    JoinPathResolver resolver(g);
    auto path = resolver.Resolve("A", "B");
    REQUIRE(path.IsOk());
    REQUIRE(path.Value().size() == 1);
    CHECK(path.Value()[0].weight == 1.0);
    CHECK_FALSE(path.Value()[0].forward);
    CHECK(path.Value()[0].join_column == "A_id");
}

TEST_CASE("JoinPathResolver: tiny weights behind a costly hop", "[resolve][path]") {
    // b and c sit at the same distance from z; the b-c edge must not be
    // taken as a shortest-path step.
    auto g = Schema({"b", "c", "p", "z"},
                    {{"z", "p", 1000.0},
                     {"p", "b", kMinJoinWeight},
                     {"p", "c", kMinJoinWeight},
                     {"b", "c", kMinJoinWeight}});
    JoinPathResolver resolver(g);
    auto path = resolver.Resolve("b", "z");
    REQUIRE(path.IsOk());
    CHECK(Tables(path.Value()) == std::vector<std::string>{"b", "p", "z"});

    auto reverse = resolver.Resolve("z", "b");
    REQUIRE(reverse.IsOk());
    CHECK(Tables(reverse.Value()) == std::vector<std::string>{"z", "p", "b"});
}

TEST_CASE("JoinPathResolver: cancelled deadline", "[resolve][path]") {
    JoinPathResolver resolver(FixtureSchema());
    CancellationToken token;
    token.Cancel();
    auto path = resolver.Resolve("equipment", "customer", Deadline().WithToken(token));
    REQUIRE(path.IsErr());
    CHECK(path.Error().category == ErrorCategory::Cancelled);
}
