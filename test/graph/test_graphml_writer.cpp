#include <catch2/catch_test_macros.hpp>

#include <catalog_graph/graph/graphml_writer.hpp>

#include <tinyxml2.h>

#include <cstdio>
#include <map>
#include <string>

using namespace catalog_graph;

namespace {

Graph SmallGraph() {
    Graph g;
    REQUIRE(g.AddNode("work_orders", TableNode{"work_orders", "fact", "Shop floor orders"}).IsOk());
    REQUIRE(g.AddNode("suppliers", TableNode{"suppliers", "dimension", ""},
                      {{"owner", "procurement"}}).IsOk());
    REQUIRE(g.AddEdge("work_orders", "suppliers",
                      JoinEdge{"foreign_key", "supplier_id", 1.5},
                      {{"context", "sourcing & quality"}}).IsOk());
    return g;
}

// attr.name -> key id for one domain.
std::map<std::string, std::string> KeyIds(tinyxml2::XMLElement* root, const char* domain) {
    std::map<std::string, std::string> ids;
    for (auto* key = root->FirstChildElement("key"); key != nullptr;
         key = key->NextSiblingElement("key")) {
        if (std::string(key->Attribute("for")) == domain) {
            ids[key->Attribute("attr.name")] = key->Attribute("id");
        }
    }
    return ids;
}

std::string DataValue(tinyxml2::XMLElement* el, const std::string& key_id) {
    for (auto* d = el->FirstChildElement("data"); d != nullptr;
         d = d->NextSiblingElement("data")) {
        if (key_id == d->Attribute("key")) {
            return d->GetText() != nullptr ? d->GetText() : "";
        }
    }
    return "<missing>";
}

} // anonymous namespace

TEST_CASE("WriteGraphMl: well-formed document with typed keys", "[graph][graphml]") {
    auto xml = WriteGraphMl(SmallGraph());
    tinyxml2::XMLDocument doc;
    REQUIRE(doc.Parse(xml.c_str()) == tinyxml2::XML_SUCCESS);

    auto* root = doc.FirstChildElement("graphml");
    REQUIRE(root != nullptr);
    auto* graph = root->FirstChildElement("graph");
    REQUIRE(graph != nullptr);
    CHECK(std::string(graph->Attribute("edgedefault")) == "directed");

    auto node_keys = KeyIds(root, "node");
    auto edge_keys = KeyIds(root, "edge");
    REQUIRE(node_keys.count("extra.owner") == 1);
    REQUIRE(edge_keys.count("extra.context") == 1);
    REQUIRE(edge_keys.count("weight") == 1);

    // Nodes in id order: suppliers before work_orders.
    auto* first = graph->FirstChildElement("node");
    REQUIRE(first != nullptr);
    CHECK(std::string(first->Attribute("id")) == "suppliers");
    CHECK(DataValue(first, node_keys["table_kind"]) == "dimension");
    CHECK(DataValue(first, node_keys["extra.owner"]) == "procurement");

    auto* edge = graph->FirstChildElement("edge");
    REQUIRE(edge != nullptr);
    CHECK(std::string(edge->Attribute("source")) == "work_orders");
    CHECK(std::string(edge->Attribute("target")) == "suppliers");
    CHECK(DataValue(edge, edge_keys["label"]) == "JOIN");
    CHECK(DataValue(edge, edge_keys["join_column"]) == "supplier_id");
    CHECK(DataValue(edge, edge_keys["weight"]) == "1.5");
    CHECK(DataValue(edge, edge_keys["extra.context"]) == "sourcing & quality");
}

TEST_CASE("WriteGraphMl: undirected graph", "[graph][graphml]") {
    auto xml = WriteGraphMl(Graph(false));
    CHECK(xml.find("edgedefault=\"undirected\"") != std::string::npos);
}

TEST_CASE("WriteGraphMlFile: writes and reports failures", "[graph][graphml]") {
    const std::string path = "catalog_graph_test_export.graphml";
    REQUIRE(WriteGraphMlFile(SmallGraph(), path).IsOk());
    tinyxml2::XMLDocument doc;
    CHECK(doc.LoadFile(path.c_str()) == tinyxml2::XML_SUCCESS);
    std::remove(path.c_str());

    auto r = WriteGraphMlFile(SmallGraph(), "/nonexistent-dir/out.graphml");
    REQUIRE(r.IsErr());
    CHECK(r.Error().operation == "WriteGraphMlFile");
}
