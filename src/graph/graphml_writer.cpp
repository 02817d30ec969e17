#include <catalog_graph/graph/graphml_writer.hpp>

#include <tinyxml2.h>

#include <iomanip>
#include <set>
#include <sstream>
#include <type_traits>
#include <vector>

namespace catalog_graph {

namespace {

const char* kGraphMlNamespace = "http://graphml.graphdrawing.org/xmlns";

struct KeySpec {
    std::string id;
    const char* domain;      // "node" or "edge"
    std::string attr_name;
    const char* attr_type;   // "string", "double", "boolean"
};

std::string FormatDouble(double value) {
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    return oss.str();
}

// Typed attribute name/value pairs of a node, in declaration order.
std::vector<std::pair<std::string, std::string>> NodeAttributes(const Node& node) {
    std::vector<std::pair<std::string, std::string>> attrs;
    attrs.emplace_back("kind", NodeKindName(node.Kind()));
    std::visit([&](const auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, TableNode>) {
            attrs.emplace_back("name", n.name);
            attrs.emplace_back("table_kind", n.kind);
            attrs.emplace_back("description", n.description);
        } else if constexpr (std::is_same_v<T, FieldNode>) {
            attrs.emplace_back("table", n.table);
            attrs.emplace_back("column", n.column);
        } else {
            attrs.emplace_back("name", n.name);
            attrs.emplace_back("description", n.description);
        }
    }, node.data);
    return attrs;
}

std::vector<std::pair<std::string, std::string>> EdgeAttributes(const Edge& edge) {
    std::vector<std::pair<std::string, std::string>> attrs;
    attrs.emplace_back("kind", EdgeKindName(edge.Kind()));
    attrs.emplace_back("label", edge.Label());
    std::visit([&](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, JoinEdge>) {
            attrs.emplace_back("relationship_kind", e.relationship_kind);
            attrs.emplace_back("join_column", e.join_column);
            attrs.emplace_back("weight", FormatDouble(e.weight));
        } else if constexpr (std::is_same_v<T, OperatesWithinEdge>) {
            attrs.emplace_back("weight", FormatDouble(e.weight));
        } else if constexpr (std::is_same_v<T, CanMeanEdge>) {
            attrs.emplace_back("is_primary", e.is_primary ? "true" : "false");
            attrs.emplace_back("table_alias", e.table_alias);
        } else if constexpr (std::is_same_v<T, InfluenceEdge>) {
            attrs.emplace_back("polarity", PolarityName(e.polarity));
            attrs.emplace_back("weight", FormatDouble(e.weight));
        }
    }, edge.data);
    return attrs;
}

std::vector<KeySpec> BuildKeys(const Graph& graph) {
    std::vector<KeySpec> keys;
    auto add = [&](const char* domain, std::string name, const char* type) {
        keys.push_back({"d" + std::to_string(keys.size()), domain,
                        std::move(name), type});
    };

    for (const char* name : {"kind", "name", "table_kind", "description",
                             "table", "column"}) {
        add("node", name, "string");
    }
    for (const char* name : {"kind", "label", "relationship_kind",
                             "join_column", "table_alias", "polarity"}) {
        add("edge", name, "string");
    }
    add("edge", "weight", "double");
    add("edge", "is_primary", "boolean");

    std::set<std::string> node_extra;
    std::set<std::string> edge_extra;
    for (const auto& [id, node] : graph.Nodes()) {
        for (const auto& [k, v] : node.extra) node_extra.insert(k);
    }
    for (const Edge* edge : graph.Edges()) {
        for (const auto& [k, v] : edge->extra) edge_extra.insert(k);
    }
    for (const auto& k : node_extra) add("node", "extra." + k, "string");
    for (const auto& k : edge_extra) add("edge", "extra." + k, "string");
    return keys;
}

const std::string& KeyId(const std::vector<KeySpec>& keys, const char* domain,
                         const std::string& attr_name) {
    for (const auto& key : keys) {
        if (std::string(key.domain) == domain && key.attr_name == attr_name) {
            return key.id;
        }
    }
    static const std::string kMissing;
    return kMissing;
}

void AppendData(tinyxml2::XMLDocument& doc, tinyxml2::XMLElement* parent,
                const std::string& key_id, const std::string& value) {
    auto* data = doc.NewElement("data");
    data->SetAttribute("key", key_id.c_str());
    data->SetText(value.c_str());
    parent->InsertEndChild(data);
}

void BuildDocument(const Graph& graph, tinyxml2::XMLDocument& doc) {
    doc.InsertEndChild(doc.NewDeclaration());

    auto* root = doc.NewElement("graphml");
    root->SetAttribute("xmlns", kGraphMlNamespace);
    doc.InsertEndChild(root);

    const auto keys = BuildKeys(graph);
    for (const auto& key : keys) {
        auto* el = doc.NewElement("key");
        el->SetAttribute("id", key.id.c_str());
        el->SetAttribute("for", key.domain);
        el->SetAttribute("attr.name", key.attr_name.c_str());
        el->SetAttribute("attr.type", key.attr_type);
        root->InsertEndChild(el);
    }

    auto* graph_el = doc.NewElement("graph");
    graph_el->SetAttribute("id", "G");
    graph_el->SetAttribute("edgedefault", graph.IsDirected() ? "directed" : "undirected");
    root->InsertEndChild(graph_el);

    for (const auto& [id, node] : graph.Nodes()) {
        auto* node_el = doc.NewElement("node");
        node_el->SetAttribute("id", id.c_str());
        for (const auto& [name, value] : NodeAttributes(node)) {
            AppendData(doc, node_el, KeyId(keys, "node", name), value);
        }
        for (const auto& [name, value] : node.extra) {
            AppendData(doc, node_el, KeyId(keys, "node", "extra." + name), value);
        }
        graph_el->InsertEndChild(node_el);
    }

    size_t index = 0;
    for (const Edge* edge : graph.Edges()) {
        auto* edge_el = doc.NewElement("edge");
        edge_el->SetAttribute("id", ("e" + std::to_string(index++)).c_str());
        edge_el->SetAttribute("source", edge->from.c_str());
        edge_el->SetAttribute("target", edge->to.c_str());
        for (const auto& [name, value] : EdgeAttributes(*edge)) {
            AppendData(doc, edge_el, KeyId(keys, "edge", name), value);
        }
        for (const auto& [name, value] : edge->extra) {
            AppendData(doc, edge_el, KeyId(keys, "edge", "extra." + name), value);
        }
        graph_el->InsertEndChild(edge_el);
    }
}

} // anonymous namespace

std::string WriteGraphMl(const Graph& graph) {
    tinyxml2::XMLDocument doc;
    BuildDocument(graph, doc);
    tinyxml2::XMLPrinter printer;
    doc.Print(&printer);
    return std::string(printer.CStr());
}

Result<void, Error> WriteGraphMlFile(const Graph& graph, const std::string& path) {
    tinyxml2::XMLDocument doc;
    BuildDocument(graph, doc);
    if (doc.SaveFile(path.c_str()) != tinyxml2::XML_SUCCESS) {
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::Internal, "WriteGraphMlFile", path,
            std::string("Failed to write GraphML: ") +
                (doc.ErrorStr() != nullptr ? doc.ErrorStr() : "unknown error")));
    }
    return Result<void, Error>::Ok();
}

} // namespace catalog_graph
