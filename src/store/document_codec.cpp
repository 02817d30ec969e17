#include <catalog_graph/store/document_codec.hpp>

#include <catalog_graph/core/url.hpp>

#include <type_traits>

namespace catalog_graph {

namespace {

constexpr const char* kDecodeNode = "NodeFromDocument";
constexpr const char* kDecodeEdge = "EdgeFromDocument";

Error MalformedDocument(const char* operation, const std::string& subject,
                        const std::string& message) {
    return MakeError(ErrorCategory::Internal, operation, subject,
                     "Malformed document: " + message);
}

nlohmann::json ExtraToJson(const Attributes& extra) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [k, v] : extra) out[k] = v;
    return out;
}

Attributes ExtraFromJson(const nlohmann::json& document) {
    Attributes extra;
    auto it = document.find("extra");
    if (it == document.end() || !it->is_object()) return extra;
    for (const auto& [k, v] : it->items()) {
        extra[k] = v.get<std::string>();
    }
    return extra;
}

// Node id behind an `_from`/`_to` handle ("<collection>/<key>").
std::optional<std::string> NodeIdFromHandle(const std::string& handle) {
    auto slash = handle.find('/');
    if (slash == std::string::npos) return std::nullopt;
    return NodeIdFromKey(handle.substr(slash + 1));
}

} // anonymous namespace

std::string DocumentKey(const std::string& node_id) {
    // '~' survives percent-encoding but is not a legal store key character.
    auto encoded = UrlEncode(node_id);
    std::string out;
    out.reserve(encoded.size());
    for (char c : encoded) {
        if (c == '~') {
            out += "%7E";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<std::string> NodeIdFromKey(const std::string& key) {
    return UrlDecode(key);
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

nlohmann::json NodeToDocument(const Node& node) {
    nlohmann::json doc = {
        {"_key", DocumentKey(node.id)},
        {"label", node.id},
        {"kind", NodeKindName(node.Kind())},
    };
    std::visit([&](const auto& d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, TableNode>) {
            doc["name"] = d.name;
            doc["table_kind"] = d.kind;
            doc["description"] = d.description;
        } else if constexpr (std::is_same_v<T, FieldNode>) {
            doc["table"] = d.table;
            doc["column"] = d.column;
        } else {
            doc["name"] = d.name;
            doc["description"] = d.description;
        }
    }, node.data);
    doc["extra"] = ExtraToJson(node.extra);
    return doc;
}

nlohmann::json EdgeToDocument(const Edge& edge, size_t index,
                              const std::string& node_collection) {
    nlohmann::json doc = {
        {"_key", "e" + std::to_string(index)},
        {"_from", node_collection + "/" + DocumentKey(edge.from)},
        {"_to", node_collection + "/" + DocumentKey(edge.to)},
        {"kind", EdgeKindName(edge.Kind())},
        {"label", edge.Label()},
    };
    std::visit([&](const auto& d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, JoinEdge>) {
            doc["relationship_kind"] = d.relationship_kind;
            doc["join_column"] = d.join_column;
            doc["weight"] = d.weight;
        } else if constexpr (std::is_same_v<T, OperatesWithinEdge>) {
            doc["weight"] = d.weight;
        } else if constexpr (std::is_same_v<T, CanMeanEdge>) {
            doc["is_primary"] = d.is_primary;
            doc["table_alias"] = d.table_alias;
        } else if constexpr (std::is_same_v<T, InfluenceEdge>) {
            doc["polarity"] = PolarityName(d.polarity);
            doc["weight"] = d.weight;
        }
    }, edge.data);
    doc["extra"] = ExtraToJson(edge.extra);
    return doc;
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------

Result<Node, Error> NodeFromDocument(const nlohmann::json& document) {
    using R = Result<Node, Error>;
    if (!document.is_object()) {
        return R::Err(MalformedDocument(kDecodeNode, "", "not an object"));
    }
    const auto key = document.value("_key", std::string());
    try {
        Node node;
        node.id = document.at("label").get<std::string>();
        auto kind = ParseNodeKind(document.at("kind").get<std::string>());
        if (!kind) {
            return R::Err(MalformedDocument(kDecodeNode, key,
                                            "unknown node kind " + document.at("kind").dump()));
        }
        auto text = [&](const char* field) {
            return document.value(field, std::string());
        };
        switch (*kind) {
            case NodeKind::Table:
                node.data = TableNode{text("name"), text("table_kind"), text("description")};
                break;
            case NodeKind::Field:
                node.data = FieldNode{text("table"), text("column")};
                break;
            case NodeKind::Intent:
                node.data = IntentNode{text("name"), text("description")};
                break;
            case NodeKind::Perspective:
                node.data = PerspectiveNode{text("name"), text("description")};
                break;
            case NodeKind::Concept:
                node.data = ConceptNode{text("name"), text("description")};
                break;
        }
        node.extra = ExtraFromJson(document);
        return R::Ok(std::move(node));
    } catch (const nlohmann::json::exception& e) {
        return R::Err(MalformedDocument(kDecodeNode, key, e.what()));
    }
}

Result<Edge, Error> EdgeFromDocument(const nlohmann::json& document) {
    using R = Result<Edge, Error>;
    if (!document.is_object()) {
        return R::Err(MalformedDocument(kDecodeEdge, "", "not an object"));
    }
    const auto key = document.value("_key", std::string());
    try {
        Edge edge;
        auto from = NodeIdFromHandle(document.at("_from").get<std::string>());
        auto to = NodeIdFromHandle(document.at("_to").get<std::string>());
        if (!from || !to) {
            return R::Err(MalformedDocument(kDecodeEdge, key, "bad _from/_to handle"));
        }
        edge.from = *from;
        edge.to = *to;

        auto kind = ParseEdgeKind(document.at("kind").get<std::string>());
        if (!kind) {
            return R::Err(MalformedDocument(kDecodeEdge, key,
                                            "unknown edge kind " + document.at("kind").dump()));
        }
        switch (*kind) {
            case EdgeKind::Join:
                edge.data = JoinEdge{document.value("relationship_kind", std::string()),
                                     document.value("join_column", std::string()),
                                     document.at("weight").get<double>()};
                break;
            case EdgeKind::OperatesWithin:
                edge.data = OperatesWithinEdge{document.at("weight").get<double>()};
                break;
            case EdgeKind::UsesDefinition:
                edge.data = UsesDefinitionEdge{};
                break;
            case EdgeKind::CanMean:
                edge.data = CanMeanEdge{document.value("is_primary", false),
                                        document.value("table_alias", std::string())};
                break;
            case EdgeKind::Influence: {
                auto polarity = ParsePolarity(document.at("polarity").get<std::string>());
                if (!polarity) {
                    return R::Err(MalformedDocument(kDecodeEdge, key, "unknown polarity"));
                }
                edge.data = InfluenceEdge{*polarity, document.at("weight").get<double>()};
                break;
            }
        }
        edge.extra = ExtraFromJson(document);
        return R::Ok(std::move(edge));
    } catch (const nlohmann::json::exception& e) {
        return R::Err(MalformedDocument(kDecodeEdge, key, e.what()));
    }
}

} // namespace catalog_graph
