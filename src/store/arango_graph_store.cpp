#include <catalog_graph/store/arango_graph_store.hpp>

#include <catalog_graph/core/log.hpp>
#include <catalog_graph/core/url.hpp>

namespace catalog_graph {

namespace {

constexpr const char* kJson = "application/json";

bool IsSuccess(int status) { return status >= 200 && status < 300; }

Error MalformedResponse(const std::string& operation, const std::string& subject,
                        const std::string& what) {
    return MakeError(ErrorCategory::Internal, operation, subject,
                     "Malformed graph store response: " + what);
}

// Body parsed without throwing; a discarded value signals invalid JSON.
nlohmann::json ParseBody(const std::string& body) {
    return nlohmann::json::parse(body, nullptr, false);
}

std::optional<std::string> FirstString(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array() || it->empty() || !(*it)[0].is_string()) {
        return std::nullopt;
    }
    return (*it)[0].get<std::string>();
}

// Strict serialization: attribute text that is not valid UTF-8 would be
// altered on the wire, so it fails the write instead.
Result<std::string, Error> SerializeBody(const nlohmann::json& body,
                                         const std::string& operation,
                                         const std::string& subject) {
    try {
        return Result<std::string, Error>::Ok(body.dump());
    } catch (const nlohmann::json::type_error& e) {
        return Result<std::string, Error>::Err(
            MakeError(ErrorCategory::Internal, operation, subject,
                      "Document text is not valid UTF-8", {e.what()}));
    }
}

} // anonymous namespace

ArangoGraphStore::ArangoGraphStore(IStoreSession& session) : session_(session) {}

ArangoGraphStore::ArangoGraphStore(std::unique_ptr<IStoreSession> session)
    : owned_(std::move(session)), session_(*owned_) {}

// ---------------------------------------------------------------------------
// Graph definitions
// ---------------------------------------------------------------------------

Result<std::optional<GraphDefinition>, Error> ArangoGraphStore::GetGraph(
    const std::string& name) {
    using R = Result<std::optional<GraphDefinition>, Error>;
    const std::string op = "ArangoGraphStore::GetGraph";

    auto resp = session_.Get("/_api/gharial/" + UrlEncode(name));
    if (resp.IsErr()) return R::Err(std::move(resp).Error());
    const auto& http = resp.Value();
    if (http.status_code == 404) {
        return R::Ok(std::nullopt);
    }
    if (!IsSuccess(http.status_code)) {
        return R::Err(Error::FromStoreResponse(op, name, http.status_code, http.body));
    }

    auto doc = ParseBody(http.body);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("graph") ||
        !doc["graph"].is_object()) {
        return R::Err(MalformedResponse(op, name, "missing 'graph' object"));
    }
    const auto& graph = doc["graph"];

    GraphDefinition def;
    def.name = name;
    auto edge_defs = graph.find("edgeDefinitions");
    if (edge_defs != graph.end() && edge_defs->is_array() && !edge_defs->empty()) {
        const auto& first = (*edge_defs)[0];
        if (!first.is_object() || !first.contains("collection") ||
            !first["collection"].is_string()) {
            return R::Err(MalformedResponse(op, name, "edge definition without collection"));
        }
        def.edge_collection = first["collection"].get<std::string>();
        def.node_collection = FirstString(first, "from").value_or(std::string());
    }
    if (def.node_collection.empty()) {
        def.node_collection = FirstString(graph, "orphanCollections").value_or(std::string());
    }
    if (def.node_collection.empty()) {
        return R::Err(MalformedResponse(op, name, "graph has no node collection"));
    }
    return R::Ok(std::move(def));
}

Result<void, Error> ArangoGraphStore::CreateGraph(const GraphDefinition& definition) {
    using R = Result<void, Error>;
    nlohmann::json body = {
        {"name", definition.name},
        {"edgeDefinitions", nlohmann::json::array({
            {{"collection", definition.edge_collection},
             {"from", {definition.node_collection}},
             {"to", {definition.node_collection}}},
        })},
    };
    auto resp = session_.Post("/_api/gharial", body.dump(), kJson);
    if (resp.IsErr()) return R::Err(std::move(resp).Error());
    const auto& http = resp.Value();
    if (!IsSuccess(http.status_code)) {
        return R::Err(Error::FromStoreResponse("ArangoGraphStore::CreateGraph",
                                               definition.name, http.status_code,
                                               http.body));
    }
    LogDebug("store", "created graph definition " + definition.name + " over " +
                          definition.node_collection + "/" + definition.edge_collection);
    return R::Ok();
}

Result<void, Error> ArangoGraphStore::DeleteGraph(const std::string& name) {
    using R = Result<void, Error>;
    auto resp = session_.Delete("/_api/gharial/" + UrlEncode(name) +
                                "?dropCollections=false");
    if (resp.IsErr()) return R::Err(std::move(resp).Error());
    const auto& http = resp.Value();
    if (!IsSuccess(http.status_code)) {
        return R::Err(Error::FromStoreResponse("ArangoGraphStore::DeleteGraph", name,
                                               http.status_code, http.body));
    }
    return R::Ok();
}

// ---------------------------------------------------------------------------
// Collections
// ---------------------------------------------------------------------------

Result<std::vector<std::string>, Error> ArangoGraphStore::ListCollections() {
    using R = Result<std::vector<std::string>, Error>;
    const std::string op = "ArangoGraphStore::ListCollections";

    auto resp = session_.Get("/_api/collection?excludeSystem=true");
    if (resp.IsErr()) return R::Err(std::move(resp).Error());
    const auto& http = resp.Value();
    if (!IsSuccess(http.status_code)) {
        return R::Err(Error::FromStoreResponse(op, "", http.status_code, http.body));
    }
    auto doc = ParseBody(http.body);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("result") ||
        !doc["result"].is_array()) {
        return R::Err(MalformedResponse(op, "", "missing 'result' array"));
    }
    std::vector<std::string> names;
    for (const auto& entry : doc["result"]) {
        if (entry.is_object() && entry.contains("name") && entry["name"].is_string()) {
            names.push_back(entry["name"].get<std::string>());
        }
    }
    return R::Ok(std::move(names));
}

Result<void, Error> ArangoGraphStore::CreateCollection(const std::string& name,
                                                       CollectionType type) {
    using R = Result<void, Error>;
    nlohmann::json body = {
        {"name", name},
        {"type", type == CollectionType::Edge ? 3 : 2},
    };
    auto resp = session_.Post("/_api/collection", body.dump(), kJson);
    if (resp.IsErr()) return R::Err(std::move(resp).Error());
    const auto& http = resp.Value();
    if (!IsSuccess(http.status_code)) {
        return R::Err(Error::FromStoreResponse("ArangoGraphStore::CreateCollection", name,
                                               http.status_code, http.body));
    }
    return R::Ok();
}

Result<void, Error> ArangoGraphStore::DropCollection(const std::string& name) {
    using R = Result<void, Error>;
    auto resp = session_.Delete("/_api/collection/" + UrlEncode(name));
    if (resp.IsErr()) return R::Err(std::move(resp).Error());
    const auto& http = resp.Value();
    if (http.status_code == 404) {
        return R::Ok();
    }
    if (!IsSuccess(http.status_code)) {
        return R::Err(Error::FromStoreResponse("ArangoGraphStore::DropCollection", name,
                                               http.status_code, http.body));
    }
    return R::Ok();
}

// ---------------------------------------------------------------------------
// Documents
// ---------------------------------------------------------------------------

Result<void, Error> ArangoGraphStore::InsertDocuments(
    const std::string& collection, const std::vector<nlohmann::json>& documents) {
    using R = Result<void, Error>;
    const std::string op = "ArangoGraphStore::InsertDocuments";
    if (documents.empty()) {
        return R::Ok();
    }

    nlohmann::json body = nlohmann::json::array();
    for (const auto& d : documents) body.push_back(d);

    auto payload = SerializeBody(body, op, collection);
    if (payload.IsErr()) return R::Err(std::move(payload).Error());

    auto resp = session_.Post("/_api/document/" + UrlEncode(collection),
                              payload.Value(), kJson);
    if (resp.IsErr()) return R::Err(std::move(resp).Error());
    const auto& http = resp.Value();
    if (!IsSuccess(http.status_code)) {
        return R::Err(Error::FromStoreResponse(op, collection, http.status_code, http.body));
    }

    // A batch insert answers 201/202 even when single documents were
    // rejected; those carry `"error": true` in the result array.
    auto doc = ParseBody(http.body);
    if (doc.is_discarded() || !doc.is_array()) {
        return R::Ok();
    }
    std::vector<std::string> rejected;
    std::optional<std::string> first_message;
    for (size_t i = 0; i < doc.size(); ++i) {
        const auto& entry = doc[i];
        if (!entry.is_object() || !entry.value("error", false)) continue;
        auto message = entry.value("errorMessage", std::string("unknown error"));
        if (!first_message) first_message = message;
        rejected.push_back(std::to_string(i) + ": " + message);
    }
    if (!rejected.empty()) {
        auto err = MakeError(ErrorCategory::Internal, op, collection,
                             std::to_string(rejected.size()) + " of " +
                                 std::to_string(documents.size()) +
                                 " documents were rejected",
                             std::move(rejected));
        err.http_status = http.status_code;
        err.store_error = first_message;
        return R::Err(std::move(err));
    }
    return R::Ok();
}

Result<std::vector<nlohmann::json>, Error> ArangoGraphStore::ReadCollection(
    const std::string& collection, size_t batch_size) {
    using R = Result<std::vector<nlohmann::json>, Error>;
    const std::string op = "ArangoGraphStore::ReadCollection";

    nlohmann::json query = {
        {"query", "FOR d IN @@collection SORT d._key RETURN d"},
        {"bindVars", {{"@collection", collection}}},
        {"batchSize", batch_size},
    };
    auto resp = session_.Post("/_api/cursor", query.dump(), kJson);

    std::vector<nlohmann::json> documents;
    size_t batches = 0;
    while (true) {
        if (resp.IsErr()) return R::Err(std::move(resp).Error());
        const auto& http = resp.Value();
        if (!IsSuccess(http.status_code)) {
            return R::Err(Error::FromStoreResponse(op, collection, http.status_code,
                                                   http.body));
        }
        auto doc = ParseBody(http.body);
        if (doc.is_discarded() || !doc.is_object() || !doc.contains("result") ||
            !doc["result"].is_array()) {
            return R::Err(MalformedResponse(op, collection, "cursor without 'result'"));
        }
        ++batches;
        for (auto& d : doc["result"]) documents.push_back(std::move(d));

        if (!doc.value("hasMore", false)) break;
        auto id = doc.find("id");
        if (id == doc.end() || !id->is_string()) {
            return R::Err(MalformedResponse(op, collection, "cursor has more but no id"));
        }
        resp = session_.Put("/_api/cursor/" + id->get<std::string>(), "", kJson);
    }

    LogDebug("store", "read " + std::to_string(documents.size()) + " document(s) from " +
                          collection + " in " + std::to_string(batches) + " batch(es)");
    return R::Ok(std::move(documents));
}

} // namespace catalog_graph
