#include <catalog_graph/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace catalog_graph {

namespace {

// ArangoDB reports failures as {"error":true,"errorNum":1203,"errorMessage":"..."}.
std::optional<std::string> ExtractStoreError(const std::string& body) {
    if (body.empty()) return std::nullopt;
    auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    if (!j.contains("errorMessage") || !j["errorMessage"].is_string()) {
        return std::nullopt;
    }
    auto msg = j["errorMessage"].get<std::string>();
    if (j.contains("errorNum") && j["errorNum"].is_number_integer()) {
        msg += " (errorNum " + std::to_string(j["errorNum"].get<int>()) + ")";
    }
    return msg;
}

} // anonymous namespace

Error MakeError(ErrorCategory category,
                std::string operation,
                std::string subject,
                std::string message,
                std::vector<std::string> details) {
    Error e;
    e.operation = std::move(operation);
    e.subject = std::move(subject);
    e.message = std::move(message);
    e.details = std::move(details);
    e.category = category;
    return e;
}

Error Error::FromStoreResponse(const std::string& operation,
                               const std::string& subject,
                               int status_code,
                               const std::string& response_body) {
    auto store_error = ExtractStoreError(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 401:
        case 403:
            category = ErrorCategory::StoreUnavailable;
            message = "Graph store rejected the credentials";
            break;
        case 404:
            category = ErrorCategory::GraphNotFound;
            message = "Not found in graph store";
            break;
        case 409:
            category = ErrorCategory::GraphExists;
            message = "Conflict: object already exists in graph store";
            break;
        case 408:
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::StoreUnavailable;
            message = "Graph store unavailable";
            break;
        default:
            category = ErrorCategory::Internal;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    Error e = MakeError(category, operation, subject, message);
    e.http_status = status_code;
    e.store_error = store_error;
    return e;
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Config:              return 2;
        case ErrorCategory::CatalogUnavailable:  return 3;
        case ErrorCategory::CatalogIntegrity:    return 3;
        case ErrorCategory::UnknownNode:         return 4;
        case ErrorCategory::DuplicateNode:       return 4;
        case ErrorCategory::DuplicateEdge:       return 4;
        case ErrorCategory::InvalidEdge:         return 4;
        case ErrorCategory::NoPath:              return 5;
        case ErrorCategory::NoApplicableConcept: return 6;
        case ErrorCategory::AmbiguousResolution: return 6;
        case ErrorCategory::StoreUnavailable:    return 7;
        case ErrorCategory::PartialWrite:        return 8;
        case ErrorCategory::GraphNotFound:       return 9;
        case ErrorCategory::GraphExists:         return 9;
        case ErrorCategory::Cancelled:           return 10;
        case ErrorCategory::Internal:            return 99;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::UnknownNode:         return "unknown_node";
        case ErrorCategory::DuplicateNode:       return "duplicate_node";
        case ErrorCategory::DuplicateEdge:       return "duplicate_edge";
        case ErrorCategory::InvalidEdge:         return "invalid_edge";
        case ErrorCategory::CatalogIntegrity:    return "catalog_integrity";
        case ErrorCategory::CatalogUnavailable:  return "catalog_unavailable";
        case ErrorCategory::NoPath:              return "no_path";
        case ErrorCategory::NoApplicableConcept: return "no_applicable_concept";
        case ErrorCategory::AmbiguousResolution: return "ambiguous_resolution";
        case ErrorCategory::StoreUnavailable:    return "store_unavailable";
        case ErrorCategory::PartialWrite:        return "partial_write";
        case ErrorCategory::GraphNotFound:       return "graph_not_found";
        case ErrorCategory::GraphExists:         return "graph_exists";
        case ErrorCategory::Cancelled:           return "cancelled";
        case ErrorCategory::Config:              return "config";
        case ErrorCategory::Internal:            return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!subject.empty()) {
        oss << " [" << subject << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    if (batch_index.has_value()) {
        oss << " (batch " << *batch_index << ")";
    }
    oss << ": " << message;
    if (!details.empty()) {
        oss << " {";
        for (size_t i = 0; i < details.size(); ++i) {
            if (i > 0) oss << "; ";
            oss << details[i];
        }
        oss << "}";
    }
    if (store_error.has_value() && !store_error->empty()) {
        oss << " (store: " << *store_error << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body;
    body["category"] = CategoryName();
    body["operation"] = operation;
    if (!subject.empty()) {
        body["subject"] = subject;
    }
    body["message"] = message;
    if (!details.empty()) {
        body["details"] = details;
    }
    if (batch_index.has_value()) {
        body["batch_index"] = *batch_index;
    }
    if (http_status.has_value()) {
        body["http_status"] = *http_status;
    }
    if (store_error.has_value() && !store_error->empty()) {
        body["store_error"] = *store_error;
    }
    body["exit_code"] = ExitCode();
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace catalog_graph
