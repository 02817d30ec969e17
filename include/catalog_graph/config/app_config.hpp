#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace catalog_graph {

struct CatalogConfig {
    std::string path;   // SQLite catalog database
};

struct StoreConfig {
    std::string url = "http://localhost:8529";
    std::string database = "manufacturing_semantics";
    std::string user = "root";
    std::string password;
    std::optional<std::string> password_env; // env var name to read password from
    size_t batch_size = 1000;
    int connect_timeout_seconds = 10;
    int read_timeout_seconds = 60;
    bool disable_tls_verify = false;
};

struct GraphNamesConfig {
    std::string schema = "manufacturing_schema";
    std::string semantic = "manufacturing_semantic_layer";
};

struct AppConfig {
    CatalogConfig catalog;
    StoreConfig store;
    GraphNamesConfig graphs;
    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    int timeout_seconds = 120;   // 0 disables the operation deadline
};

} // namespace catalog_graph
