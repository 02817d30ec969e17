#pragma once

#include <catalog_graph/core/result.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace catalog_graph {

// ---------------------------------------------------------------------------
// GraphName: validated graph store name.
//
// Rules:
//   - Non-empty, max 64 characters
//   - Starts with an ASCII letter
//   - Then letters, digits, '_' or '-'
//
// Collection names are derived from it (`<name>_node_g<N>`), so the same
// alphabet keeps those valid as well.
// ---------------------------------------------------------------------------
class GraphName {
public:
    static Result<GraphName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const GraphName& other) const { return value_ == other.value_; }
    bool operator!=(const GraphName& other) const { return value_ != other.value_; }

private:
    explicit GraphName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// DatabaseName: store database name. Same alphabet as GraphName, also
// allows a leading '_' (ArangoDB's `_system`).
// ---------------------------------------------------------------------------
class DatabaseName {
public:
    static Result<DatabaseName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const DatabaseName& other) const { return value_ == other.value_; }
    bool operator!=(const DatabaseName& other) const { return value_ != other.value_; }

private:
    explicit DatabaseName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// StoreUrl: http:// or https:// base URL of the graph store, split into
// its parts. A trailing '/' is dropped.
// ---------------------------------------------------------------------------
class StoreUrl {
public:
    static Result<StoreUrl, std::string> Create(std::string_view url);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }
    [[nodiscard]] const std::string& Host() const noexcept { return host_; }
    [[nodiscard]] int Port() const noexcept { return port_; }
    [[nodiscard]] bool UseTls() const noexcept { return use_tls_; }

    bool operator==(const StoreUrl& other) const { return value_ == other.value_; }
    bool operator!=(const StoreUrl& other) const { return value_ != other.value_; }

private:
    StoreUrl(std::string value, std::string host, int port, bool use_tls)
        : value_(std::move(value)), host_(std::move(host)),
          port_(port), use_tls_(use_tls) {}
    std::string value_;
    std::string host_;
    int port_;
    bool use_tls_;
};

} // namespace catalog_graph

namespace std {

template <>
struct hash<catalog_graph::GraphName> {
    size_t operator()(const catalog_graph::GraphName& g) const noexcept {
        return hash<string>{}(g.Value());
    }
};

} // namespace std
