#include <catalog_graph/core/types.hpp>

#include <algorithm>
#include <optional>

namespace catalog_graph {

namespace {

constexpr size_t kMaxStoreNameLength = 64;

bool IsAsciiLetter(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool IsNameChar(char c) {
    return IsAsciiLetter(c) || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

std::optional<std::string> CheckStoreName(std::string_view name,
                                          std::string_view what,
                                          bool allow_leading_underscore) {
    if (name.empty()) {
        return std::string(what) + " must not be empty";
    }
    if (name.size() > kMaxStoreNameLength) {
        return std::string(what) + " must be at most 64 characters, got " +
               std::to_string(name.size());
    }
    if (!IsAsciiLetter(name[0]) && !(allow_leading_underscore && name[0] == '_')) {
        return std::string(what) + " must start with a letter";
    }
    if (!std::all_of(name.begin(), name.end(), IsNameChar)) {
        return std::string(what) +
               " must contain only letters, digits, '_' and '-'";
    }
    return std::nullopt;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// GraphName
// ---------------------------------------------------------------------------
Result<GraphName, std::string> GraphName::Create(std::string_view name) {
    if (auto problem = CheckStoreName(name, "Graph name", false)) {
        return Result<GraphName, std::string>::Err(std::move(*problem));
    }
    return Result<GraphName, std::string>::Ok(GraphName(std::string(name)));
}

// ---------------------------------------------------------------------------
// DatabaseName
// ---------------------------------------------------------------------------
Result<DatabaseName, std::string> DatabaseName::Create(std::string_view name) {
    if (auto problem = CheckStoreName(name, "Database name", true)) {
        return Result<DatabaseName, std::string>::Err(std::move(*problem));
    }
    return Result<DatabaseName, std::string>::Ok(DatabaseName(std::string(name)));
}

// ---------------------------------------------------------------------------
// StoreUrl
// ---------------------------------------------------------------------------
Result<StoreUrl, std::string> StoreUrl::Create(std::string_view url) {
    using R = Result<StoreUrl, std::string>;

    bool use_tls = false;
    std::string_view rest;
    if (url.substr(0, 7) == "http://") {
        rest = url.substr(7);
    } else if (url.substr(0, 8) == "https://") {
        use_tls = true;
        rest = url.substr(8);
    } else {
        return R::Err("Store URL must start with http:// or https://");
    }

    while (!rest.empty() && rest.back() == '/') {
        rest.remove_suffix(1);
    }
    if (rest.find('/') != std::string_view::npos) {
        return R::Err("Store URL must not contain a path");
    }

    std::string host;
    int port = use_tls ? 443 : 80;
    auto colon = rest.rfind(':');
    if (colon != std::string_view::npos) {
        host = std::string(rest.substr(0, colon));
        auto port_text = rest.substr(colon + 1);
        if (port_text.empty() || port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(),
                         [](char c) { return c >= '0' && c <= '9'; })) {
            return R::Err("Store URL has an invalid port");
        }
        port = std::stoi(std::string(port_text));
        if (port == 0 || port > 65535) {
            return R::Err("Store URL port must be between 1 and 65535");
        }
    } else {
        host = std::string(rest);
    }
    if (host.empty()) {
        return R::Err("Store URL must name a host");
    }

    std::string normalized = (use_tls ? "https://" : "http://") + host + ":" +
                             std::to_string(port);
    return R::Ok(StoreUrl(std::move(normalized), std::move(host), port, use_tls));
}

} // namespace catalog_graph
