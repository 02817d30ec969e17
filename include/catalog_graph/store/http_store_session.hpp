#pragma once

#include <catalog_graph/core/types.hpp>
#include <catalog_graph/store/i_store_session.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace catalog_graph {

// ---------------------------------------------------------------------------
// StoreSessionOptions: timeouts and TLS behaviour for the store session.
// ---------------------------------------------------------------------------
struct StoreSessionOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{60};
    bool disable_tls_verify = false;
};

// ---------------------------------------------------------------------------
// HttpStoreSession: IStoreSession over cpp-httplib.
//
// Uses pimpl to keep httplib out of the public header.
//
//   - Basic Auth on every request
//   - Requests go to `/_db/<database><path>`
//   - Accept: application/json
//   - Authorization is redacted in debug logs
//   - No retries; a failed transport surfaces as StoreUnavailable
// ---------------------------------------------------------------------------
class HttpStoreSession : public IStoreSession {
public:
    HttpStoreSession(const StoreUrl& url,
                     const std::string& user,
                     const std::string& password,
                     const DatabaseName& database,
                     const StoreSessionOptions& options = {});

    ~HttpStoreSession() override;

    HttpStoreSession(const HttpStoreSession&) = delete;
    HttpStoreSession& operator=(const HttpStoreSession&) = delete;
    HttpStoreSession(HttpStoreSession&&) = delete;
    HttpStoreSession& operator=(HttpStoreSession&&) = delete;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Put(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Delete(
        std::string_view path,
        const HttpHeaders& headers = {}) override;

    /// Database-qualified path the session sends for `path`.
    [[nodiscard]] std::string QualifiedPath(std::string_view path) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace catalog_graph
