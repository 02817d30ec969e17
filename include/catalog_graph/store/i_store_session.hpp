#pragma once

#include <catalog_graph/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace catalog_graph {

// ---------------------------------------------------------------------------
// HttpHeaders: header name to value. Names are case-sensitive here;
// callers normalise as needed.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpResponse: the result of an HTTP request.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IStoreSession: abstract HTTP session against one graph store database.
//
// Paths are database-relative (`/_api/...`); the session adds the database
// prefix. A transport failure is an Err with category StoreUnavailable; any
// HTTP status, including 4xx/5xx, is an Ok response for the caller to map.
// ---------------------------------------------------------------------------
class IStoreSession {
public:
    virtual ~IStoreSession() = default;

    IStoreSession(const IStoreSession&) = delete;
    IStoreSession& operator=(const IStoreSession&) = delete;
    IStoreSession(IStoreSession&&) = delete;
    IStoreSession& operator=(IStoreSession&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Put(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Delete(
        std::string_view path,
        const HttpHeaders& headers = {}) = 0;

protected:
    IStoreSession() = default;
};

} // namespace catalog_graph
