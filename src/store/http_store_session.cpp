#include <catalog_graph/store/http_store_session.hpp>

#include <catalog_graph/core/log.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <functional>

namespace catalog_graph {

namespace {

std::string Lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool IsSensitiveHeader(std::string_view key) {
    auto lower = Lower(key);
    return lower == "authorization" || lower == "cookie" || lower == "set-cookie";
}

std::string DescribeTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Connection:
            return "Could not connect to graph store";
        case httplib::Error::ConnectionTimeout:
            return "Timed out connecting to graph store";
        case httplib::Error::Read:
            return "Timed out or failed reading from graph store";
        case httplib::Error::Write:
            return "Failed writing request to graph store";
        case httplib::Error::SSLConnection:
        case httplib::Error::SSLServerVerification:
            return "TLS handshake with graph store failed";
        default:
            return "HTTP request failed";
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

httplib::Headers BuildRequestHeaders(const HttpHeaders& extra) {
    httplib::Headers hdrs;
    hdrs.emplace("Accept", "application/json");
    for (const auto& [key, value] : extra) {
        hdrs.emplace(key, value);
    }
    return hdrs;
}

void LogRequestHeaders(const httplib::Headers& hdrs) {
    for (const auto& [k, v] : hdrs) {
        LogDebug("http", "  > " + k + ": " + (IsSensitiveHeader(k) ? "<redacted>" : v));
    }
}

void LogResponse(int status, const std::string& body) {
    LogInfo("http", "  < " + std::to_string(status));
    if (status >= 400 && !body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        if (body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + body);
        } else {
            LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl: pimpl body holding the httplib::Client.
// ---------------------------------------------------------------------------
struct HttpStoreSession::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string prefix;
    std::string base_url;

    Impl(const StoreUrl& url, const std::string& user, const std::string& password,
         const DatabaseName& database, const StoreSessionOptions& opts)
        : prefix("/_db/" + database.Value()), base_url(url.Value()) {
        client = std::make_unique<httplib::Client>(base_url);

        client->set_basic_auth(user, password);
        client->set_connection_timeout(opts.connect_timeout);
        client->set_read_timeout(opts.read_timeout);

#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        if (url.UseTls() && opts.disable_tls_verify) {
            client->enable_server_certificate_verification(false);
        }
#endif
    }

    // Run one request. `send` performs the httplib call for the given
    // qualified path and headers.
    Result<HttpResponse, Error> Execute(
        const char* method, std::string_view path, const HttpHeaders& extra,
        const std::function<httplib::Result(const std::string&,
                                            const httplib::Headers&)>& send) {
        const auto full_path = prefix + std::string(path);
        auto hdrs = BuildRequestHeaders(extra);
        LogInfo("http", std::string(method) + " " + full_path);
        LogRequestHeaders(hdrs);

        auto res = send(full_path, hdrs);
        if (!res) {
            const auto http_error = res.error();
            return Result<HttpResponse, Error>::Err(Error{
                std::string("HttpStoreSession::") + method, base_url + full_path,
                DescribeTransportError(http_error) + ": " + httplib::to_string(http_error),
                {}, ErrorCategory::StoreUnavailable});
        }
        LogResponse(res->status, res->body);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }
};

HttpStoreSession::HttpStoreSession(const StoreUrl& url,
                                   const std::string& user,
                                   const std::string& password,
                                   const DatabaseName& database,
                                   const StoreSessionOptions& options)
    : impl_(std::make_unique<Impl>(url, user, password, database, options)) {}

HttpStoreSession::~HttpStoreSession() = default;

std::string HttpStoreSession::QualifiedPath(std::string_view path) const {
    return impl_->prefix + std::string(path);
}

Result<HttpResponse, Error> HttpStoreSession::Get(std::string_view path,
                                                  const HttpHeaders& headers) {
    auto& client = *impl_->client;
    return impl_->Execute("GET", path, headers,
                          [&](const std::string& p, const httplib::Headers& h) {
                              return client.Get(p, h);
                          });
}

Result<HttpResponse, Error> HttpStoreSession::Post(std::string_view path,
                                                   std::string_view body,
                                                   std::string_view content_type,
                                                   const HttpHeaders& headers) {
    auto& client = *impl_->client;
    return impl_->Execute("POST", path, headers,
                          [&](const std::string& p, const httplib::Headers& h) {
                              return client.Post(p, h, std::string(body),
                                                 std::string(content_type));
                          });
}

Result<HttpResponse, Error> HttpStoreSession::Put(std::string_view path,
                                                  std::string_view body,
                                                  std::string_view content_type,
                                                  const HttpHeaders& headers) {
    auto& client = *impl_->client;
    return impl_->Execute("PUT", path, headers,
                          [&](const std::string& p, const httplib::Headers& h) {
                              return client.Put(p, h, std::string(body),
                                                std::string(content_type));
                          });
}

Result<HttpResponse, Error> HttpStoreSession::Delete(std::string_view path,
                                                     const HttpHeaders& headers) {
    auto& client = *impl_->client;
    return impl_->Execute("DELETE", path, headers,
                          [&](const std::string& p, const httplib::Headers& h) {
                              return client.Delete(p, h);
                          });
}

} // namespace catalog_graph
