#pragma once

#include <catalog_graph/store/i_store_session.hpp>

#include <deque>
#include <string>
#include <vector>

namespace catalog_graph {
namespace testing {

// ---------------------------------------------------------------------------
// MockStoreSession: hand-written IStoreSession for offline tests.
//
//   MockStoreSession mock;
//   mock.EnqueueGet(Result<HttpResponse, Error>::Ok({200, {}, "{}"}));
//   auto result = mock.Get("/_api/gharial/g");
//   CHECK(mock.GetCalls()[0].path == "/_api/gharial/g");
//
// Responses are consumed FIFO per verb. An empty queue yields an Err
// instead of crashing.
// ---------------------------------------------------------------------------

struct GetCall {
    std::string path;
    HttpHeaders headers;
};

struct PostCall {
    std::string path;
    std::string body;
    std::string content_type;
    HttpHeaders headers;
};

struct PutCall {
    std::string path;
    std::string body;
    std::string content_type;
    HttpHeaders headers;
};

struct DeleteCall {
    std::string path;
    HttpHeaders headers;
};

class MockStoreSession : public IStoreSession {
public:
    MockStoreSession() = default;

    // -- Enqueue canned responses -------------------------------------------

    void EnqueueGet(Result<HttpResponse, Error> response) {
        get_responses_.push_back(std::move(response));
    }
    void EnqueuePost(Result<HttpResponse, Error> response) {
        post_responses_.push_back(std::move(response));
    }
    void EnqueuePut(Result<HttpResponse, Error> response) {
        put_responses_.push_back(std::move(response));
    }
    void EnqueueDelete(Result<HttpResponse, Error> response) {
        delete_responses_.push_back(std::move(response));
    }

    // Shorthand for an Ok response with a JSON body.
    static Result<HttpResponse, Error> Json(int status, std::string body) {
        return Result<HttpResponse, Error>::Ok(
            HttpResponse{status, {{"Content-Type", "application/json"}}, std::move(body)});
    }

    // -- Call history -------------------------------------------------------

    [[nodiscard]] const std::vector<GetCall>& GetCalls() const { return get_calls_; }
    [[nodiscard]] const std::vector<PostCall>& PostCalls() const { return post_calls_; }
    [[nodiscard]] const std::vector<PutCall>& PutCalls() const { return put_calls_; }
    [[nodiscard]] const std::vector<DeleteCall>& DeleteCalls() const { return delete_calls_; }

    [[nodiscard]] size_t GetCallCount() const { return get_calls_.size(); }
    [[nodiscard]] size_t PostCallCount() const { return post_calls_.size(); }
    [[nodiscard]] size_t PutCallCount() const { return put_calls_.size(); }
    [[nodiscard]] size_t DeleteCallCount() const { return delete_calls_.size(); }

    void Reset() {
        get_responses_.clear();
        post_responses_.clear();
        put_responses_.clear();
        delete_responses_.clear();
        get_calls_.clear();
        post_calls_.clear();
        put_calls_.clear();
        delete_calls_.clear();
    }

    // -- IStoreSession ------------------------------------------------------

    Result<HttpResponse, Error> Get(std::string_view path,
                                    const HttpHeaders& headers = {}) override {
        get_calls_.push_back({std::string(path), headers});
        return Dequeue(get_responses_, "Get", path);
    }

    Result<HttpResponse, Error> Post(std::string_view path, std::string_view body,
                                     std::string_view content_type,
                                     const HttpHeaders& headers = {}) override {
        post_calls_.push_back({std::string(path), std::string(body),
                               std::string(content_type), headers});
        return Dequeue(post_responses_, "Post", path);
    }

    Result<HttpResponse, Error> Put(std::string_view path, std::string_view body,
                                    std::string_view content_type,
                                    const HttpHeaders& headers = {}) override {
        put_calls_.push_back({std::string(path), std::string(body),
                              std::string(content_type), headers});
        return Dequeue(put_responses_, "Put", path);
    }

    Result<HttpResponse, Error> Delete(std::string_view path,
                                       const HttpHeaders& headers = {}) override {
        delete_calls_.push_back({std::string(path), headers});
        return Dequeue(delete_responses_, "Delete", path);
    }

private:
    static Result<HttpResponse, Error> Dequeue(
        std::deque<Result<HttpResponse, Error>>& queue,
        std::string_view operation,
        std::string_view path) {
        if (queue.empty()) {
            return Result<HttpResponse, Error>::Err(Error{
                std::string(operation), std::string(path),
                "MockStoreSession: no responses enqueued", {},
                ErrorCategory::Internal});
        }
        auto response = std::move(queue.front());
        queue.pop_front();
        return response;
    }

    std::deque<Result<HttpResponse, Error>> get_responses_;
    std::deque<Result<HttpResponse, Error>> post_responses_;
    std::deque<Result<HttpResponse, Error>> put_responses_;
    std::deque<Result<HttpResponse, Error>> delete_responses_;

    std::vector<GetCall> get_calls_;
    std::vector<PostCall> post_calls_;
    std::vector<PutCall> put_calls_;
    std::vector<DeleteCall> delete_calls_;
};

} // namespace testing
} // namespace catalog_graph
