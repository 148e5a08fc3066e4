#pragma once

#include <azlist/arm/i_arm_session.hpp>

#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace azlist {
namespace testing {

// ---------------------------------------------------------------------------
// MockArmSession: hand-written IArmSession for offline unit testing.
//
// Usage:
//   MockArmSession mock;
//   mock.EnqueueGet(Result<HttpResponse, Error>::Ok({200, {}, R"({"value":[]})"}));
//   auto result = mock.Get("/subscriptions/s1/providers/...");
//   CHECK(mock.GetCallCount() == 1);
//
// Responses are consumed FIFO. If the queue is empty when a method is called,
// the mock returns a descriptive error rather than crashing. All methods
// lock, so the mock can be shared with pool workers.
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

class MockArmSession : public IArmSession {
public:
    MockArmSession() = default;

    // -- Enqueue canned responses -------------------------------------------

    void EnqueueGet(Result<HttpResponse, Error> response) {
        std::lock_guard<std::mutex> lock(mutex_);
        get_responses_.push_back(std::move(response));
    }

    void EnqueuePost(Result<HttpResponse, Error> response) {
        std::lock_guard<std::mutex> lock(mutex_);
        post_responses_.push_back(std::move(response));
    }

    // -- Call history accessors ----------------------------------------------

    [[nodiscard]] std::vector<GetCall> GetCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return get_calls_;
    }
    [[nodiscard]] size_t GetCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return get_calls_.size();
    }

    [[nodiscard]] std::vector<PostCall> PostCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return post_calls_;
    }
    [[nodiscard]] size_t PostCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return post_calls_.size();
    }

    // -- IArmSession implementation ------------------------------------------

    Result<HttpResponse, Error> Get(
        std::string_view path,
        const CancellationToken& /*cancel*/ = {},
        const HttpHeaders& headers = {}) override {
        std::lock_guard<std::mutex> lock(mutex_);
        get_calls_.push_back({std::string(path), headers});
        return Dequeue(get_responses_, "Get", path);
    }

    Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const CancellationToken& /*cancel*/ = {},
        const HttpHeaders& headers = {}) override {
        std::lock_guard<std::mutex> lock(mutex_);
        post_calls_.push_back({
            std::string(path),
            std::string(body),
            std::string(content_type),
            headers,
        });
        return Dequeue(post_responses_, "Post", path);
    }

private:
    static Result<HttpResponse, Error> Dequeue(
        std::deque<Result<HttpResponse, Error>>& queue,
        std::string_view operation,
        std::string_view path) {
        if (queue.empty()) {
            return Result<HttpResponse, Error>::Err(MakeError(
                std::string(operation), "MockArmSession: no responses enqueued",
                ErrorCategory::Internal, std::string(path)));
        }
        auto response = std::move(queue.front());
        queue.pop_front();
        return response;
    }

    mutable std::mutex mutex_;

    std::deque<Result<HttpResponse, Error>> get_responses_;
    std::deque<Result<HttpResponse, Error>> post_responses_;

    std::vector<GetCall> get_calls_;
    std::vector<PostCall> post_calls_;
};

} // namespace testing
} // namespace azlist
