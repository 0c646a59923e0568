#pragma once
#include "jsonapi/transport/HttpTransport.hpp"
#include <deque>
#include <string>
#include <vector>

/// Scripted HttpTransport: records every request and replays queued replies in order.
class MockTransport : public Tuner::HttpTransport {
public:
    /// Queue a reply with the given body and HTTP status
    void queueResponse(std::string body, unsigned status = 200) {
        replies_.push_back(Tuner::Result<Tuner::HttpResponse>::success(Tuner::HttpResponse{status, std::move(body)}));
    }

    /// Queue a connection-level failure
    void queueFailure(std::string message) {
        replies_.push_back(Tuner::Result<Tuner::HttpResponse>::failure(Tuner::TransportError{std::move(message)}));
    }

    Tuner::Result<Tuner::HttpResponse> post(const Tuner::HttpRequest& request) override {
        requests_.push_back(request);
        if (replies_.empty()) {
            return Tuner::Result<Tuner::HttpResponse>::failure(Tuner::TransportError{"mock: no reply queued"});
        }
        auto reply = std::move(replies_.front());
        replies_.pop_front();
        return reply;
    }

    const std::vector<Tuner::HttpRequest>& requests() const { return requests_; }
    const Tuner::HttpRequest& lastRequest() const { return requests_.back(); }
    size_t pending() const { return replies_.size(); }

private:
    std::deque<Tuner::Result<Tuner::HttpResponse>> replies_;
    std::vector<Tuner::HttpRequest> requests_;
};
