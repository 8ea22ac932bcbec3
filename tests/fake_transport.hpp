#pragma once

#include "config.hpp"
#include "http_client.hpp"

#include <chrono>
#include <deque>
#include <stdexcept>
#include <string>
#include <vector>

namespace stock_sync {
namespace testing_support {

/// In-memory HttpTransport: records every request (and when it was sent) and replays queued
/// responses in order. A queued error is thrown as std::runtime_error,
/// the same way HttpClient reports network failures.
class FakeTransport : public HttpTransport {
public:
    struct Reply {
        HttpResponse response;
        std::string  error;   // non-empty: throw instead of responding
    };

    void enqueue(unsigned int status, std::string body, std::string link = "") {
        Reply r;
        r.response.httpStatus = status;
        r.response.body       = std::move(body);
        r.response.link       = std::move(link);
        mReplies.push_back(std::move(r));
    }

    void enqueueError(std::string message) {
        Reply r;
        r.error = std::move(message);
        mReplies.push_back(std::move(r));
    }

    HttpResponse send(const HttpRequest& request) override {
        requests.push_back(request);
        sentAt.push_back(std::chrono::steady_clock::now());
        if (mReplies.empty()) {
            throw std::runtime_error("FakeTransport: no reply queued for " + request.url);
        }
        Reply r = std::move(mReplies.front());
        mReplies.pop_front();
        if (!r.error.empty()) {
            throw std::runtime_error(r.error);
        }
        return r.response;
    }

    std::size_t pending() const { return mReplies.size(); }

    std::vector<HttpRequest> requests;
    std::vector<std::chrono::steady_clock::time_point> sentAt;   // parallel to requests

private:
    std::deque<Reply> mReplies;
};

/// Config pointing at a mock host, no pacing.
inline Config makeTestConfig() {
    Config cfg;
    cfg.storeDomain       = "shop.example.com";
    cfg.accessToken       = "shpat_test";
    cfg.locationId        = "555";
    cfg.posBaseUrl        = "http://pos.example.com/export";
    cfg.posPassword       = "s3cret";
    cfg.itemSpacingMs     = 0;
    cfg.mutationSpacingMs = 0;
    return cfg;
}

} // namespace testing_support
} // namespace stock_sync
