#pragma once
#include "http.hpp"
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace clipmind {

// Scripted HttpClient for encoder tests. Replies are taken from `queued`
// first, then `fallback`. Safe to call from the embedding batch workers.
class MockHttpClient : public HttpClient {
public:
    HttpResponse fallback;
    std::deque<HttpResponse> queued;

    std::string last_url;
    std::string last_body;
    std::vector<Header> last_headers;
    std::vector<std::string> bodies;
    int call_count = 0;

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long /*timeout_seconds*/) override {
        std::lock_guard<std::mutex> lock(mutex_);
        call_count++;
        last_url = url;
        last_body = body;
        last_headers = headers;
        bodies.push_back(body);
        if (queued.empty()) return fallback;
        HttpResponse resp = queued.front();
        queued.pop_front();
        return resp;
    }

    // Value of a header from the last request.
    std::optional<std::string> header(const std::string& name) const {
        for (const auto& [key, value] : last_headers) {
            if (key == name) return value;
        }
        return std::nullopt;
    }

private:
    std::mutex mutex_;
};

} // namespace clipmind
