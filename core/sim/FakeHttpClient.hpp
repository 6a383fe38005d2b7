#pragma once

#include "../IHttpClient.hpp"
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nrfsim::sim {

/**
 * Scripted HTTP client. Responses are keyed by method and exact URL and
 * consumed in order; the last scripted response for a key repeats. An
 * unscripted request, or a scripted std::nullopt, behaves like a timeout.
 */
class FakeHttpClient : public IHttpClient {
public:
    void respond(const std::string& method, const std::string& url, int statusCode, const std::string& body = "");
    void failWith(const std::string& method, const std::string& url, const std::string& error);

    std::optional<HttpResponse> send(const HttpRequest& request) override;
    std::string lastError() const override;

    std::vector<HttpRequest> requests() const;
    int requestCount(const std::string& method, const std::string& url) const;

private:
    using Key = std::pair<std::string, std::string>;
    struct Scripted {
        std::optional<HttpResponse> response;
        std::string error;
    };

    mutable std::mutex mutex_;
    std::map<Key, std::deque<Scripted>> scripts_;
    std::vector<HttpRequest> requests_;
    std::string lastError_;
};

} // namespace nrfsim::sim
