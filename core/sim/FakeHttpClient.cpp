#include "FakeHttpClient.hpp"
#include <algorithm>

namespace nrfsim::sim {

void FakeHttpClient::respond(const std::string& method, const std::string& url, int statusCode,
                             const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    Scripted scripted;
    scripted.response = HttpResponse{statusCode, body};
    scripts_[Key(method, url)].push_back(scripted);
}

void FakeHttpClient::failWith(const std::string& method, const std::string& url, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    Scripted scripted;
    scripted.error = error;
    scripts_[Key(method, url)].push_back(scripted);
}

std::optional<HttpResponse> FakeHttpClient::send(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);

    auto it = scripts_.find(Key(request.method, request.url));
    if (it == scripts_.end() || it->second.empty()) {
        lastError_ = "No scripted response for " + request.method + " " + request.url;
        return std::nullopt;
    }

    Scripted scripted = it->second.front();
    if (it->second.size() > 1) {
        it->second.pop_front();
    }

    if (!scripted.response) {
        lastError_ = scripted.error;
        return std::nullopt;
    }
    lastError_.clear();
    return scripted.response;
}

std::string FakeHttpClient::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

std::vector<HttpRequest> FakeHttpClient::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

int FakeHttpClient::requestCount(const std::string& method, const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(std::count_if(requests_.begin(), requests_.end(), [&](const HttpRequest& r) {
        return r.method == method && r.url == url;
    }));
}

} // namespace nrfsim::sim
