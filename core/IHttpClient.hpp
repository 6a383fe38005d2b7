/**
 * @file IHttpClient.hpp
 * @brief Minimal HTTPS client interface for the cloud REST API and CA download
 *
 * Like IMqttClient, failures below the domain are reported without
 * exceptions: a transport failure (DNS, TLS, timeout) yields an empty
 * optional, an HTTP error yields a response with its status code.
 *
 * @date 2025
 * @version 1.0
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace nrfsim {

struct HttpRequest {
    std::string method = "GET";
    std::string url;                                ///< Absolute https:// URL
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
};

struct HttpResponse {
    int statusCode = 0;
    std::string body;

    bool ok() const { return statusCode >= 200 && statusCode < 300; }
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief Perform one request synchronously
     * @return Response for any completed exchange, std::nullopt if no response
     *         arrived (connect failure, TLS failure, timeout)
     */
    virtual std::optional<HttpResponse> send(const HttpRequest& request) = 0;

    /// Human-readable reason for the last std::nullopt
    virtual std::string lastError() const = 0;
};

} // namespace nrfsim
