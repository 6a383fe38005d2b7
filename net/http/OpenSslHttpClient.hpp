/**
 * @file OpenSslHttpClient.hpp
 * @brief Blocking HTTPS/1.1 client on POSIX sockets and OpenSSL
 *
 * One connection per request ("Connection: close"). Server certificates are
 * verified against the system trust store and the requested host name.
 * Connect, send and receive are each bounded by the request timeout.
 *
 * @date 2025
 * @version 1.0
 */

#pragma once

#include "IHttpClient.hpp"
#include <openssl/ssl.h>
#include <cstdint>
#include <string>

namespace nrfsim {

class OpenSslHttpClient : public IHttpClient {
public:
    OpenSslHttpClient();
    ~OpenSslHttpClient() override;

    OpenSslHttpClient(const OpenSslHttpClient&) = delete;
    OpenSslHttpClient& operator=(const OpenSslHttpClient&) = delete;

    std::optional<HttpResponse> send(const HttpRequest& request) override;
    std::string lastError() const override { return lastError_; }

    struct ParsedUrl {
        std::string host;
        std::uint16_t port = 443;
        std::string path = "/";
    };

    /// Only https:// URLs are accepted
    static std::optional<ParsedUrl> parseUrl(const std::string& url);

    /// Split a raw HTTP/1.1 response; handles Content-Length and chunked bodies
    static std::optional<HttpResponse> parseResponse(const std::string& raw);

private:
    int openSocket(const ParsedUrl& url, std::chrono::milliseconds timeout);
    std::optional<HttpResponse> fail(const std::string& message);

    SSL_CTX* ctx_;
    std::string lastError_;
};

} // namespace nrfsim
