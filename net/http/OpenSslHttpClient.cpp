#include "OpenSslHttpClient.hpp"
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace nrfsim {

namespace {

struct SslDeleter { void operator()(SSL* p) const { SSL_free(p); } };
using SslPtr = std::unique_ptr<SSL, SslDeleter>;

// Closes the socket on scope exit
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() { if (fd_ >= 0) ::close(fd_); }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
    int get() const { return fd_; }

private:
    int fd_;
};

std::string sslErrorString() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "TLS error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    ERR_clear_error();
    return buffer;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool decodeChunked(const std::string& body, std::string& out) {
    std::size_t pos = 0;
    while (pos < body.size()) {
        std::size_t lineEnd = body.find("\r\n", pos);
        if (lineEnd == std::string::npos) {
            return false;
        }
        std::string sizeField = body.substr(pos, lineEnd - pos);
        std::size_t semicolon = sizeField.find(';');
        if (semicolon != std::string::npos) {
            sizeField.resize(semicolon);
        }
        if (sizeField.empty() ||
            !std::all_of(sizeField.begin(), sizeField.end(),
                         [](unsigned char c) { return std::isxdigit(c) != 0; })) {
            return false;
        }
        std::size_t chunkSize = 0;
        try {
            chunkSize = std::stoul(sizeField, nullptr, 16);
        } catch (const std::out_of_range&) {
            return false;
        }
        pos = lineEnd + 2;
        if (chunkSize == 0) {
            return true;
        }
        // Chunk data plus its CRLF must fit in what was received
        std::size_t available = body.size() - pos;
        if (chunkSize > available || available - chunkSize < 2 ||
            body.compare(pos + chunkSize, 2, "\r\n") != 0) {
            return false;
        }
        out.append(body, pos, chunkSize);
        pos += chunkSize + 2;
    }
    return false;
}

} // namespace

OpenSslHttpClient::OpenSslHttpClient() : ctx_(SSL_CTX_new(TLS_client_method())) {
    if (ctx_) {
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
    }
}

OpenSslHttpClient::~OpenSslHttpClient() {
    if (ctx_) {
        SSL_CTX_free(ctx_);
    }
}

std::optional<HttpResponse> OpenSslHttpClient::fail(const std::string& message) {
    lastError_ = message;
    return std::nullopt;
}

std::optional<OpenSslHttpClient::ParsedUrl> OpenSslHttpClient::parseUrl(const std::string& url) {
    const std::string scheme = "https://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return std::nullopt;
    }

    std::string rest = url.substr(scheme.size());
    ParsedUrl parsed;

    std::size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    parsed.path = slash == std::string::npos ? "/" : rest.substr(slash);

    std::size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        try {
            int port = std::stoi(authority.substr(colon + 1));
            if (port <= 0 || port > 65535) {
                return std::nullopt;
            }
            parsed.port = static_cast<std::uint16_t>(port);
        } catch (const std::exception&) {
            return std::nullopt;
        }
        authority.resize(colon);
    }

    if (authority.empty()) {
        return std::nullopt;
    }
    parsed.host = authority;
    return parsed;
}

std::optional<HttpResponse> OpenSslHttpClient::parseResponse(const std::string& raw) {
    std::size_t headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        return std::nullopt;
    }

    std::istringstream headers(raw.substr(0, headerEnd));
    std::string statusLine;
    std::getline(headers, statusLine);

    // "HTTP/1.1 200 OK"
    std::istringstream status(statusLine);
    std::string version;
    HttpResponse response;
    if (!(status >> version >> response.statusCode) || version.compare(0, 5, "HTTP/") != 0) {
        return std::nullopt;
    }

    bool chunked = false;
    std::optional<std::size_t> contentLength;
    std::string line;
    while (std::getline(headers, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string name = toLower(line.substr(0, colon));
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(' '));

        if (name == "transfer-encoding" && toLower(value).find("chunked") != std::string::npos) {
            chunked = true;
        } else if (name == "content-length") {
            try {
                contentLength = static_cast<std::size_t>(std::stoul(value));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    }

    std::string body = raw.substr(headerEnd + 4);
    if (chunked) {
        std::string decoded;
        if (!decodeChunked(body, decoded)) {
            return std::nullopt;
        }
        response.body = std::move(decoded);
    } else if (contentLength) {
        if (body.size() < *contentLength) {
            return std::nullopt;
        }
        response.body = body.substr(0, *contentLength);
    } else {
        response.body = std::move(body);
    }
    return response;
}

int OpenSslHttpClient::openSocket(const ParsedUrl& url, std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    int rc = ::getaddrinfo(url.host.c_str(), std::to_string(url.port).c_str(), &hints, &results);
    if (rc != 0) {
        lastError_ = "DNS lookup failed for " + url.host + ": " + gai_strerror(rc);
        return -1;
    }

    int connected = -1;
    for (addrinfo* ai = results; ai != nullptr && connected < 0; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }

        int flags = ::fcntl(fd, F_GETFL, 0);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            pollfd pfd{fd, POLLOUT, 0};
            rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (rc == 1) {
                int soError = 0;
                socklen_t len = sizeof(soError);
                ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len);
                rc = soError == 0 ? 0 : -1;
                if (soError != 0) {
                    lastError_ = "Connect to " + url.host + " failed: " + std::strerror(soError);
                }
            } else {
                lastError_ = "Connect to " + url.host + " timed out";
                rc = -1;
            }
        } else if (rc != 0) {
            lastError_ = "Connect to " + url.host + " failed: " + std::strerror(errno);
        }

        if (rc == 0) {
            ::fcntl(fd, F_SETFL, flags);
            timeval tv{};
            tv.tv_sec = static_cast<long>(timeout.count() / 1000);
            tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);
            ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
            connected = fd;
        } else {
            ::close(fd);
        }
    }

    ::freeaddrinfo(results);
    return connected;
}

std::optional<HttpResponse> OpenSslHttpClient::send(const HttpRequest& request) {
    lastError_.clear();
    if (!ctx_) {
        return fail("TLS context unavailable: " + sslErrorString());
    }

    auto url = parseUrl(request.url);
    if (!url) {
        return fail("Unsupported URL: " + request.url);
    }

    SocketGuard socket(openSocket(*url, request.timeout));
    if (socket.get() < 0) {
        return std::nullopt;
    }

    SslPtr ssl(SSL_new(ctx_));
    if (!ssl) {
        return fail("SSL_new failed: " + sslErrorString());
    }
    SSL_set_fd(ssl.get(), socket.get());
    SSL_set_tlsext_host_name(ssl.get(), url->host.c_str());
    SSL_set1_host(ssl.get(), url->host.c_str());

    if (SSL_connect(ssl.get()) != 1) {
        long verify = SSL_get_verify_result(ssl.get());
        if (verify != X509_V_OK) {
            return fail("TLS handshake with " + url->host + " failed: " +
                        X509_verify_cert_error_string(verify));
        }
        return fail("TLS handshake with " + url->host + " failed: " + sslErrorString());
    }

    std::ostringstream out;
    out << request.method << " " << url->path << " HTTP/1.1\r\n";
    out << "Host: " << url->host << "\r\n";
    out << "User-Agent: nrf-device-simulator/1.0\r\n";
    out << "Accept: */*\r\n";
    out << "Connection: close\r\n";
    for (const auto& header : request.headers) {
        out << header.first << ": " << header.second << "\r\n";
    }
    if (!request.body.empty() || request.method == "POST" || request.method == "PUT" ||
        request.method == "PATCH") {
        out << "Content-Length: " << request.body.size() << "\r\n";
    }
    out << "\r\n" << request.body;

    std::string wire = out.str();
    std::size_t sent = 0;
    while (sent < wire.size()) {
        int n = SSL_write(ssl.get(), wire.data() + sent, static_cast<int>(wire.size() - sent));
        if (n <= 0) {
            return fail("Send to " + url->host + " failed: " + sslErrorString());
        }
        sent += static_cast<std::size_t>(n);
    }

    std::string raw;
    char buffer[4096];
    while (true) {
        int n = SSL_read(ssl.get(), buffer, sizeof(buffer));
        if (n > 0) {
            raw.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        int err = SSL_get_error(ssl.get(), n);
        if (err == SSL_ERROR_ZERO_RETURN) {
            break;
        }
        if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return fail("Response from " + url->host + " timed out");
        }
        // Servers that close without close_notify still delivered a full response
        if (!raw.empty()) {
            ERR_clear_error();
            break;
        }
        return fail("Receive from " + url->host + " failed: " + sslErrorString());
    }

    SSL_shutdown(ssl.get());

    auto response = parseResponse(raw);
    if (!response) {
        return fail("Malformed HTTP response from " + url->host);
    }
    return response;
}

} // namespace nrfsim
