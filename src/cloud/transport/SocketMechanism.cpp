#include "cloud/transport/SocketMechanism.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace ts::cloud::transport;
using namespace ts::log;

namespace {

using Clock = std::chrono::steady_clock;

std::string sslErrorString() {
    const auto code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

class Socket {
public:
    Socket() = default;
    ~Socket() { if (fd_ >= 0) ::close(fd_); }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    void connect(const std::string& host, const uint16_t port, const Clock::time_point deadline) {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo* res = nullptr;
        if (const int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res); rc != 0)
            throw ts::TransportError("Cannot resolve " + host + ": " + gai_strerror(rc));

        std::string lastError = "no addresses";
        for (auto* ai = res; ai; ai = ai->ai_next) {
            const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
            if (fd < 0) continue;

            if (tryConnect(fd, ai, deadline, lastError)) {
                fd_ = fd;
                break;
            }
            ::close(fd);
        }
        freeaddrinfo(res);

        if (fd_ < 0) throw ts::TransportError("Cannot connect to " + host + ": " + lastError);
    }

    void setTimeouts(const std::chrono::seconds t) const {
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(t.count());
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    [[nodiscard]] int fd() const { return fd_; }

private:
    int fd_ = -1;

    static bool tryConnect(const int fd, const addrinfo* ai, const Clock::time_point deadline, std::string& err) {
        const int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            if (errno != EINPROGRESS) {
                err = std::strerror(errno);
                return false;
            }

            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            pollfd pfd{fd, POLLOUT, 0};
            const int rc = ::poll(&pfd, 1, static_cast<int>(std::max<long long>(0, remaining.count())));
            if (rc <= 0) {
                err = rc == 0 ? "connect timed out" : std::strerror(errno);
                return false;
            }

            int soErr = 0;
            socklen_t len = sizeof(soErr);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &soErr, &len);
            if (soErr != 0) {
                err = std::strerror(soErr);
                return false;
            }
        }

        fcntl(fd, F_SETFL, flags);
        return true;
    }
};

// Plain or TLS byte stream over a connected socket.
class Stream {
public:
    Stream(const Socket& sock, const bool tls, const std::string& host) : fd_(sock.fd()) {
        if (!tls) return;

        ctx_.reset(SSL_CTX_new(TLS_client_method()));
        if (!ctx_) throw ts::TransportError("Cannot create TLS context: " + sslErrorString());
        SSL_CTX_set_default_verify_paths(ctx_.get());
        SSL_CTX_set_verify(ctx_.get(), SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_min_proto_version(ctx_.get(), TLS1_2_VERSION);

        ssl_.reset(SSL_new(ctx_.get()));
        if (!ssl_) throw ts::TransportError("Cannot create TLS session: " + sslErrorString());

        SSL_set_tlsext_host_name(ssl_.get(), host.c_str());
        SSL_set1_host(ssl_.get(), host.c_str());
        SSL_set_fd(ssl_.get(), fd_);

        if (SSL_connect(ssl_.get()) != 1) throw ts::TransportError("TLS handshake with " + host + " failed: " + sslErrorString());
        connected_ = true;
    }

    ~Stream() {
        if (connected_) SSL_shutdown(ssl_.get());
    }

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    void writeAll(const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            const auto chunk = data.size() - sent;
            long n;
            if (ssl_) n = SSL_write(ssl_.get(), data.data() + sent, static_cast<int>(std::min<size_t>(chunk, 1 << 20)));
            else n = ::send(fd_, data.data() + sent, chunk, MSG_NOSIGNAL);

            if (n <= 0) {
                if (!ssl_ && n < 0 && errno == EINTR) continue;
                throw ts::TransportError(std::string("Socket write failed: ") + (ssl_ ? sslErrorString() : std::strerror(errno)));
            }
            sent += static_cast<size_t>(n);
        }
    }

    // Reads until the peer closes the connection.
    std::string readAll(const Clock::time_point deadline) {
        std::string out;
        char buf[16384];

        while (true) {
            if (Clock::now() > deadline) throw ts::TransportError("Response timed out");

            long n;
            if (ssl_) {
                errno = 0;
                n = SSL_read(ssl_.get(), buf, sizeof(buf));
                if (n <= 0) {
                    const int err = SSL_get_error(ssl_.get(), static_cast<int>(n));
                    if (err == SSL_ERROR_ZERO_RETURN) break;
                    // servers often drop the connection without close_notify once the body is sent
                    if (err == SSL_ERROR_SYSCALL && errno == 0) break;
                    throw ts::TransportError("TLS read failed: " + sslErrorString());
                }
            } else {
                n = ::recv(fd_, buf, sizeof(buf), 0);
                if (n == 0) break;
                if (n < 0) {
                    if (errno == EINTR) continue;
                    if (errno == EAGAIN || errno == EWOULDBLOCK) throw ts::TransportError("Response timed out");
                    throw ts::TransportError(std::string("Socket read failed: ") + std::strerror(errno));
                }
            }
            out.append(buf, static_cast<size_t>(n));
        }

        return out;
    }

private:
    int fd_;
    std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> ctx_{nullptr, SSL_CTX_free};
    std::unique_ptr<SSL, decltype(&SSL_free)> ssl_{nullptr, SSL_free};
    bool connected_ = false;
};

}

Url ts::cloud::transport::parseUrl(const std::string& url) {
    Url u;
    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) throw TransportError("Malformed URL: " + url);

    u.scheme = url.substr(0, schemeEnd);
    if (u.scheme != "http" && u.scheme != "https") throw TransportError("Unsupported URL scheme: " + u.scheme);

    const auto hostStart = schemeEnd + 3;
    const auto pathStart = url.find('/', hostStart);
    const auto authority = url.substr(hostStart, pathStart == std::string::npos ? std::string::npos : pathStart - hostStart);
    u.target = pathStart == std::string::npos ? "/" : url.substr(pathStart);

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        u.host = authority.substr(0, colon);
        try {
            const auto port = std::stoul(authority.substr(colon + 1));
            if (port == 0 || port > 65535) throw std::out_of_range("port");
            u.port = static_cast<uint16_t>(port);
        } catch (const std::exception&) {
            throw TransportError("Invalid port in URL: " + url);
        }
    } else {
        u.host = authority;
        u.port = u.scheme == "https" ? 443 : 80;
    }

    if (u.host.empty()) throw TransportError("URL has no host: " + url);
    return u;
}

std::string ts::cloud::transport::decodeChunked(const std::string& body) {
    std::string out;
    size_t pos = 0;

    while (true) {
        const auto lineEnd = body.find("\r\n", pos);
        if (lineEnd == std::string::npos) throw TransportError("Malformed chunked body");

        size_t size;
        try {
            size = std::stoul(body.substr(pos, lineEnd - pos), nullptr, 16);
        } catch (const std::exception&) {
            throw TransportError("Malformed chunk size");
        }

        pos = lineEnd + 2;
        if (size == 0) break;
        if (pos + size > body.size()) throw TransportError("Truncated chunked body");

        out.append(body, pos, size);
        pos += size + 2;
    }

    return out;
}

Response SocketMechanism::send(const Request& req) {
    const auto url = parseUrl(req.url);
    const auto deadline = Clock::now() + req.timeout;

    Socket sock;
    sock.connect(url.host, url.port, deadline);
    sock.setTimeouts(req.timeout);

    Stream stream(sock, url.scheme == "https", url.host);

    const bool defaultPort = (url.scheme == "https" && url.port == 443) || (url.scheme == "http" && url.port == 80);

    std::string head = req.method + " " + url.target + " HTTP/1.1\r\n";
    head += "Host: " + url.host + (defaultPort ? "" : ":" + std::to_string(url.port)) + "\r\n";
    for (const auto& [k, v] : req.headers) head += k + ": " + v + "\r\n";
    if (!req.body.empty()) head += "Content-Type: application/json\r\n";
    if (req.method != "GET" || !req.body.empty()) head += "Content-Length: " + std::to_string(req.body.size()) + "\r\n";
    head += "Connection: close\r\n\r\n";

    stream.writeAll(head + req.body);
    const auto raw = stream.readAll(deadline);

    const auto split = raw.find("\r\n\r\n");
    if (split == std::string::npos) throw TransportError("Incomplete HTTP response from " + url.host);

    const auto statusEnd = raw.find("\r\n");
    const auto statusLine = raw.substr(0, statusEnd);
    const auto sp = statusLine.find(' ');
    if (!statusLine.starts_with("HTTP/") || sp == std::string::npos) throw TransportError("Malformed status line: " + statusLine);

    Response out;
    try {
        out.status = std::stol(statusLine.substr(sp + 1, 3));
    } catch (const std::exception&) {
        throw TransportError("Malformed status line: " + statusLine);
    }

    out.headers = parseHeaderBlock(raw.substr(0, split));
    out.body = raw.substr(split + 4);

    if (const auto te = out.headers.find("transfer-encoding"); te != out.headers.end() && te->second.find("chunked") != std::string::npos) {
        out.body = decodeChunked(out.body);
    } else if (const auto cl = out.headers.find("content-length"); cl != out.headers.end()) {
        const auto expected = std::stoul(cl->second);
        if (out.body.size() < expected) throw TransportError("Truncated response body from " + url.host);
        out.body.resize(expected);
    }

    Registry::cloud()->debug("[SocketMechanism] {} {} -> {}", req.method, req.url, out.status);
    return out;
}
