#pragma once

#include "cloud/transport/Mechanism.hpp"

#include <cstdint>
#include <string>

namespace ts::cloud::transport {

struct Url {
    std::string scheme;
    std::string host;
    uint16_t port = 0;
    std::string target;     // path plus query, at least "/"
};

// Throws ts::TransportError on anything other than http:// or https:// URLs.
Url parseUrl(const std::string& url);

// Removes chunked transfer framing. Throws ts::TransportError on malformed framing.
std::string decodeChunked(const std::string& body);

// Hand-written HTTP/1.1 over a TCP socket, TLS through OpenSSL for https.
class SocketMechanism final : public Mechanism {
public:
    static constexpr auto NAME = "socket";

    [[nodiscard]] std::string name() const override { return NAME; }

    Response send(const Request& req) override;
};

}
