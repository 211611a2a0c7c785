#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ts::config {
struct CloudConfig;
}

namespace ts::cloud::transport {

struct Request {
    std::string method{"GET"};
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::seconds timeout{30};
};

struct Response {
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers;   // lower-cased names

    [[nodiscard]] bool ok() const { return status / 100 == 2; }
    [[nodiscard]] bool serverError() const { return status >= 500; }
};

// One way of delivering an HTTP request. Throws ts::TransportError when the exchange cannot complete.
class Mechanism {
public:
    virtual ~Mechanism() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    virtual Response send(const Request& req) = 0;
};

// Builds the configured chain. Throws ts::ConfigError on an unknown mechanism name.
std::vector<std::shared_ptr<Mechanism>> makeChain(const config::CloudConfig& cfg);

// Splits "Name: value" header lines into a lower-cased map. Status lines are ignored.
std::map<std::string, std::string> parseHeaderBlock(const std::string& raw);

}
