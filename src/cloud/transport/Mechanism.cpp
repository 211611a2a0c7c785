#include "cloud/transport/Mechanism.hpp"
#include "cloud/transport/CurlMechanism.hpp"
#include "cloud/transport/CommandMechanism.hpp"
#include "cloud/transport/SocketMechanism.hpp"
#include "config/Config.hpp"
#include "util/errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

using namespace ts::cloud::transport;

std::vector<std::shared_ptr<Mechanism>> ts::cloud::transport::makeChain(const config::CloudConfig& cfg) {
    std::vector<std::shared_ptr<Mechanism>> chain;

    for (const auto& name : cfg.mechanisms) {
        if (name == CurlMechanism::NAME) chain.push_back(std::make_shared<CurlMechanism>());
        else if (name == CommandMechanism::NAME) chain.push_back(std::make_shared<CommandMechanism>());
        else if (name == SocketMechanism::NAME) chain.push_back(std::make_shared<SocketMechanism>());
        else throw ConfigError("Unknown transport mechanism: " + name);
    }

    if (chain.empty()) throw ConfigError("cloud.mechanisms must name at least one mechanism");
    return chain;
}

std::map<std::string, std::string> ts::cloud::transport::parseHeaderBlock(const std::string& raw) {
    std::map<std::string, std::string> headers;
    std::istringstream in(raw);
    std::string line;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        const auto colon = line.find(':');
        if (line.empty() || line.starts_with("HTTP/") || colon == std::string::npos) continue;

        std::string key = line.substr(0, colon);
        std::ranges::transform(key, key.begin(), [](const unsigned char c) { return std::tolower(c); });

        auto value = line.substr(colon + 1);
        const auto first = value.find_first_not_of(" \t");
        value = first == std::string::npos ? "" : value.substr(first);

        headers[key] = value;
    }

    return headers;
}
