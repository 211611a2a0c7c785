#pragma once

#include "cloud/transport/Mechanism.hpp"

#include <string>

namespace ts::cloud::transport {

// Shells out to the curl binary. Headers and body go through private temp files so the
// token never appears on a command line.
class CommandMechanism final : public Mechanism {
public:
    static constexpr auto NAME = "curl-cli";

    explicit CommandMechanism(std::string binary = "curl") : binary_(std::move(binary)) {}

    [[nodiscard]] std::string name() const override { return NAME; }

    Response send(const Request& req) override;

private:
    std::string binary_;
};

}
