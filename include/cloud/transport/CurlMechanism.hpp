#pragma once

#include "cloud/transport/Mechanism.hpp"

namespace ts::cloud::transport {

// In-process libcurl.
class CurlMechanism final : public Mechanism {
public:
    static constexpr auto NAME = "libcurl";

    [[nodiscard]] std::string name() const override { return NAME; }

    Response send(const Request& req) override;
};

}
