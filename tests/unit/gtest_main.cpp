#include <gtest/gtest.h>

#include "crypto/util/hash.hpp"
#include "log/Registry.hpp"

#include <iostream>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        ts::log::Registry::initConsoleOnly(spdlog::level::err);
        ts::crypto::hash::ensureSodiumInit();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize termsync test environment: " << e.what() << std::endl;
        return 1;
    }

    const int rc = RUN_ALL_TESTS();
    ts::log::Registry::shutdown();
    return rc;
}
