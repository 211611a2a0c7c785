#pragma once

#include <sodium.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ts::crypto::hash {

// 128-bit BLAKE2b, the width of every fingerprint in the system.
constexpr size_t FINGERPRINT_BYTES = crypto_generichash_BYTES_MIN;

void ensureSodiumInit();

class Digest {
public:
    Digest();

    Digest& update(std::string_view data);
    Digest& update(const uint8_t* data, size_t len);

    // Streams a file in 8 KiB chunks. Throws std::runtime_error if it cannot be opened or read.
    Digest& updateFromFile(const std::filesystem::path& path);

    [[nodiscard]] std::string hex();

private:
    crypto_generichash_state state_{};
    bool finalized_ = false;
};

std::string blake2b128(std::string_view data);
std::string blake2b128(const std::vector<uint8_t>& data);

}
