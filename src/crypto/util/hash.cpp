#include "crypto/util/hash.hpp"

#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace ts::crypto::hash {

void ensureSodiumInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");
    });
}

Digest::Digest() {
    ensureSodiumInit();
    crypto_generichash_init(&state_, nullptr, 0, FINGERPRINT_BYTES);
}

Digest& Digest::update(const std::string_view data) {
    return update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Digest& Digest::update(const uint8_t* data, const size_t len) {
    if (finalized_) throw std::logic_error("Digest already finalized");
    crypto_generichash_update(&state_, data, len);
    return *this;
}

Digest& Digest::updateFromFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + path.string());

    char buffer[8192];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        if (file.bad()) throw std::runtime_error("Failed to read file for hashing: " + path.string());
        update(reinterpret_cast<const uint8_t*>(buffer), static_cast<size_t>(file.gcount()));
    }

    return *this;
}

std::string Digest::hex() {
    if (finalized_) throw std::logic_error("Digest already finalized");

    unsigned char out[FINGERPRINT_BYTES];
    crypto_generichash_final(&state_, out, FINGERPRINT_BYTES);
    finalized_ = true;

    std::ostringstream result;
    for (const unsigned char c : out)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);

    return result.str();
}

std::string blake2b128(const std::string_view data) {
    return Digest().update(data).hex();
}

std::string blake2b128(const std::vector<uint8_t>& data) {
    return Digest().update(data.data(), data.size()).hex();
}

}
