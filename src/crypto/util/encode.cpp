#include "crypto/util/encode.hpp"
#include "crypto/util/hash.hpp"
#include "util/errors.hpp"

#include <sodium.h>

namespace ts::crypto::encode {

std::string toBase64(const std::vector<uint8_t>& data) {
    hash::ensureSodiumInit();

    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    result.resize(encoded_len - 1); // drop trailing NUL
    return result;
}

std::vector<uint8_t> fromBase64(const std::string_view encoded) {
    hash::ensureSodiumInit();

    std::vector<uint8_t> decoded(encoded.size() / 4 * 3 + 3);
    size_t decoded_len = 0;

    // a null end pointer makes libsodium reject anything it cannot consume
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          encoded.data(), encoded.size(),
                          " \r\n\t", &decoded_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0)
        throw IntegrityError("Invalid base64 payload");

    decoded.resize(decoded_len);
    return decoded;
}

}
