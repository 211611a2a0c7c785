#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ts::crypto::encode {

std::string toBase64(const std::vector<uint8_t>& data);

// Line breaks and spaces in the input are ignored. Throws ts::IntegrityError on malformed input.
std::vector<uint8_t> fromBase64(std::string_view encoded);

}
