#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace uil
{
    std::string base64_encode(const uint8_t *data, size_t len);

    // Strict decode: whitespace is skipped, anything else outside the alphabet
    // (or misplaced padding) makes it return false.
    bool base64_decode(const std::string &in, std::vector<uint8_t> &out);
}
