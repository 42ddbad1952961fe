#include "uil/base64.hpp"

#include <cctype>

namespace uil
{

    static const char BASE64_TABLE[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    static int decode_char(char c)
    {
        if (c >= 'A' && c <= 'Z')
            return c - 'A';
        if (c >= 'a' && c <= 'z')
            return c - 'a' + 26;
        if (c >= '0' && c <= '9')
            return c - '0' + 52;
        if (c == '+')
            return 62;
        if (c == '/')
            return 63;
        return -1;
    }

    std::string base64_encode(const uint8_t *data, size_t len)
    {
        std::string result;
        result.reserve((len + 2) / 3 * 4);

        for (size_t i = 0; i < len; i += 3)
        {
            uint32_t n = static_cast<uint32_t>(data[i]) << 16;
            if (i + 1 < len)
                n |= static_cast<uint32_t>(data[i + 1]) << 8;
            if (i + 2 < len)
                n |= static_cast<uint32_t>(data[i + 2]);

            result.push_back(BASE64_TABLE[(n >> 18) & 0x3F]);
            result.push_back(BASE64_TABLE[(n >> 12) & 0x3F]);
            result.push_back((i + 1 < len) ? BASE64_TABLE[(n >> 6) & 0x3F] : '=');
            result.push_back((i + 2 < len) ? BASE64_TABLE[n & 0x3F] : '=');
        }
        return result;
    }

    bool base64_decode(const std::string &in, std::vector<uint8_t> &out)
    {
        out.clear();
        out.reserve(in.size() / 4 * 3);

        uint32_t acc = 0;
        int bits = 0;
        int quad = 0; // symbols in the current 4-char group, padding included
        int pad = 0;
        for (char c : in)
        {
            if (std::isspace((unsigned char)c))
                continue;
            if (c == '=')
            {
                // at most two '=' and only in the last two slots of a group
                if (quad < 2 || ++pad > 2)
                    return false;
                quad = (quad + 1) % 4;
                continue;
            }
            if (pad > 0)
                return false; // data after padding
            const int v = decode_char(c);
            if (v < 0)
                return false;
            acc = (acc << 6) | (uint32_t)v;
            bits += 6;
            quad = (quad + 1) % 4;
            if (bits >= 8)
            {
                bits -= 8;
                out.push_back((uint8_t)((acc >> bits) & 0xFF));
            }
        }
        if (quad != 0)
            return false; // truncated group
        return !out.empty();
    }

} // namespace uil
