#include "base64_decoder.h"
#include <array>
#include <cstring>
#include <utility>

namespace
{
    constexpr int INVALID = -1;
    constexpr int PADDING = -2;

    std::array<int, 256> buildDecodeTable()
    {
        std::array<int, 256> table{};
        table.fill(INVALID);
        const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        for (int i = 0; i < 64; ++i)
            table[static_cast<unsigned char>(alphabet[i])] = i;
        table[static_cast<unsigned char>('=')] = PADDING;
        return table;
    }

    bool hostIsLittleEndian()
    {
        const uint32_t probe = 1;
        uint8_t first;
        std::memcpy(&first, &probe, 1);
        return first == 1;
    }
}

std::vector<uint8_t> decodeBase64(std::string_view text)
{
    static const std::array<int, 256> table = buildDecodeTable();

    if (text.size() % 4 != 0)
        throw MalformedPayloadError("base64 text length " + std::to_string(text.size()) + " is not a multiple of 4");

    std::vector<uint8_t> bytes;
    bytes.reserve(text.size() / 4 * 3);

    for (size_t i = 0; i < text.size(); i += 4)
    {
        int sextets[4];
        int padding = 0;
        for (int k = 0; k < 4; ++k)
        {
            int value = table[static_cast<unsigned char>(text[i + k])];
            if (value == INVALID)
                throw MalformedPayloadError("invalid base64 character at offset " + std::to_string(i + k));
            if (value == PADDING)
            {
                // Padding is only legal in the last two positions of the final quartet
                if (i + 4 != text.size() || k < 2)
                    throw MalformedPayloadError("unexpected base64 padding at offset " + std::to_string(i + k));
                ++padding;
                value = 0;
            }
            else if (padding > 0)
            {
                throw MalformedPayloadError("data after base64 padding at offset " + std::to_string(i + k));
            }
            sextets[k] = value;
        }

        uint32_t triple = (static_cast<uint32_t>(sextets[0]) << 18) | (static_cast<uint32_t>(sextets[1]) << 12) |
                          (static_cast<uint32_t>(sextets[2]) << 6) | static_cast<uint32_t>(sextets[3]);
        bytes.push_back(static_cast<uint8_t>((triple >> 16) & 0xFF));
        if (padding < 2) bytes.push_back(static_cast<uint8_t>((triple >> 8) & 0xFF));
        if (padding < 1) bytes.push_back(static_cast<uint8_t>(triple & 0xFF));
    }
    return bytes;
}

std::vector<float> decodeFloat32Array(std::string_view text)
{
    std::vector<uint8_t> bytes = decodeBase64(text);
    if (bytes.size() % sizeof(float) != 0)
        throw MalformedPayloadError("payload of " + std::to_string(bytes.size()) + " bytes is not a whole number of float32 values");

    std::vector<float> values(bytes.size() / sizeof(float));
    if (!hostIsLittleEndian())
    {
        for (size_t i = 0; i < bytes.size(); i += 4)
        {
            std::swap(bytes[i], bytes[i + 3]);
            std::swap(bytes[i + 1], bytes[i + 2]);
        }
    }
    if (!values.empty())
        std::memcpy(values.data(), bytes.data(), bytes.size());
    return values;
}
