#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

class MalformedPayloadError : public std::runtime_error
{
public:
    explicit MalformedPayloadError(const std::string& what) : std::runtime_error(what) {}
};

// Standard alphabet, '=' padding. Whitespace is not accepted.
std::vector<uint8_t> decodeBase64(std::string_view text);

// Decodes a base64 blob wrapping little-endian IEEE-754 float32 values.
// Throws MalformedPayloadError when the blob is not base64 or its byte length is
// not a multiple of 4.
std::vector<float> decodeFloat32Array(std::string_view text);
