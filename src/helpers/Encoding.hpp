#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>

namespace NEncoding {
    // RFC 4648 section 5 alphabet, no padding
    std::string                         base64UrlEncode(const std::vector<uint8_t>& data);
    std::string                         base64UrlEncode(std::string_view data);
    // strict: rejects padding, foreign characters and non-canonical trailing bits
    std::optional<std::vector<uint8_t>> base64UrlDecode(std::string_view in);

    // bitcoin alphabet, no checksum
    std::string                         base58Encode(const std::vector<uint8_t>& data);
    std::optional<std::vector<uint8_t>> base58Decode(std::string_view in);

    std::string                         toHex(const std::vector<uint8_t>& data);
};
