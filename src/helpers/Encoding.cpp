#include "Encoding.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <openssl/evp.h>

constexpr const char*  BASE58_ALPHABET  = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
constexpr const size_t BASE58_MAX_INPUT = 128;

//
static int base58Value(char c) {
    const char* pos = std::char_traits<char>::find(BASE58_ALPHABET, 58, c);
    return pos ? (int)(pos - BASE58_ALPHABET) : -1;
}

static bool isBase64UrlChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

std::string NEncoding::base64UrlEncode(const std::vector<uint8_t>& data) {
    if (data.empty())
        return "";

    std::vector<uint8_t> buf;
    buf.resize(4 * ((data.size() + 2) / 3) + 1);

    const int   LEN = EVP_EncodeBlock(buf.data(), data.data(), (int)data.size());

    std::string out{(const char*)buf.data(), (size_t)LEN};

    while (!out.empty() && out.back() == '=')
        out.pop_back();

    for (auto& c : out) {
        if (c == '+')
            c = '-';
        else if (c == '/')
            c = '_';
    }

    return out;
}

std::string NEncoding::base64UrlEncode(std::string_view data) {
    return base64UrlEncode(std::vector<uint8_t>{data.begin(), data.end()});
}

std::optional<std::vector<uint8_t>> NEncoding::base64UrlDecode(std::string_view in) {
    if (in.empty())
        return std::vector<uint8_t>{};

    if (in.size() % 4 == 1)
        return std::nullopt;

    if (!std::all_of(in.begin(), in.end(), isBase64UrlChar))
        return std::nullopt;

    std::string std64{in};
    for (auto& c : std64) {
        if (c == '-')
            c = '+';
        else if (c == '_')
            c = '/';
    }

    const size_t PADDING = (4 - std64.size() % 4) % 4;
    std64.append(PADDING, '=');

    std::vector<uint8_t> out;
    out.resize(std64.size() / 4 * 3);

    const int LEN = EVP_DecodeBlock(out.data(), (const unsigned char*)std64.data(), (int)std64.size());
    if (LEN < 0 || (size_t)LEN < PADDING)
        return std::nullopt;

    out.resize(LEN - PADDING);

    // leftover bits in the last char have to be zero, otherwise two tokens decode the same
    if (base64UrlEncode(out) != in)
        return std::nullopt;

    return out;
}

std::string NEncoding::base58Encode(const std::vector<uint8_t>& data) {
    size_t leadingZeros = 0;
    while (leadingZeros < data.size() && data[leadingZeros] == 0)
        leadingZeros++;

    // little endian base58 digits
    std::vector<uint8_t> digits;
    digits.reserve(data.size() * 138 / 100 + 1);

    for (size_t i = leadingZeros; i < data.size(); ++i) {
        int carry = data[i];
        for (auto& d : digits) {
            carry += 256 * d;
            d     = carry % 58;
            carry /= 58;
        }

        while (carry > 0) {
            digits.push_back(carry % 58);
            carry /= 58;
        }
    }

    std::string result(leadingZeros, '1');
    result.reserve(leadingZeros + digits.size());

    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result += BASE58_ALPHABET[*it];
    }

    return result;
}

std::optional<std::vector<uint8_t>> NEncoding::base58Decode(std::string_view in) {
    if (in.empty() || in.size() > BASE58_MAX_INPUT)
        return std::nullopt;

    size_t leadingOnes = 0;
    while (leadingOnes < in.size() && in[leadingOnes] == '1')
        leadingOnes++;

    // little endian base256 bytes
    std::vector<uint8_t> bytes;
    bytes.reserve(in.size() * 733 / 1000 + 1);

    for (size_t i = leadingOnes; i < in.size(); ++i) {
        int carry = base58Value(in[i]);
        if (carry < 0)
            return std::nullopt;

        for (auto& b : bytes) {
            carry += 58 * b;
            b     = carry & 0xFF;
            carry >>= 8;
        }

        while (carry > 0) {
            bytes.push_back(carry & 0xFF);
            carry >>= 8;
        }
    }

    std::vector<uint8_t> result(leadingOnes, 0);
    result.insert(result.end(), bytes.rbegin(), bytes.rend());
    return result;
}

std::string NEncoding::toHex(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (const auto& b : data) {
        out += fmt::format("{:02x}", b);
    }
    return out;
}
