#include "WalletAddress.hpp"

#include "../helpers/Encoding.hpp"

std::expected<std::vector<uint8_t>, eAuthError> NWalletAddress::decode(const std::string& address) {
    auto bytes = NEncoding::base58Decode(address);

    if (!bytes.has_value() || bytes->size() != WALLET_PUBKEY_LEN)
        return std::unexpected(AUTH_MALFORMED_ADDRESS);

    return *bytes;
}

std::string NWalletAddress::encode(const std::vector<uint8_t>& pubkey) {
    return NEncoding::base58Encode(pubkey);
}

std::expected<std::string, eAuthError> NWalletAddress::canonical(const std::string& address) {
    auto bytes = decode(address);
    if (!bytes.has_value())
        return std::unexpected(bytes.error());

    return encode(*bytes);
}
