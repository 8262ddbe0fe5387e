#pragma once

#include <string>
#include <vector>
#include <expected>
#include <cstdint>

#include "AuthTypes.hpp"

// A wallet is addressed by its base58 encoded Ed25519 public key
namespace NWalletAddress {
    std::expected<std::vector<uint8_t>, eAuthError> decode(const std::string& address);
    std::string                                     encode(const std::vector<uint8_t>& pubkey);
    // re-encodes the decoded key, fails for anything decode() refuses
    std::expected<std::string, eAuthError>          canonical(const std::string& address);
};
