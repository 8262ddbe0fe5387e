#pragma once

#include <string>
#include <expected>

#include "AuthTypes.hpp"
#include "Crypto.hpp"

// Wallet side of the handshake: answers a challenge with a signed response
namespace NClientSigner {
    std::expected<SSignedResponse, std::string> sign(const std::string& challengeToken, const CEd25519Key& key);
    // takes the WWW-Authenticate value, returns the Authorization value
    std::expected<std::string, std::string>     respond(const std::string& challengeHeader, const CEd25519Key& key);
};
