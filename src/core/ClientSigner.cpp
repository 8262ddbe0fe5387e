#include "ClientSigner.hpp"

#include "Challenge.hpp"
#include "AuthHeaders.hpp"
#include "WalletAddress.hpp"

std::expected<SSignedResponse, std::string> NClientSigner::sign(const std::string& challengeToken, const CEd25519Key& key) {
    if (!key.hasPrivateKey())
        return std::unexpected("key can't sign");

    const auto CHALLENGE = NChallengeCodec::decode(challengeToken);
    if (!CHALLENGE.has_value())
        return std::unexpected(NAuthError::message(CHALLENGE.error()));

    const auto SIG = key.sign(NChallengeCodec::signingPayload(*CHALLENGE));
    if (SIG.empty())
        return std::unexpected("signing failed");

    return SSignedResponse{.challengeToken = challengeToken, .walletAddress = NWalletAddress::encode(key.publicKey()), .signature = SIG};
}

std::expected<std::string, std::string> NClientSigner::respond(const std::string& challengeHeader, const CEd25519Key& key) {
    const auto HEADER = NAuthHeaders::parseChallengeHeader(challengeHeader);
    if (!HEADER.has_value())
        return std::unexpected(HEADER.error());

    const auto RESPONSE = sign(HEADER->challenge, key);
    if (!RESPONSE.has_value())
        return std::unexpected(RESPONSE.error());

    return NAuthHeaders::buildAuthorization(*RESPONSE);
}
