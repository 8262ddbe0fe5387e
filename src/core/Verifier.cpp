#include "Verifier.hpp"

#include "Challenge.hpp"
#include "Crypto.hpp"
#include "WalletAddress.hpp"
#include "../helpers/PathUtils.hpp"
#include "../debug/log.hpp"

#include <algorithm>

CSignatureVerifier::CSignatureVerifier(const SAuthConfig& config, std::shared_ptr<IReplayStore> replayStore) : m_config(config), m_replayStore(std::move(replayStore)) {
    ;
}

std::expected<SWalletIdentity, eAuthError> CSignatureVerifier::verify(const SSignedResponse& response, const std::string& actualMethod, const std::string& actualPath,
                                                                      const std::optional<std::string>& actualOrigin, int64_t now) const {
    const auto CHALLENGE = NChallengeCodec::decode(response.challengeToken);
    if (!CHALLENGE.has_value())
        return std::unexpected(CHALLENGE.error());

    const auto PAYLOAD = NChallengeCodec::signingPayload(*CHALLENGE);

    const auto PUBKEY = NWalletAddress::decode(response.walletAddress);
    if (!PUBKEY.has_value())
        return std::unexpected(PUBKEY.error());

    if (response.signature.size() != WALLET_SIGNATURE_LEN)
        return std::unexpected(AUTH_INVALID_SIGNATURE);

    const auto KEY = CEd25519Key::fromPublicKey(*PUBKEY);
    if (!KEY || !KEY->verifySignature(PAYLOAD, response.signature))
        return std::unexpected(AUTH_INVALID_SIGNATURE);

    // from here on the fields are what the wallet signed, but anyone can sign
    // a challenge they made up themselves, so it has to match our own policy
    if (CHALLENGE->issuer != m_config.issuer || CHALLENGE->audience != m_config.audience)
        return std::unexpected(AUTH_AUDIENCE_MISMATCH);

    const int64_t TTL  = std::min<int64_t>(CHALLENGE->ttlSeconds, m_config.ttlSeconds);
    const int64_t SKEW = m_config.clockSkewSeconds;

    if (now < CHALLENGE->issuedAt - SKEW || now > CHALLENGE->issuedAt + TTL + SKEW)
        return std::unexpected(AUTH_CHALLENGE_EXPIRED);

    if (m_config.bindMethodPath && (!CHALLENGE->method.has_value() || !CHALLENGE->path.has_value()))
        return std::unexpected(AUTH_BINDING_MISMATCH);

    if (CHALLENGE->method.has_value()) {
        if (NPathUtils::canonicalMethod(actualMethod) != *CHALLENGE->method || NPathUtils::canonicalPath(actualPath) != *CHALLENGE->path)
            return std::unexpected(AUTH_BINDING_MISMATCH);
    }

    if (m_config.originBinding && !CHALLENGE->origin.has_value())
        return std::unexpected(AUTH_ORIGIN_MISMATCH);

    if (CHALLENGE->origin.has_value() && actualOrigin.value_or("") != *CHALLENGE->origin)
        return std::unexpected(AUTH_ORIGIN_MISMATCH);

    // the nonce has to stay reserved for as long as the window above accepts
    // it, which can exceed ttl + skew when the challenge is dated ahead of us
    const int64_t REMAINING   = CHALLENGE->issuedAt + TTL + SKEW - now + 1;
    const auto    RESERVATION = std::chrono::seconds(std::max<int64_t>(TTL + SKEW, REMAINING));

    std::expected<eReplayStatus, std::string> status = std::unexpected("no replay store");

    try {
        if (m_replayStore)
            status = m_replayStore->checkAndReserve(NChallengeCodec::replayKey(*CHALLENGE), RESERVATION);
    } catch (std::exception& e) { status = std::unexpected(std::string{e.what()}); }

    if (!status.has_value()) {
        Debug::log(ERR, "Verifier: replay store failed: {}", status.error());
        return std::unexpected(AUTH_REPLAY_STORE_ERROR);
    }

    if (*status == REPLAY_ALREADY_USED)
        return std::unexpected(AUTH_NONCE_REPLAYED);

    return SWalletIdentity{.address = response.walletAddress};
}
