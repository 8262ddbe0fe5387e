#include "Engine.hpp"

#include "Challenge.hpp"
#include "AuthHeaders.hpp"
#include "../debug/log.hpp"

#include <chrono>
#include <stdexcept>

static int64_t nowEpoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

static std::shared_ptr<IReplayStore> requireStore(std::shared_ptr<IReplayStore> store) {
    if (!store)
        throw std::invalid_argument("CAuthEngine needs a replay store");
    return store;
}

CAuthEngine::CAuthEngine(const SAuthConfig& config, std::shared_ptr<IReplayStore> replayStore, std::shared_ptr<ITokenGate> tokenGate) :
    m_config(config), m_issuer(config), m_verifier(config, requireStore(std::move(replayStore))), m_tokenGate(std::move(tokenGate)) {
    ;
}

const SAuthConfig& CAuthEngine::config() const {
    return m_config;
}

SAuthResult CAuthEngine::evaluate(const SRequestDescriptor& request, const std::optional<std::string>& authorization) const {
    return evaluate(request, authorization, nowEpoch());
}

SAuthResult CAuthEngine::evaluate(const SRequestDescriptor& request, const std::optional<std::string>& authorization, int64_t now) const {
    if (!authorization.has_value())
        return challenge(request, now);

    const auto RESPONSE = NAuthHeaders::parseAuthorization(*authorization);
    if (!RESPONSE.has_value())
        return reject(request, RESPONSE.error());

    const auto IDENTITY = m_verifier.verify(*RESPONSE, request.method, request.path, request.origin, now);
    if (!IDENTITY.has_value())
        return reject(request, IDENTITY.error(), RESPONSE->walletAddress);

    if (m_tokenGate) {
        std::expected<bool, std::string> allowed = std::unexpected("gate did not run");

        try {
            allowed = m_tokenGate->allows(IDENTITY->address);
        } catch (std::exception& e) { allowed = std::unexpected(std::string{e.what()}); } catch (...) {
            allowed = std::unexpected("gate threw a non-exception");
        }

        if (!allowed.has_value()) {
            Debug::log(ERR, "Engine: token gate failed for {}: {}", IDENTITY->address, allowed.error());
            return reject(request, AUTH_GATE_ERROR, IDENTITY->address);
        }

        if (!*allowed)
            return reject(request, AUTH_GATE_DENIED, IDENTITY->address);
    }

    Debug::log(LOG, " | Auth: AUTHENTICATED {} for {} {}", IDENTITY->address, request.method, request.path);

    return SAuthResult::authenticated(*IDENTITY);
}

SAuthResult CAuthEngine::challenge(const SRequestDescriptor& request, int64_t now) const {
    const auto CHALLENGE = m_issuer.issue(request, now);
    if (!CHALLENGE.has_value())
        return reject(request, CHALLENGE.error());

    const auto TOKEN = NChallengeCodec::encode(*CHALLENGE);

    Debug::log(TRACE, "Engine: issued challenge for {} {}, expires at {}", request.method, request.path, CHALLENGE->issuedAt + CHALLENGE->ttlSeconds);

    return SAuthResult::requiresChallenge(TOKEN, NAuthHeaders::buildChallengeHeader(m_config.realm, TOKEN));
}

SAuthResult CAuthEngine::reject(const SRequestDescriptor& request, eAuthError reason, const std::string& wallet) const {
    if (NAuthError::securityRelevant(reason))
        Debug::log(WARN, " | Auth: REJECTED ({}) {} {}, wallet {}", NAuthError::code(reason), request.method, request.path, wallet.empty() ? "<none>" : wallet);
    else
        Debug::log(LOG, " | Auth: REJECTED ({}) {} {}", NAuthError::code(reason), request.method, request.path);

    return SAuthResult::rejected(reason);
}
