#include "Issuer.hpp"

#include "Crypto.hpp"
#include "../helpers/PathUtils.hpp"
#include "../debug/log.hpp"

CChallengeIssuer::CChallengeIssuer(const SAuthConfig& config) : m_config(config) {
    ;
}

std::expected<SChallenge, eAuthError> CChallengeIssuer::issue(const SRequestDescriptor& request, int64_t now) const {
    SChallenge c;
    c.version    = CHALLENGE_VERSION;
    c.issuer     = m_config.issuer;
    c.audience   = m_config.audience;
    c.nonce      = NCrypto::randomBytes(CHALLENGE_NONCE_LEN);
    c.issuedAt   = now;
    c.ttlSeconds = m_config.ttlSeconds;

    if (m_config.bindMethodPath) {
        const auto METHOD = NPathUtils::canonicalMethod(request.method);
        const auto PATH   = NPathUtils::canonicalPath(request.path);

        if (METHOD.empty() || METHOD.size() > CHALLENGE_MAX_FIELD_LEN || PATH.size() > CHALLENGE_MAX_FIELD_LEN) {
            Debug::log(TRACE, "Issuer: can't bind {} bytes of method, {} bytes of path", METHOD.size(), PATH.size());
            return std::unexpected(AUTH_UNBINDABLE_REQUEST);
        }

        c.method = METHOD;
        c.path   = PATH;
    }

    if (m_config.originBinding) {
        const auto ORIGIN = request.origin.value_or("");

        if (ORIGIN.size() > CHALLENGE_MAX_FIELD_LEN)
            return std::unexpected(AUTH_UNBINDABLE_REQUEST);

        c.origin = ORIGIN;
    }

    return c;
}
