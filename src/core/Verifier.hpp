#pragma once

#include <memory>
#include <expected>
#include <optional>

#include "AuthTypes.hpp"
#include "AuthConfig.hpp"
#include "ReplayStore.hpp"

class CSignatureVerifier {
  public:
    CSignatureVerifier(const SAuthConfig& config, std::shared_ptr<IReplayStore> replayStore);

    /*
        Checks, in order, stopping at the first failure:
        token, address, signature, issuer/audience, expiry window,
        method/path binding, origin binding, and last the nonce reservation.
        Nothing before the reservation touches the replay store.
    */
    std::expected<SWalletIdentity, eAuthError> verify(const SSignedResponse& response, const std::string& actualMethod, const std::string& actualPath,
                                                      const std::optional<std::string>& actualOrigin, int64_t now) const;

  private:
    SAuthConfig                   m_config;
    std::shared_ptr<IReplayStore> m_replayStore;
};
