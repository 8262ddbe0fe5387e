#pragma once

#include <expected>

#include "AuthTypes.hpp"
#include "AuthConfig.hpp"

class CChallengeIssuer {
  public:
    explicit CChallengeIssuer(const SAuthConfig& config);

    // fails only when the request can't be bound (AUTH_UNBINDABLE_REQUEST),
    // throws when the entropy source does
    std::expected<SChallenge, eAuthError> issue(const SRequestDescriptor& request, int64_t now) const;

  private:
    SAuthConfig m_config;
};
