#pragma once

#include <memory>
#include <optional>

#include "AuthTypes.hpp"
#include "AuthConfig.hpp"
#include "Issuer.hpp"
#include "Verifier.hpp"
#include "ReplayStore.hpp"
#include "TokenGate.hpp"

/*
    The one entry point for adapters. Holds no per-request state, so a single
    engine serves any number of concurrent requests; the replay store is the
    only shared mutable thing behind it.
*/
class CAuthEngine {
  public:
    // throws std::invalid_argument without a replay store
    CAuthEngine(const SAuthConfig& config, std::shared_ptr<IReplayStore> replayStore, std::shared_ptr<ITokenGate> tokenGate = nullptr);

    SAuthResult        evaluate(const SRequestDescriptor& request, const std::optional<std::string>& authorization) const;
    SAuthResult        evaluate(const SRequestDescriptor& request, const std::optional<std::string>& authorization, int64_t now) const;

    const SAuthConfig& config() const;

  private:
    SAuthResult                 challenge(const SRequestDescriptor& request, int64_t now) const;
    SAuthResult                 reject(const SRequestDescriptor& request, eAuthError reason, const std::string& wallet = "") const;

    SAuthConfig                 m_config;
    CChallengeIssuer            m_issuer;
    CSignatureVerifier          m_verifier;
    std::shared_ptr<ITokenGate> m_tokenGate;
};

inline std::unique_ptr<CAuthEngine> g_pAuthEngine;
