#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

constexpr const uint8_t  CHALLENGE_VERSION       = 1;
constexpr const size_t   CHALLENGE_NONCE_LEN     = 32;
constexpr const size_t   CHALLENGE_MIN_NONCE_LEN = 16;
constexpr const size_t   WALLET_PUBKEY_LEN       = 32;
constexpr const size_t   WALLET_SIGNATURE_LEN    = 64;
constexpr const size_t   CHALLENGE_MAX_FIELD_LEN = 1024;
constexpr const size_t   CHALLENGE_MAX_TOKEN_LEN = 8192;
constexpr const char*    AUTH_SCHEME             = "WalletGate";

// Failure reasons, every one of them is a rejection
enum eAuthError : uint8_t {
    AUTH_MALFORMED_CHALLENGE = 0,
    AUTH_MALFORMED_ADDRESS,
    AUTH_MALFORMED_AUTHORIZATION,
    AUTH_INVALID_SIGNATURE,
    AUTH_CHALLENGE_EXPIRED,
    AUTH_AUDIENCE_MISMATCH,
    AUTH_BINDING_MISMATCH,
    AUTH_ORIGIN_MISMATCH,
    AUTH_NONCE_REPLAYED,
    AUTH_REPLAY_STORE_ERROR,
    AUTH_GATE_DENIED,
    AUTH_GATE_ERROR,
    AUTH_UNBINDABLE_REQUEST,
};

namespace NAuthError {
    // stable machine readable code, e.g. "nonce_replayed"
    const char* code(eAuthError e);
    const char* message(eAuthError e);
    // failures that point at tampering rather than a stale client
    bool        securityRelevant(eAuthError e);
};

struct SChallenge {
    uint8_t                    version = CHALLENGE_VERSION;
    std::string                issuer;
    std::string                audience;
    std::vector<uint8_t>       nonce;
    int64_t                    issuedAt   = 0;
    uint32_t                   ttlSeconds = 0;
    std::optional<std::string> method;
    std::optional<std::string> path;
    std::optional<std::string> origin;

    bool                       operator==(const SChallenge& other) const = default;
};

struct SSignedResponse {
    std::string          challengeToken;
    std::string          walletAddress;
    std::vector<uint8_t> signature;
};

struct SWalletIdentity {
    std::string address;
};

struct SRequestDescriptor {
    std::string                method;
    std::string                path;
    std::optional<std::string> origin;
};

enum eAuthResultKind : uint8_t {
    AUTH_RESULT_REQUIRES_CHALLENGE = 0,
    AUTH_RESULT_AUTHENTICATED,
    AUTH_RESULT_REJECTED,
};

struct SAuthResult {
    eAuthResultKind kind = AUTH_RESULT_REJECTED;

    // AUTH_RESULT_REQUIRES_CHALLENGE
    std::string     challengeToken;
    std::string     challengeHeader;

    // AUTH_RESULT_AUTHENTICATED
    SWalletIdentity identity;

    // AUTH_RESULT_REJECTED
    eAuthError      reason = AUTH_MALFORMED_AUTHORIZATION;

    static SAuthResult requiresChallenge(const std::string& token, const std::string& header);
    static SAuthResult authenticated(const SWalletIdentity& identity);
    static SAuthResult rejected(eAuthError reason);
};
