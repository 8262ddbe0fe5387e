#include "AuthTypes.hpp"

const char* NAuthError::code(eAuthError e) {
    switch (e) {
        case AUTH_MALFORMED_CHALLENGE: return "malformed_challenge";
        case AUTH_MALFORMED_ADDRESS: return "malformed_address";
        case AUTH_MALFORMED_AUTHORIZATION: return "malformed_authorization";
        case AUTH_INVALID_SIGNATURE: return "invalid_signature";
        case AUTH_CHALLENGE_EXPIRED: return "challenge_expired";
        case AUTH_AUDIENCE_MISMATCH: return "audience_mismatch";
        case AUTH_BINDING_MISMATCH: return "binding_mismatch";
        case AUTH_ORIGIN_MISMATCH: return "origin_mismatch";
        case AUTH_NONCE_REPLAYED: return "nonce_replayed";
        case AUTH_REPLAY_STORE_ERROR: return "replay_store_error";
        case AUTH_GATE_DENIED: return "gate_denied";
        case AUTH_GATE_ERROR: return "gate_error";
        case AUTH_UNBINDABLE_REQUEST: return "unbindable_request";
    }

    return "unknown_error";
}

const char* NAuthError::message(eAuthError e) {
    switch (e) {
        case AUTH_MALFORMED_CHALLENGE: return "The challenge token is malformed, request a new challenge";
        case AUTH_MALFORMED_ADDRESS: return "The wallet address is not a valid public key";
        case AUTH_MALFORMED_AUTHORIZATION: return "The Authorization header is not a valid WalletGate response";
        case AUTH_INVALID_SIGNATURE: return "The signature does not match the challenge";
        case AUTH_CHALLENGE_EXPIRED: return "The challenge has expired, request a new challenge";
        case AUTH_AUDIENCE_MISMATCH: return "The challenge was issued for a different server";
        case AUTH_BINDING_MISMATCH: return "The challenge was issued for a different method or path";
        case AUTH_ORIGIN_MISMATCH: return "The challenge was issued for a different origin";
        case AUTH_NONCE_REPLAYED: return "The challenge has already been used";
        case AUTH_REPLAY_STORE_ERROR: return "The challenge could not be checked, try again";
        case AUTH_GATE_DENIED: return "This wallet is not allowed to access the resource";
        case AUTH_GATE_ERROR: return "The access check for this wallet failed";
        case AUTH_UNBINDABLE_REQUEST: return "The request path or origin is too long to issue a challenge for";
    }

    return "Unknown error";
}

bool NAuthError::securityRelevant(eAuthError e) {
    return e == AUTH_BINDING_MISMATCH || e == AUTH_ORIGIN_MISMATCH || e == AUTH_NONCE_REPLAYED || e == AUTH_AUDIENCE_MISMATCH || e == AUTH_INVALID_SIGNATURE;
}

SAuthResult SAuthResult::requiresChallenge(const std::string& token, const std::string& header) {
    SAuthResult r;
    r.kind            = AUTH_RESULT_REQUIRES_CHALLENGE;
    r.challengeToken  = token;
    r.challengeHeader = header;
    return r;
}

SAuthResult SAuthResult::authenticated(const SWalletIdentity& identity) {
    SAuthResult r;
    r.kind     = AUTH_RESULT_AUTHENTICATED;
    r.identity = identity;
    return r;
}

SAuthResult SAuthResult::rejected(eAuthError reason) {
    SAuthResult r;
    r.kind   = AUTH_RESULT_REJECTED;
    r.reason = reason;
    return r;
}
