#pragma once

#include <string>
#include <expected>

#include "AuthTypes.hpp"

/*
    Challenge token layout, base64url without padding over:

        "WG" | u8 version | field*

    field = u8 tag | u16 BE length | bytes, tags strictly ascending:
        0x01 issuer     0x02 audience   0x03 nonce
        0x04 issuedAt (i64 BE)          0x05 ttlSeconds (u32 BE)
        0x06 method     0x07 path       0x08 origin

    method and path travel together or not at all.
*/
namespace NChallengeCodec {
    // precondition: every string field fits CHALLENGE_MAX_FIELD_LEN
    std::string                             encode(const SChallenge& challenge);
    std::expected<SChallenge, eAuthError>   decode(const std::string& token);

    // the exact bytes a wallet signs
    std::string                             signingPayload(const SChallenge& challenge);

    // hex sha256 over issuer and nonce
    std::string                             replayKey(const SChallenge& challenge);
};
