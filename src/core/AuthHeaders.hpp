#pragma once

#include <string>
#include <expected>

#include "AuthTypes.hpp"

struct SChallengeHeader {
    std::string realm;
    std::string version;
    std::string challenge;
};

/*
    WWW-Authenticate: WalletGate realm="..", version="1", challenge="<token>"
    Authorization:    WalletGate challenge="<token>", address="<base58>", signature="<base64url>"

    The scheme is matched case-insensitively, parameters may come in any
    order and unknown ones are skipped. A known parameter given twice makes
    the whole header invalid.
*/
namespace NAuthHeaders {
    std::string                                   buildChallengeHeader(const std::string& realm, const std::string& token);
    std::expected<SChallengeHeader, std::string>  parseChallengeHeader(const std::string& header);

    std::string                                   buildAuthorization(const SSignedResponse& response);
    std::expected<SSignedResponse, eAuthError>    parseAuthorization(const std::string& header);
};
