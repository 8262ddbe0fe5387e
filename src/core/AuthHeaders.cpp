#include "AuthHeaders.hpp"

#include "../helpers/Encoding.hpp"

#include <cctype>
#include <vector>
#include <utility>

#include <fmt/format.h>

constexpr const size_t AUTH_HEADER_MAX_LEN = CHALLENGE_MAX_TOKEN_LEN + 1024;

//
static std::string toLower(std::string s) {
    for (auto& c : s) {
        c = (char)std::tolower((unsigned char)c);
    }
    return s;
}

static std::string quote(const std::string& s) {
    std::string out = "\"";
    for (const char c : s) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

static void skipSpaces(const std::string& s, size_t& i) {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) {
        ++i;
    }
}

static bool parseToken(const std::string& s, size_t& i, std::string& out) {
    const size_t START = i;
    while (i < s.size()) {
        const char ch = s[i];
        if (ch == ' ' || ch == '\t' || ch == '=' || ch == ',' || ch == '"')
            break;
        ++i;
    }

    if (i == START)
        return false;

    out = s.substr(START, i - START);
    return true;
}

static bool parseQuotedString(const std::string& s, size_t& i, std::string& out) {
    out.clear();
    if (i >= s.size() || s[i] != '"')
        return false;

    ++i;
    while (i < s.size()) {
        const char ch = s[i];
        if (ch == '\\') {
            if (i + 1 >= s.size())
                return false;
            out.push_back(s[i + 1]);
            i += 2;
            continue;
        }

        if (ch == '"') {
            ++i;
            return true;
        }

        out.push_back(ch);
        ++i;
    }

    return false; // unterminated
}

// scheme, then key=value or key="value" pairs separated by commas
static std::optional<std::vector<std::pair<std::string, std::string>>> parseParams(const std::string& header, const std::string& expectedScheme) {
    if (header.size() > AUTH_HEADER_MAX_LEN)
        return std::nullopt;

    size_t i = 0;
    skipSpaces(header, i);

    std::string scheme;
    if (!parseToken(header, i, scheme) || toLower(scheme) != toLower(expectedScheme))
        return std::nullopt;

    // scheme and params are separated by whitespace
    if (i < header.size() && header[i] != ' ' && header[i] != '\t')
        return std::nullopt;

    std::vector<std::pair<std::string, std::string>> params;

    skipSpaces(header, i);
    while (i < header.size()) {
        std::string key, value;
        if (!parseToken(header, i, key))
            return std::nullopt;

        skipSpaces(header, i);
        if (i >= header.size() || header[i] != '=')
            return std::nullopt;
        ++i;
        skipSpaces(header, i);

        if (i < header.size() && header[i] == '"') {
            if (!parseQuotedString(header, i, value))
                return std::nullopt;
        } else if (!parseToken(header, i, value))
            return std::nullopt;

        params.emplace_back(toLower(key), value);

        skipSpaces(header, i);
        if (i >= header.size())
            break;

        if (header[i] != ',')
            return std::nullopt;

        ++i;
        skipSpaces(header, i);
    }

    return params;
}

std::string NAuthHeaders::buildChallengeHeader(const std::string& realm, const std::string& token) {
    return fmt::format("{} realm={}, version=\"{}\", challenge=\"{}\"", AUTH_SCHEME, quote(realm), CHALLENGE_VERSION, token);
}

std::expected<SChallengeHeader, std::string> NAuthHeaders::parseChallengeHeader(const std::string& header) {
    const auto PARAMS = parseParams(header, AUTH_SCHEME);
    if (!PARAMS.has_value())
        return std::unexpected("not a WalletGate challenge");

    SChallengeHeader out;
    for (const auto& [k, v] : *PARAMS) {
        if (k == "realm")
            out.realm = v;
        else if (k == "version")
            out.version = v;
        else if (k == "challenge")
            out.challenge = v;
    }

    if (out.challenge.empty())
        return std::unexpected("challenge parameter missing");

    if (out.version != std::to_string(CHALLENGE_VERSION))
        return std::unexpected(fmt::format("unsupported challenge version \"{}\"", out.version));

    return out;
}

std::string NAuthHeaders::buildAuthorization(const SSignedResponse& response) {
    return fmt::format("{} challenge=\"{}\", address=\"{}\", signature=\"{}\"", AUTH_SCHEME, response.challengeToken, response.walletAddress,
                       NEncoding::base64UrlEncode(response.signature));
}

std::expected<SSignedResponse, eAuthError> NAuthHeaders::parseAuthorization(const std::string& header) {
    const auto PARAMS = parseParams(header, AUTH_SCHEME);
    if (!PARAMS.has_value())
        return std::unexpected(AUTH_MALFORMED_AUTHORIZATION);

    std::optional<std::string> challenge, address, signature;

    for (const auto& [k, v] : *PARAMS) {
        std::optional<std::string>* target = nullptr;
        if (k == "challenge")
            target = &challenge;
        else if (k == "address")
            target = &address;
        else if (k == "signature")
            target = &signature;
        else
            continue;

        if (target->has_value())
            return std::unexpected(AUTH_MALFORMED_AUTHORIZATION);

        *target = v;
    }

    if (!challenge.has_value() || !address.has_value() || !signature.has_value())
        return std::unexpected(AUTH_MALFORMED_AUTHORIZATION);

    if (challenge->empty() || address->empty() || signature->empty())
        return std::unexpected(AUTH_MALFORMED_AUTHORIZATION);

    auto sigBytes = NEncoding::base64UrlDecode(*signature);
    if (!sigBytes.has_value())
        return std::unexpected(AUTH_MALFORMED_AUTHORIZATION);

    return SSignedResponse{.challengeToken = *challenge, .walletAddress = *address, .signature = std::move(*sigBytes)};
}
