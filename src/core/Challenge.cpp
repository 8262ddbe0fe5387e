#include "Challenge.hpp"

#include "Crypto.hpp"
#include "../helpers/Encoding.hpp"

#include <fmt/format.h>

constexpr const char* TOKEN_MAGIC     = "WG";
constexpr const char* PAYLOAD_HEADER  = "WALLETGATE-CHALLENGE";
constexpr const char  REPLAY_KEY_SEP  = '\0';
// keeps issuedAt +- ttl and skew far away from int64 overflow
constexpr const int64_t MAX_ISSUED_AT = (int64_t)1 << 62;

enum eChallengeTag : uint8_t {
    TAG_ISSUER = 0x01,
    TAG_AUDIENCE,
    TAG_NONCE,
    TAG_ISSUED_AT,
    TAG_TTL,
    TAG_METHOD,
    TAG_PATH,
    TAG_ORIGIN,
};

//
static void putField(std::vector<uint8_t>& out, eChallengeTag tag, const uint8_t* data, size_t len) {
    out.push_back(tag);
    out.push_back((len >> 8) & 0xFF);
    out.push_back(len & 0xFF);
    out.insert(out.end(), data, data + len);
}

static void putString(std::vector<uint8_t>& out, eChallengeTag tag, const std::string& s) {
    putField(out, tag, (const uint8_t*)s.data(), s.size());
}

static void putInteger(std::vector<uint8_t>& out, eChallengeTag tag, uint64_t value, size_t width) {
    uint8_t buf[8];
    for (size_t i = 0; i < width; ++i) {
        buf[i] = (value >> (8 * (width - 1 - i))) & 0xFF;
    }
    putField(out, tag, buf, width);
}

static uint64_t readInteger(const uint8_t* data, size_t width) {
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

static bool validString(size_t len) {
    return len > 0 && len <= CHALLENGE_MAX_FIELD_LEN;
}

std::string NChallengeCodec::encode(const SChallenge& c) {
    std::vector<uint8_t> out;
    out.reserve(128 + c.issuer.size() + c.audience.size() + c.nonce.size());

    out.push_back(TOKEN_MAGIC[0]);
    out.push_back(TOKEN_MAGIC[1]);
    out.push_back(c.version);

    putString(out, TAG_ISSUER, c.issuer);
    putString(out, TAG_AUDIENCE, c.audience);
    putField(out, TAG_NONCE, c.nonce.data(), c.nonce.size());
    putInteger(out, TAG_ISSUED_AT, (uint64_t)c.issuedAt, 8);
    putInteger(out, TAG_TTL, c.ttlSeconds, 4);

    if (c.method.has_value())
        putString(out, TAG_METHOD, *c.method);
    if (c.path.has_value())
        putString(out, TAG_PATH, *c.path);
    if (c.origin.has_value())
        putString(out, TAG_ORIGIN, *c.origin);

    return NEncoding::base64UrlEncode(out);
}

std::expected<SChallenge, eAuthError> NChallengeCodec::decode(const std::string& token) {
    if (token.empty() || token.size() > CHALLENGE_MAX_TOKEN_LEN)
        return std::unexpected(AUTH_MALFORMED_CHALLENGE);

    const auto RAW = NEncoding::base64UrlDecode(token);
    if (!RAW.has_value())
        return std::unexpected(AUTH_MALFORMED_CHALLENGE);

    const auto& BYTES = *RAW;

    if (BYTES.size() < 3 || BYTES[0] != TOKEN_MAGIC[0] || BYTES[1] != TOKEN_MAGIC[1])
        return std::unexpected(AUTH_MALFORMED_CHALLENGE);

    SChallenge c;
    c.version = BYTES[2];

    if (c.version != CHALLENGE_VERSION)
        return std::unexpected(AUTH_MALFORMED_CHALLENGE);

    uint8_t lastTag = 0;
    uint8_t seen    = 0; // bit per tag
    size_t  pos     = 3;

    while (pos < BYTES.size()) {
        if (BYTES.size() - pos < 3)
            return std::unexpected(AUTH_MALFORMED_CHALLENGE);

        const uint8_t TAG = BYTES[pos];
        const size_t  LEN = ((size_t)BYTES[pos + 1] << 8) | BYTES[pos + 2];
        pos += 3;

        if (TAG <= lastTag || TAG > TAG_ORIGIN)
            return std::unexpected(AUTH_MALFORMED_CHALLENGE);

        if (LEN > BYTES.size() - pos)
            return std::unexpected(AUTH_MALFORMED_CHALLENGE);

        const uint8_t*    DATA = BYTES.data() + pos;
        const std::string STR{(const char*)DATA, LEN};

        switch (TAG) {
            case TAG_ISSUER:
                if (!validString(LEN))
                    return std::unexpected(AUTH_MALFORMED_CHALLENGE);
                c.issuer = STR;
                break;
            case TAG_AUDIENCE:
                if (!validString(LEN))
                    return std::unexpected(AUTH_MALFORMED_CHALLENGE);
                c.audience = STR;
                break;
            case TAG_NONCE:
                if (LEN < CHALLENGE_MIN_NONCE_LEN || LEN > 255)
                    return std::unexpected(AUTH_MALFORMED_CHALLENGE);
                c.nonce.assign(DATA, DATA + LEN);
                break;
            case TAG_ISSUED_AT:
                if (LEN != 8)
                    return std::unexpected(AUTH_MALFORMED_CHALLENGE);
                c.issuedAt = (int64_t)readInteger(DATA, 8);
                if (c.issuedAt < 0 || c.issuedAt >= MAX_ISSUED_AT)
                    return std::unexpected(AUTH_MALFORMED_CHALLENGE);
                break;
            case TAG_TTL:
                if (LEN != 4)
                    return std::unexpected(AUTH_MALFORMED_CHALLENGE);
                c.ttlSeconds = (uint32_t)readInteger(DATA, 4);
                break;
            case TAG_METHOD:
                if (!validString(LEN))
                    return std::unexpected(AUTH_MALFORMED_CHALLENGE);
                c.method = STR;
                break;
            case TAG_PATH:
                if (!validString(LEN))
                    return std::unexpected(AUTH_MALFORMED_CHALLENGE);
                c.path = STR;
                break;
            case TAG_ORIGIN:
                // an absent Origin header is bound as the empty string
                if (LEN > CHALLENGE_MAX_FIELD_LEN)
                    return std::unexpected(AUTH_MALFORMED_CHALLENGE);
                c.origin = STR;
                break;
            default: return std::unexpected(AUTH_MALFORMED_CHALLENGE);
        }

        seen |= 1 << (TAG - 1);
        lastTag = TAG;
        pos += LEN;
    }

    constexpr uint8_t REQUIRED = (1 << (TAG_ISSUER - 1)) | (1 << (TAG_AUDIENCE - 1)) | (1 << (TAG_NONCE - 1)) | (1 << (TAG_ISSUED_AT - 1)) | (1 << (TAG_TTL - 1));

    if ((seen & REQUIRED) != REQUIRED)
        return std::unexpected(AUTH_MALFORMED_CHALLENGE);

    if (c.method.has_value() != c.path.has_value())
        return std::unexpected(AUTH_MALFORMED_CHALLENGE);

    return c;
}

std::string NChallengeCodec::signingPayload(const SChallenge& c) {
    std::string payload = fmt::format("{}\nversion={}\nissuer={}:{}\naudience={}:{}\nnonce={}\nissued_at={}\nttl={}\n", PAYLOAD_HEADER, c.version, c.issuer.size(), c.issuer,
                                      c.audience.size(), c.audience, NEncoding::base64UrlEncode(c.nonce), c.issuedAt, c.ttlSeconds);

    if (c.method.has_value())
        payload += fmt::format("method={}:{}\n", c.method->size(), *c.method);
    if (c.path.has_value())
        payload += fmt::format("path={}:{}\n", c.path->size(), *c.path);
    if (c.origin.has_value())
        payload += fmt::format("origin={}:{}\n", c.origin->size(), *c.origin);

    return payload;
}

std::string NChallengeCodec::replayKey(const SChallenge& c) {
    std::string input = c.issuer;
    input += REPLAY_KEY_SEP;
    input.append((const char*)c.nonce.data(), c.nonce.size());

    return NEncoding::toHex(NCrypto::sha256(input));
}
