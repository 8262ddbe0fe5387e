#include <gtest/gtest.h>

#include <limits>

#include "core/Verifier.hpp"
#include "core/Issuer.hpp"
#include "core/Challenge.hpp"
#include "core/WalletAddress.hpp"
#include "core/MemoryReplayStore.hpp"
#include "TestUtils.hpp"

using testutils::T0;

class VerifierTest : public testing::Test {
  protected:
    void SetUp() override {
        store    = std::make_shared<CMemoryReplayStore>();
        wallet   = testutils::key();
        verifier = std::make_unique<CSignatureVerifier>(cfg, store);
    }

    // reconfigure before issuing, the issuer and verifier share the config
    void useConfig(const SAuthConfig& c) {
        cfg      = c;
        verifier = std::make_unique<CSignatureVerifier>(cfg, store);
    }

    std::string issue(const std::string& method = "GET", const std::string& path = "/api/data", std::optional<std::string> origin = std::nullopt, int64_t at = T0) {
        CChallengeIssuer issuer(cfg);
        auto             c = issuer.issue(SRequestDescriptor{.method = method, .path = path, .origin = origin}, at);
        EXPECT_TRUE(c.has_value());
        return NChallengeCodec::encode(*c);
    }

    std::string tokenFor(const SChallenge& c) {
        return NChallengeCodec::encode(c);
    }

    SChallenge baseChallenge() {
        SChallenge c;
        c.issuer     = cfg.issuer;
        c.audience   = cfg.audience;
        c.nonce      = NCrypto::randomBytes(CHALLENGE_NONCE_LEN);
        c.issuedAt   = T0;
        c.ttlSeconds = cfg.ttlSeconds;
        c.method     = "GET";
        c.path       = "/api/data";
        return c;
    }

    std::expected<SWalletIdentity, eAuthError> verify(const SSignedResponse& r, const std::string& method = "GET", const std::string& path = "/api/data",
                                                      std::optional<std::string> origin = std::nullopt, int64_t now = T0 + 1) {
        return verifier->verify(r, method, path, origin, now);
    }

    SAuthConfig                         cfg = testutils::config();
    std::shared_ptr<CMemoryReplayStore> store;
    std::unique_ptr<CEd25519Key>        wallet;
    std::unique_ptr<CSignatureVerifier> verifier;
};

TEST_F(VerifierTest, AcceptsAFreshSignature) {
    auto r  = testutils::signToken(issue(), *wallet);
    auto id = verify(r);
    ASSERT_TRUE(id.has_value()) << NAuthError::code(id.error());
    EXPECT_EQ(id->address, NWalletAddress::encode(wallet->publicKey()));
}

TEST_F(VerifierTest, SecondUseIsReplay) {
    auto r = testutils::signToken(issue(), *wallet);
    ASSERT_TRUE(verify(r).has_value());
    EXPECT_EQ(verify(r).error(), AUTH_NONCE_REPLAYED);
}

TEST_F(VerifierTest, ExpiryWindowBoundaries) {
    // ttl 60, skew 120
    const std::vector<std::pair<int64_t, bool>> CASES = {
        {T0, true}, {T0 + 59, true}, {T0 + 180, true}, {T0 + 181, false}, {T0 - 120, true}, {T0 - 121, false},
    };

    for (const auto& [now, ok] : CASES) {
        auto r  = testutils::signToken(issue(), *wallet);
        auto id = verify(r, "GET", "/api/data", std::nullopt, now);
        EXPECT_EQ(id.has_value(), ok) << now - T0;
        if (!ok) {
            EXPECT_EQ(id.error(), AUTH_CHALLENGE_EXPIRED);
        }
    }
}

TEST_F(VerifierTest, ChallengeTtlCantExceedOurs) {
    auto c       = baseChallenge();
    c.ttlSeconds = 86400;
    auto r       = testutils::signToken(tokenFor(c), *wallet);
    EXPECT_EQ(verify(r, "GET", "/api/data", std::nullopt, T0 + 3600).error(), AUTH_CHALLENGE_EXPIRED);
}

TEST_F(VerifierTest, EverySignatureBitMatters) {
    auto r = testutils::signToken(issue(), *wallet);

    for (size_t bit = 0; bit < WALLET_SIGNATURE_LEN * 8; ++bit) {
        auto tampered = r;
        tampered.signature[bit / 8] ^= (1 << (bit % 8));
        auto id = verify(tampered);
        ASSERT_FALSE(id.has_value()) << bit;
        EXPECT_EQ(id.error(), AUTH_INVALID_SIGNATURE) << bit;
    }

    // nothing above touched the nonce
    EXPECT_EQ(store->size(), 0u);
    EXPECT_TRUE(verify(r).has_value());
}

TEST_F(VerifierTest, TamperedFieldsBreakTheSignature) {
    const auto ORIGINAL = baseChallenge();
    auto       r        = testutils::signToken(tokenFor(ORIGINAL), *wallet);

    std::vector<SChallenge> tampered(6, ORIGINAL);
    tampered[0].nonce[0] ^= 1;
    tampered[1].issuedAt += 1;
    tampered[2].ttlSeconds -= 1;
    tampered[3].path = "/api/admin";
    tampered[4].method = "DELETE";
    tampered[5].origin = "";

    for (size_t i = 0; i < tampered.size(); ++i) {
        auto forged           = r;
        forged.challengeToken = tokenFor(tampered[i]);
        auto id               = verify(forged, *tampered[i].method, *tampered[i].path);
        ASSERT_FALSE(id.has_value()) << i;
        EXPECT_EQ(id.error(), AUTH_INVALID_SIGNATURE) << i;
    }
}

TEST_F(VerifierTest, WrongWalletIsInvalidSignature) {
    auto r          = testutils::signToken(issue(), *wallet);
    r.walletAddress = NWalletAddress::encode(testutils::key()->publicKey());
    EXPECT_EQ(verify(r).error(), AUTH_INVALID_SIGNATURE);
}

TEST_F(VerifierTest, MalformedInputs) {
    auto r = testutils::signToken(issue(), *wallet);

    auto bad           = r;
    bad.challengeToken = "garbage";
    EXPECT_EQ(verify(bad).error(), AUTH_MALFORMED_CHALLENGE);

    bad               = r;
    bad.walletAddress = "0OIl";
    EXPECT_EQ(verify(bad).error(), AUTH_MALFORMED_ADDRESS);

    bad = r;
    bad.signature.pop_back();
    EXPECT_EQ(verify(bad).error(), AUTH_INVALID_SIGNATURE);

    EXPECT_EQ(store->size(), 0u);
}

TEST_F(VerifierTest, MethodAndPathAreBound) {
    auto r = testutils::signToken(issue("GET", "/api/data"), *wallet);

    EXPECT_EQ(verify(r, "POST", "/api/data").error(), AUTH_BINDING_MISMATCH);
    EXPECT_EQ(verify(r, "GET", "/api/other").error(), AUTH_BINDING_MISMATCH);

    // failed attempts leave the nonce usable
    EXPECT_EQ(store->size(), 0u);

    // canonical forms match
    EXPECT_TRUE(verify(r, "get", "/API//data/?x=1").has_value());
}

TEST_F(VerifierTest, UnboundChallengeIsRefusedWhileBindingIsOn) {
    auto c = baseChallenge();
    c.method.reset();
    c.path.reset();
    auto r = testutils::signToken(tokenFor(c), *wallet);
    EXPECT_EQ(verify(r).error(), AUTH_BINDING_MISMATCH);
}

TEST_F(VerifierTest, UnboundChallengeWorksWhenBindingIsOff) {
    auto c           = testutils::config();
    c.bindMethodPath = false;
    useConfig(c);

    auto r = testutils::signToken(issue(), *wallet);
    ASSERT_FALSE(NChallengeCodec::decode(r.challengeToken)->method.has_value());
    EXPECT_TRUE(verify(r, "DELETE", "/anything").has_value());
}

TEST_F(VerifierTest, OriginIsBoundWhenEnabled) {
    auto c          = testutils::config();
    c.originBinding = true;
    useConfig(c);

    auto r = testutils::signToken(issue("GET", "/api/data", "https://app.example"), *wallet);
    EXPECT_EQ(verify(r, "GET", "/api/data", "https://evil.example").error(), AUTH_ORIGIN_MISMATCH);
    EXPECT_EQ(verify(r, "GET", "/api/data", std::nullopt).error(), AUTH_ORIGIN_MISMATCH);
    EXPECT_TRUE(verify(r, "GET", "/api/data", "https://app.example").has_value());

    // no Origin at issue time binds the empty origin
    r = testutils::signToken(issue("GET", "/api/data", std::nullopt), *wallet);
    EXPECT_EQ(verify(r, "GET", "/api/data", "https://app.example").error(), AUTH_ORIGIN_MISMATCH);
    EXPECT_TRUE(verify(r, "GET", "/api/data", std::nullopt).has_value());

    // a challenge without any origin can't pass
    auto noOrigin = baseChallenge();
    r             = testutils::signToken(tokenFor(noOrigin), *wallet);
    EXPECT_EQ(verify(r).error(), AUTH_ORIGIN_MISMATCH);
}

TEST_F(VerifierTest, SelfMadeChallengesForOtherServersAreRefused) {
    auto c   = baseChallenge();
    c.issuer = "someone-else";
    auto r   = testutils::signToken(tokenFor(c), *wallet);
    EXPECT_EQ(verify(r).error(), AUTH_AUDIENCE_MISMATCH);

    c          = baseChallenge();
    c.audience = "http://elsewhere";
    r          = testutils::signToken(tokenFor(c), *wallet);
    EXPECT_EQ(verify(r).error(), AUTH_AUDIENCE_MISMATCH);
}

TEST_F(VerifierTest, FutureDatedChallengeStaysReservedUntilItsWindowCloses) {
    auto               now = std::chrono::steady_clock::time_point{} + std::chrono::seconds(T0);
    auto               clockStore = std::make_shared<CMemoryReplayStore>(100, [&now] { return now; });
    CSignatureVerifier v(cfg, clockStore);

    // dated 120s ahead, accepted until T0 + 120 + 60 + 120
    auto c     = baseChallenge();
    c.issuedAt = T0 + 120;
    auto r     = testutils::signToken(tokenFor(c), *wallet);

    ASSERT_TRUE(v.verify(r, "GET", "/api/data", std::nullopt, T0).has_value());

    now += std::chrono::seconds(299);
    EXPECT_EQ(v.verify(r, "GET", "/api/data", std::nullopt, T0 + 299).error(), AUTH_NONCE_REPLAYED);
    now += std::chrono::seconds(2);
    EXPECT_EQ(v.verify(r, "GET", "/api/data", std::nullopt, T0 + 301).error(), AUTH_CHALLENGE_EXPIRED);
}

TEST_F(VerifierTest, ExtremeIssuedAtIsMalformed) {
    for (const int64_t AT : {std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max(), (int64_t)-1}) {
        auto c     = baseChallenge();
        c.issuedAt = AT;

        // signed by hand, the client helper refuses such a token
        SSignedResponse r{.challengeToken = tokenFor(c), .walletAddress = NWalletAddress::encode(wallet->publicKey()),
                          .signature = wallet->sign(NChallengeCodec::signingPayload(c))};

        auto id = verify(r, "GET", "/api/data", std::nullopt, T0);
        ASSERT_FALSE(id.has_value()) << AT;
        EXPECT_EQ(id.error(), AUTH_MALFORMED_CHALLENGE) << AT;
    }

    EXPECT_EQ(store->size(), 0u);
}

TEST(Verifier, StoreFailureIsNotAnAuthentication) {
    auto               broken = std::make_shared<testutils::CBrokenReplayStore>();
    auto               cfg    = testutils::config();
    CSignatureVerifier v(cfg, broken);
    auto               wallet = testutils::key();

    CChallengeIssuer   issuer(cfg);
    auto               c = issuer.issue(SRequestDescriptor{.method = "GET", .path = "/api/data"}, T0);
    ASSERT_TRUE(c.has_value());

    auto r  = testutils::signToken(NChallengeCodec::encode(*c), *wallet);
    auto id = v.verify(r, "GET", "/api/data", std::nullopt, T0);
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error(), AUTH_REPLAY_STORE_ERROR);
    EXPECT_EQ(broken->calls, 1);

    // a bad signature never reaches the store
    r.signature[0] ^= 1;
    EXPECT_EQ(v.verify(r, "GET", "/api/data", std::nullopt, T0).error(), AUTH_INVALID_SIGNATURE);
    EXPECT_EQ(broken->calls, 1);
}
