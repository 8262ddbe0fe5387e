#include "Crypto.hpp"

#include "../debug/log.hpp"

#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>

std::vector<uint8_t> NCrypto::sha256(std::string_view in) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx)
        return {};

    if (!EVP_DigestInit(ctx, EVP_sha256())) {
        EVP_MD_CTX_free(ctx);
        return {};
    }

    if (!EVP_DigestUpdate(ctx, in.data(), in.size())) {
        EVP_MD_CTX_free(ctx);
        return {};
    }

    std::vector<uint8_t> buf;
    buf.resize(32);

    if (!EVP_DigestFinal(ctx, buf.data(), nullptr)) {
        EVP_MD_CTX_free(ctx);
        return {};
    }

    EVP_MD_CTX_free(ctx);

    return buf;
}

std::vector<uint8_t> NCrypto::randomBytes(size_t len) {
    std::vector<uint8_t> buf;
    buf.resize(len);

    if (RAND_bytes(buf.data(), (int)len) != 1) {
        Debug::log(CRIT, "NCrypto::randomBytes: RAND_bytes: err {}", ERR_error_string(ERR_get_error(), nullptr));
        throw std::runtime_error("Entropy source failed");
    }

    return buf;
}

CEd25519Key::CEd25519Key(EVP_PKEY* key, bool priv) : m_evpPkey(key), m_private(priv) {
    ;
}

CEd25519Key::~CEd25519Key() {
    if (m_evpPkey)
        EVP_PKEY_free(m_evpPkey);
}

CEd25519Key::CEd25519Key(CEd25519Key&& other) noexcept : m_evpPkey(other.m_evpPkey), m_private(other.m_private) {
    other.m_evpPkey = nullptr;
}

CEd25519Key& CEd25519Key::operator=(CEd25519Key&& other) noexcept {
    if (this == &other)
        return *this;

    if (m_evpPkey)
        EVP_PKEY_free(m_evpPkey);

    m_evpPkey       = other.m_evpPkey;
    m_private       = other.m_private;
    other.m_evpPkey = nullptr;
    return *this;
}

std::unique_ptr<CEd25519Key> CEd25519Key::generate() {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);

    if (!ctx)
        return nullptr;

    if (EVP_PKEY_keygen_init(ctx) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        return nullptr;
    }

    EVP_PKEY* key = nullptr;

    if (EVP_PKEY_keygen(ctx, &key) <= 0) {
        Debug::log(ERR, "CEd25519Key::generate: EVP_PKEY_keygen: err {}", ERR_error_string(ERR_get_error(), nullptr));
        EVP_PKEY_CTX_free(ctx);
        return nullptr;
    }

    EVP_PKEY_CTX_free(ctx);

    return std::unique_ptr<CEd25519Key>(new CEd25519Key(key, true));
}

std::unique_ptr<CEd25519Key> CEd25519Key::fromPrivateKey(const std::vector<uint8_t>& seed) {
    if (seed.size() != 32)
        return nullptr;

    EVP_PKEY* key = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size());
    if (!key)
        return nullptr;

    return std::unique_ptr<CEd25519Key>(new CEd25519Key(key, true));
}

std::unique_ptr<CEd25519Key> CEd25519Key::fromPublicKey(const std::vector<uint8_t>& pubkey) {
    if (pubkey.size() != 32)
        return nullptr;

    EVP_PKEY* key = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, pubkey.data(), pubkey.size());
    if (!key)
        return nullptr;

    return std::unique_ptr<CEd25519Key>(new CEd25519Key(key, false));
}

std::vector<uint8_t> CEd25519Key::publicKey() const {
    std::vector<uint8_t> buf;
    size_t               len = 32;
    buf.resize(len);

    if (!m_evpPkey || EVP_PKEY_get_raw_public_key(m_evpPkey, buf.data(), &len) != 1)
        return {};

    buf.resize(len);
    return buf;
}

bool CEd25519Key::hasPrivateKey() const {
    return m_private;
}

std::vector<uint8_t> CEd25519Key::sign(std::string_view in) const {
    if (!m_private)
        return {};

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx)
        return {};

    if (!EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, m_evpPkey)) {
        Debug::log(ERR, "CEd25519Key::sign: EVP_DigestSignInit: err {}", ERR_error_string(ERR_get_error(), nullptr));
        EVP_MD_CTX_free(ctx);
        return {};
    }

    size_t len = 0;

    if (!EVP_DigestSign(ctx, nullptr, &len, (const unsigned char*)in.data(), in.size())) {
        Debug::log(ERR, "CEd25519Key::sign: EVP_DigestSign: err {}", ERR_error_string(ERR_get_error(), nullptr));
        EVP_MD_CTX_free(ctx);
        return {};
    }

    if (len <= 0) {
        EVP_MD_CTX_free(ctx);
        return {};
    }

    std::vector<uint8_t> buf;
    buf.resize(len);

    if (!EVP_DigestSign(ctx, buf.data(), &len, (const unsigned char*)in.data(), in.size())) {
        Debug::log(ERR, "CEd25519Key::sign: EVP_DigestSign: err {}", ERR_error_string(ERR_get_error(), nullptr));
        EVP_MD_CTX_free(ctx);
        return {};
    }

    EVP_MD_CTX_free(ctx);

    buf.resize(len);
    return buf;
}

bool CEd25519Key::verifySignature(std::string_view in, const std::vector<uint8_t>& sig) const {
    if (!m_evpPkey)
        return false;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx)
        return false;

    if (!EVP_DigestVerifyInit(ctx, nullptr, nullptr, nullptr, m_evpPkey)) {
        Debug::log(ERR, "CEd25519Key::verifySignature: EVP_DigestVerifyInit: err {}", ERR_error_string(ERR_get_error(), nullptr));
        EVP_MD_CTX_free(ctx);
        return false;
    }

    int ret = EVP_DigestVerify(ctx, sig.data(), sig.size(), (const unsigned char*)in.data(), in.size());

    if (ret == 1) {
        // match
        EVP_MD_CTX_free(ctx);
        return true;
    }

    if (ret == 0) {
        // no match
        EVP_MD_CTX_free(ctx);
        return false;
    }

    // malformed sig, openssl leaves an error on the queue for it
    ERR_clear_error();

    EVP_MD_CTX_free(ctx);
    return false;
}
