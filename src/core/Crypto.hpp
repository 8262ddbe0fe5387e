#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <vector>
#include <cstdint>
#include <openssl/evp.h>

namespace NCrypto {
    std::vector<uint8_t> sha256(std::string_view in);
    // throws on entropy failure, there is nothing sane left to do then
    std::vector<uint8_t> randomBytes(size_t len);
};

// An Ed25519 key, either a full keypair or a public key only
class CEd25519Key {
  public:
    ~CEd25519Key();

    CEd25519Key(const CEd25519Key&)            = delete;
    CEd25519Key& operator=(const CEd25519Key&) = delete;
    CEd25519Key(CEd25519Key&& other) noexcept;
    CEd25519Key& operator=(CEd25519Key&& other) noexcept;

    static std::unique_ptr<CEd25519Key> generate();
    static std::unique_ptr<CEd25519Key> fromPrivateKey(const std::vector<uint8_t>& seed);
    static std::unique_ptr<CEd25519Key> fromPublicKey(const std::vector<uint8_t>& pubkey);

    std::vector<uint8_t>                publicKey() const;
    bool                                hasPrivateKey() const;

    // empty on failure
    std::vector<uint8_t>                sign(std::string_view in) const;
    bool                                verifySignature(std::string_view in, const std::vector<uint8_t>& sig) const;

  private:
    explicit CEd25519Key(EVP_PKEY* key, bool priv);

    EVP_PKEY* m_evpPkey = nullptr;
    bool      m_private = false;
};
