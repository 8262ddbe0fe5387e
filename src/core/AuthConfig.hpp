#pragma once

#include <string>
#include <cstdint>

// What the issuer and verifier need to know about this server
struct SAuthConfig {
    std::string realm            = "walletgate";
    std::string issuer           = "walletgate";
    std::string audience         = "";
    uint32_t    ttlSeconds       = 60;
    bool        bindMethodPath   = true;
    bool        originBinding    = false;
    uint32_t    clockSkewSeconds = 120;
};
