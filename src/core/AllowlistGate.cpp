#include "AllowlistGate.hpp"

#include "WalletAddress.hpp"
#include "../debug/log.hpp"

CAllowlistGate::CAllowlistGate(const std::vector<std::string>& wallets) {
    for (const auto& w : wallets) {
        auto canonical = NWalletAddress::canonical(w);
        if (!canonical.has_value()) {
            Debug::log(WARN, "AllowlistGate: ignoring invalid wallet address \"{}\"", w);
            continue;
        }

        m_wallets.emplace(*canonical);
    }

    Debug::log(LOG, "AllowlistGate: {} wallets allowed", m_wallets.size());
}

std::expected<bool, std::string> CAllowlistGate::allows(const std::string& walletAddress) {
    return m_wallets.contains(walletAddress);
}

size_t CAllowlistGate::size() const {
    return m_wallets.size();
}
