#pragma once

#include "TokenGate.hpp"

#include <vector>
#include <unordered_set>

class CAllowlistGate : public ITokenGate {
  public:
    // entries that aren't valid wallet addresses are dropped with a warning
    explicit CAllowlistGate(const std::vector<std::string>& wallets);

    virtual std::expected<bool, std::string> allows(const std::string& walletAddress) override;

    size_t                                   size() const;

  private:
    std::unordered_set<std::string> m_wallets;
};
