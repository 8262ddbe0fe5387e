#pragma once

#include <string>
#include <expected>

// Authorization hook run after a wallet proved itself. The error side (or an
// exception) means the gate could not decide, which is never an allow.
class ITokenGate {
  public:
    virtual ~ITokenGate() = default;

    virtual std::expected<bool, std::string> allows(const std::string& walletAddress) = 0;
};
