#pragma once

#include <pistache/http_headers.h>
#include <pistache/net.h>

// attached to requests forwarded upstream once the wallet is authenticated
class XWalletAddressHeader : public Pistache::Http::Header::Header {
  public:
    NAME("X-Wallet-Address");

    XWalletAddressHeader(const std::string& address = "") : m_address(address) {
        ;
    }

    void parse(const std::string& str) override {
        m_address = str;
    }

    void write(std::ostream& os) const override {
        os << m_address;
    }

    std::string address() const {
        return m_address;
    }

  private:
    std::string m_address = "";
};
