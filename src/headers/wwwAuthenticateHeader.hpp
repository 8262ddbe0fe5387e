#pragma once

#include <pistache/http_headers.h>
#include <pistache/net.h>

class WwwAuthenticateHeader : public Pistache::Http::Header::Header {
  public:
    NAME("WWW-Authenticate");

    WwwAuthenticateHeader(const std::string& challenge = "") : m_challenge(challenge) {
        ;
    }

    void parse(const std::string& str) override {
        m_challenge = str;
    }

    void write(std::ostream& os) const override {
        os << m_challenge;
    }

    std::string challenge() const {
        return m_challenge;
    }

  private:
    std::string m_challenge = "";
};
