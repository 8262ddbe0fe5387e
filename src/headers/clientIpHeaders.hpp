#pragma once

#include <pistache/http_headers.h>
#include <pistache/net.h>

// Headers a fronting proxy uses to tell us who the real client is
class CClientIPHeader : public Pistache::Http::Header::Header {
  public:
    void parse(const std::string& str) override {
        m_ip = str;
        // keep the first hop only
        if (const auto COMMA = m_ip.find(','); COMMA != std::string::npos)
            m_ip = m_ip.substr(0, COMMA);
        while (!m_ip.empty() && m_ip.back() == ' ')
            m_ip.pop_back();
    }

    void write(std::ostream& os) const override {
        os << m_ip;
    }

    std::string ip() const {
        return m_ip;
    }

  private:
    std::string m_ip = "";
};

class CFConnectingIPHeader : public CClientIPHeader {
  public:
    NAME("cf-connecting-ip");
};

class XRealIPHeader : public CClientIPHeader {
  public:
    NAME("X-Real-IP");
};
