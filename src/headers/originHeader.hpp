#pragma once

#include <pistache/http_headers.h>
#include <pistache/net.h>

class OriginHeader : public Pistache::Http::Header::Header {
  public:
    NAME("Origin");

    OriginHeader() = default;

    void parse(const std::string& str) override {
        m_origin = str;
    }

    void write(std::ostream& os) const override {
        os << m_origin;
    }

    std::string origin() const {
        return m_origin;
    }

  private:
    std::string m_origin = "";
};
