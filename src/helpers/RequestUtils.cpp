#include "RequestUtils.hpp"

#include "../headers/clientIpHeaders.hpp"
#include "../headers/originHeader.hpp"

std::string NRequestUtils::ipForRequest(const Pistache::Http::Request& req) {
    std::shared_ptr<const CFConnectingIPHeader> cfHeader;
    std::shared_ptr<const XRealIPHeader>        xRealIPHeader;

    try {
        cfHeader = Pistache::Http::Header::header_cast<CFConnectingIPHeader>(req.headers().get("cf-connecting-ip"));
    } catch (std::exception& e) {
        ; // silent ignore
    }

    try {
        xRealIPHeader = Pistache::Http::Header::header_cast<XRealIPHeader>(req.headers().get("X-Real-IP"));
    } catch (std::exception& e) {
        ; // silent ignore
    }

    if (cfHeader)
        return cfHeader->ip();

    if (xRealIPHeader)
        return xRealIPHeader->ip();

    return req.address().host();
}

std::optional<std::string> NRequestUtils::authorizationForRequest(const Pistache::Http::Request& req) {
    std::shared_ptr<const Pistache::Http::Header::Authorization> authHeader;

    try {
        authHeader = Pistache::Http::Header::header_cast<Pistache::Http::Header::Authorization>(req.headers().get("Authorization"));
    } catch (std::exception& e) {
        ; // silent ignore
    }

    if (!authHeader)
        return std::nullopt;

    return authHeader->value();
}

SRequestDescriptor NRequestUtils::descriptorForRequest(const Pistache::Http::Request& req) {
    std::shared_ptr<const OriginHeader> originHeader;

    try {
        originHeader = Pistache::Http::Header::header_cast<OriginHeader>(req.headers().get("Origin"));
    } catch (std::exception& e) {
        ; // silent ignore
    }

    SRequestDescriptor descriptor;
    descriptor.method = Pistache::Http::methodString(req.method());
    descriptor.path   = req.resource();

    if (originHeader)
        descriptor.origin = originHeader->origin();

    return descriptor;
}
