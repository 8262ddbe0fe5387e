#include "Handler.hpp"
#include "Engine.hpp"
#include "../headers/wwwAuthenticateHeader.hpp"
#include "../headers/xWalletAddressHeader.hpp"
#include "../debug/log.hpp"
#include "../config/Config.hpp"
#include "../helpers/RequestUtils.hpp"
#include "../logging/DecisionLogger.hpp"


#include <fmt/format.h>
#include <glaze/glaze.hpp>

void CServerHandler::onRequest(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter response) {
    const auto                                                HEADERS = req.headers();
    std::shared_ptr<const Pistache::Http::Header::Host>       hostHeader;
    std::shared_ptr<const Pistache::Http::Header::UserAgent>  userAgentHeader;

    try {
        hostHeader = Pistache::Http::Header::header_cast<Pistache::Http::Header::Host>(HEADERS.get("Host"));
    } catch (std::exception& e) {
        Debug::log(ERR, "Request has no Host header?");
        response.send(Pistache::Http::Code::Bad_Request, "Bad Request");
        return;
    }

    try {
        userAgentHeader = Pistache::Http::Header::header_cast<Pistache::Http::Header::UserAgent>(HEADERS.get("User-Agent"));
    } catch (std::exception& e) {
        ; // silent ignore
    }

    const auto DESCRIPTOR = NRequestUtils::descriptorForRequest(req);

    Debug::log(LOG, "New request: {} {}:{}{}", DESCRIPTOR.method, hostHeader->host(), hostHeader->port().toString(), req.resource());
    Debug::log(LOG, " | Request author: IP {}, direct: {}", NRequestUtils::ipForRequest(req), req.address().host());

    if (userAgentHeader)
        Debug::log(TRACE, " | UA: {}", userAgentHeader->agent());

    switch (g_pConfig->actionFor(DESCRIPTOR.method, req.resource())) {
        case ACTION_DENY:
            Debug::log(LOG, " | Action: DENY (rule)");
            response.send(Pistache::Http::Code::Forbidden, "Blocked by walletgate");
            g_pDecisionLogger->logDecision(req, "DENY");
            return;
        case ACTION_ALLOW:
            Debug::log(LOG, " | Action: PASS (rule)");
            g_pDecisionLogger->logDecision(req, "ALLOW");
            proxyPass(req, response);
            return;
        default: break;
    }

    const auto RESULT = g_pAuthEngine->evaluate(DESCRIPTOR, NRequestUtils::authorizationForRequest(req));

    switch (RESULT.kind) {
        case AUTH_RESULT_REQUIRES_CHALLENGE:
            Debug::log(LOG, " | Action: CHALLENGE (no authorization)");
            g_pDecisionLogger->logDecision(req, "CHALLENGE");
            serveChallenge(req, response, RESULT);
            return;
        case AUTH_RESULT_REJECTED:
            Debug::log(LOG, " | Action: REJECT ({})", NAuthError::code(RESULT.reason));
            g_pDecisionLogger->logDecision(req, "REJECT", "", NAuthError::code(RESULT.reason));
            serveRejection(req, response, RESULT);
            return;
        case AUTH_RESULT_AUTHENTICATED:
            Debug::log(LOG, " | Action: PASS (wallet {})", RESULT.identity.address);
            g_pDecisionLogger->logDecision(req, "ALLOW", RESULT.identity.address);
            proxyPass(req, response, RESULT.identity.address);
            return;
    }
}

void CServerHandler::onTimeout(const Pistache::Http::Request& request, Pistache::Http::ResponseWriter response) {
    response.send(Pistache::Http::Code::Request_Timeout, "Timeout").then([=](ssize_t) {}, PrintException());
}

void CServerHandler::serveChallenge(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response, const SAuthResult& result) {
    const auto BODY = glz::write_json(SChallengeBody{.realm = g_pAuthEngine->config().realm, .challenge = result.challengeToken});

    response.headers().add(std::make_shared<WwwAuthenticateHeader>(result.challengeHeader));
    response.headers().add<Pistache::Http::Header::CacheControl>(Pistache::Http::CacheDirective::NoStore);
    response.setMime(Pistache::Http::Mime::MediaType("application/json"));
    response.send(Pistache::Http::Code::Forbidden, BODY.value_or("{}"));
}

void CServerHandler::serveRejection(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response, const SAuthResult& result) {
    const auto BODY = glz::write_json(SRejectionBody{.error = NAuthError::code(result.reason), .message = NAuthError::message(result.reason)});

    response.headers().add<Pistache::Http::Header::CacheControl>(Pistache::Http::CacheDirective::NoStore);
    response.setMime(Pistache::Http::Mime::MediaType("application/json"));
    response.send(Pistache::Http::Code::Forbidden, BODY.value_or("{}"));
}

void CServerHandler::proxyPass(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response, const std::string& walletAddress) {
    std::string forwardAddress = g_pConfig->m_config.forward_address;
    const auto  HOST           = Pistache::Http::Header::header_cast<Pistache::Http::Header::Host>(req.headers().get("Host"));

    for (const auto& R : g_pConfig->m_config.proxy_rules) {
        if (R.host.contains(":")) {
            if (R.host == HOST->host() + ":" + HOST->port().toString()) {
                forwardAddress = R.destination;
                break;
            }
        } else if (HOST->host() == R.host) {
            forwardAddress = R.destination;
            break;
        }
    }

    Debug::log(TRACE, "Method ({}): Forwarding to {}", Pistache::Http::methodString(req.method()), forwardAddress + req.resource());

    Pistache::Http::Experimental::Client client;
    client.init(Pistache::Http::Experimental::Client::options().maxConnectionsPerHost(32).maxResponseSize(g_pConfig->m_config.max_request_size).threads(4));

    auto builder = client.prepareRequest(forwardAddress + req.resource(), req.method());
    builder.body(req.body());
    for (auto it = req.cookies().begin(); it != req.cookies().end(); ++it) {
        builder.cookie(*it);
    }
    builder.params(req.query());
    const auto HEADERS = req.headers().list();
    for (auto& h : HEADERS) {
        const auto HNAME = std::string_view{h->name()};
        // the upstream only ever learns the wallet from us
        if (HNAME == "Cache-Control" || HNAME == "Connection" || HNAME == "Content-Length" || HNAME == "Accept-Encoding" || HNAME == "Authorization" ||
            HNAME == XWalletAddressHeader::Name) {
            Debug::log(TRACE, "Header in: {} (DROPPED)", h->name());
            continue;
        }

        Debug::log(TRACE, "Header in: {}", h->name());
        builder.header(h);
    }
    builder.header(std::make_shared<Pistache::Http::Header::Connection>(Pistache::Http::ConnectionControl::KeepAlive));

    if (!walletAddress.empty())
        builder.header(std::make_shared<XWalletAddressHeader>(walletAddress));

    builder.timeout(std::chrono::seconds(g_pConfig->m_config.proxy_timeout_sec));

    auto resp = builder.send();
    resp.then(
        [&](Pistache::Http::Response resp) {
            const auto HEADERSRESP = resp.headers().list();

            for (auto& h : HEADERSRESP) {
                if (std::string_view{h->name()} == "Transfer-Encoding") {
                    Debug::log(TRACE, "Header out: {} (DROPPED)", h->name());
                    continue;
                }

                Debug::log(TRACE, "Header out: {}", h->name());
                response.headers().add(h);
            }

            for (auto it = resp.cookies().begin(); it != resp.cookies().end(); ++it) {
                response.cookies().add(*it);
            }

            auto enc = req.getBestAcceptEncoding();
            response.setCompression(enc);
            response.send(resp.code(), resp.body());
        },
        [&](std::exception_ptr e) {
            try {
                std::rethrow_exception(e);
            } catch (std::exception& e) { Debug::log(ERR, "Proxy failed: {}", e.what()); } catch (const std::string& e) {
                Debug::log(ERR, "Proxy failed: {}", e);
            } catch (const char* e) { Debug::log(ERR, "Proxy failed: {}", e); } catch (...) {
                Debug::log(ERR, "Proxy failed: God knows why.");
            }

            response.send(Pistache::Http::Code::Bad_Gateway, "Bad Gateway");
        });
    Pistache::Async::Barrier<Pistache::Http::Response> b(resp);
    b.wait_for(std::chrono::seconds(g_pConfig->m_config.proxy_timeout_sec));

    client.shutdown();
}
