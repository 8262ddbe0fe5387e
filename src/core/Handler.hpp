#pragma once

#include <pistache/http.h>
#include <pistache/client.h>

#include "AuthTypes.hpp"

class CServerHandler : public Pistache::Http::Handler {

    HTTP_PROTOTYPE(CServerHandler)

    void onRequest(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter response);

    void onTimeout(const Pistache::Http::Request& request, Pistache::Http::ResponseWriter response);

  private:
    void serveChallenge(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response, const SAuthResult& result);
    void serveRejection(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response, const SAuthResult& result);
    void proxyPass(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response, const std::string& walletAddress = "");

    struct SChallengeBody {
        std::string error     = "challenge_required";
        std::string realm     = "";
        std::string challenge = "";
    };

    struct SRejectionBody {
        std::string error   = "";
        std::string message = "";
    };
};
