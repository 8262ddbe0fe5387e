#pragma once

#include <string>
#include <optional>

#include <pistache/http.h>

#include "../core/AuthTypes.hpp"

namespace NRequestUtils {
    std::string                ipForRequest(const Pistache::Http::Request& req);
    std::optional<std::string> authorizationForRequest(const Pistache::Http::Request& req);
    SRequestDescriptor         descriptorForRequest(const Pistache::Http::Request& req);
};
