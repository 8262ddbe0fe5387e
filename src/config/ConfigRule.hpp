#pragma once

#include <re2/re2.h>

#include <string>
#include <memory>
#include <optional>

#include "ConfigTypes.hpp"

class CConfigRule {
  public:
    eConfigAction action = ACTION_AUTHENTICATE;

    // method is compared uppercased, path is the raw request resource
    bool          passes(const std::string& reqMethod, const std::string& resource) const;

  private:
    std::optional<std::string>               method;
    std::optional<std::unique_ptr<re2::RE2>> resource;

    friend class CConfig;
};
