#include "ConfigRule.hpp"

#include <algorithm>

bool CConfigRule::passes(const std::string& reqMethod, const std::string& res) const {
    if (method.has_value()) {
        std::string UC = reqMethod;
        std::transform(UC.begin(), UC.end(), UC.begin(), ::toupper);
        if (UC != *method)
            return false;
    }

    if (resource.has_value()) {
        if (!RE2::FullMatch(res, **resource))
            return false;
    }

    return true;
}
