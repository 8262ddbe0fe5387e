#pragma once

#include <string>
#include <string_view>

namespace NPathUtils {
    // the form a path is bound to a challenge in: no query or fragment, no
    // repeated or trailing slashes, lowercase, always rooted
    std::string canonicalPath(std::string_view path);
    std::string canonicalMethod(std::string_view method);
};
