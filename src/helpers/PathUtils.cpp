#include "PathUtils.hpp"

#include <cctype>

std::string NPathUtils::canonicalPath(std::string_view path) {
    const auto END = path.find_first_of("?#");
    if (END != std::string_view::npos)
        path = path.substr(0, END);

    std::string out = "/";
    out.reserve(path.size() + 1);

    for (const char c : path) {
        if (c == '/') {
            if (out.back() != '/')
                out += '/';
            continue;
        }

        out += (char)std::tolower((unsigned char)c);
    }

    while (out.size() > 1 && out.back() == '/')
        out.pop_back();

    return out;
}

std::string NPathUtils::canonicalMethod(std::string_view method) {
    std::string out;
    out.reserve(method.size());
    for (const char c : method) {
        out += (char)std::toupper((unsigned char)c);
    }
    return out;
}
