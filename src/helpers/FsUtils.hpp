#pragma once

#include <string>
#include <expected>

namespace NFsUtils {
    bool                                    isAbsolute(const std::string& path);
    // relative paths are taken from the directory walletgate was started in
    std::string                             resolve(const std::string& path);
    std::expected<std::string, std::string> readFileAsString(const std::string& path);

    std::string                             dataDir();
    // path of a file inside the data dir, creating the dir if needed
    std::expected<std::string, std::string> dataFile(const std::string& name);
};
