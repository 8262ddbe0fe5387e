#include "FsUtils.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <filesystem>

#include <fmt/format.h>

#include "../GlobalState.hpp"
#include "../config/Config.hpp"

bool NFsUtils::isAbsolute(const std::string& sv) {
    return sv.size() > 0 && (*sv.begin() == '/' || *sv.begin() == '~');
}

std::string NFsUtils::resolve(const std::string& path) {
    return isAbsolute(path) ? path : g_pGlobalState->cwd + "/" + path;
}

std::expected<std::string, std::string> NFsUtils::readFileAsString(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.good())
        return std::unexpected(fmt::format("can't open {}: {}", path, std::strerror(errno)));

    return std::string((std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>()));
}

std::string NFsUtils::dataDir() {
    static const std::string dataRoot = resolve(g_pConfig->m_config.data_dir);
    return dataRoot;
}

std::expected<std::string, std::string> NFsUtils::dataFile(const std::string& name) {
    std::error_code ec;
    std::filesystem::create_directories(dataDir(), ec);
    if (ec)
        return std::unexpected(fmt::format("can't create the data dir {}: {}", dataDir(), ec.message()));

    return dataDir() + "/" + name;
}
