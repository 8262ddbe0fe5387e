#include "Config.hpp"

#include <algorithm>

#include <glaze/glaze.hpp>

#include "../helpers/FsUtils.hpp"
#include "../GlobalState.hpp"

#include "../debug/log.hpp"

static eConfigAction strToAction(const std::string& s) {
    if (s.empty())
        return ACTION_NONE;

    std::string LC = s;
    std::transform(LC.begin(), LC.end(), LC.begin(), ::tolower);

    if (LC == "allow")
        return ACTION_ALLOW;
    if (LC == "deny")
        return ACTION_DENY;
    if (LC == "authenticate")
        return ACTION_AUTHENTICATE;

    Debug::log(ERR, "Invalid action: {}, assuming NONE", s);
    return ACTION_NONE;
}

static std::string readConfigFile() {
    const auto CONTENT = NFsUtils::readFileAsString(NFsUtils::resolve(g_pGlobalState->configPath));
    if (!CONTENT.has_value())
        Debug::die("Couldn't read the config: {}", CONTENT.error());

    return *CONTENT;
}

CConfig::CConfig() : CConfig(readConfigFile()) {
    ;
}

CConfig::CConfig(const std::string& jsonc) {
    auto json = glz::read_jsonc<SConfig>(jsonc);

    if (!json.has_value())
        Debug::die("No config or config has bad format");

    m_config = json.value();

    if (m_config.audience.empty())
        Debug::die("Config: audience is required");

    if (m_config.issuer.empty())
        Debug::die("Config: issuer can't be empty");

    if (m_config.issuer.size() > 1024 || m_config.audience.size() > 1024)
        Debug::die("Config: issuer and audience are limited to 1024 bytes");

    if (m_config.ttl_seconds <= 0)
        Debug::die("Config: ttl_seconds has to be positive, got {}", m_config.ttl_seconds);

    if (m_config.clock_skew_seconds < 0)
        Debug::die("Config: clock_skew_seconds can't be negative, got {}", m_config.clock_skew_seconds);

    if (m_config.replay_store != "memory" && m_config.replay_store != "sqlite")
        Debug::die("Config: unknown replay_store \"{}\", expected memory or sqlite", m_config.replay_store);

    if (m_config.replay_store == "sqlite" && m_config.data_dir.empty())
        Debug::die("Config: the sqlite replay store needs a data_dir");

    // parse some datas
    for (const auto& ic : m_config.rules) {
        CConfigRule rule;
        rule.action = strToAction(ic.action);

        if (!ic.method.empty()) {
            std::string UC = ic.method;
            std::transform(UC.begin(), UC.end(), UC.begin(), ::toupper);
            rule.method = UC;
        }

        if (!ic.resource.empty()) {
            rule.resource = std::make_unique<re2::RE2>(ic.resource);
            if ((*rule.resource)->error_code() != RE2::NoError) {
                Debug::log(CRIT, "Regex \"{}\" failed to parse", ic.resource);
                Debug::die("Failed to parse regex");
            }
        }

        m_parsedConfigDatas.rules.emplace_back(std::move(rule));
    }
}

eConfigAction CConfig::actionFor(const std::string& method, const std::string& resource) const {
    for (const auto& r : m_parsedConfigDatas.rules) {
        if (r.action == ACTION_NONE)
            continue;

        if (r.passes(method, resource))
            return r.action;
    }

    return ACTION_AUTHENTICATE;
}
