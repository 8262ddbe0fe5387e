#include "DecisionLogger.hpp"

#include <sstream>
#include <fmt/format.h>

#include "../config/Config.hpp"
#include "../debug/log.hpp"
#include "../helpers/RequestUtils.hpp"
#include "../helpers/FsUtils.hpp"

CDecisionLogger::CDecisionLogger() {
    if (!g_pConfig->m_config.logging.log_decisions)
        return;

    const std::string_view SCHEMA = g_pConfig->m_config.logging.decision_log_schema;

    // parse the schema
    size_t pos = 0;
    while (pos <= SCHEMA.size()) {
        auto next = SCHEMA.find(',', pos);
        if (next == std::string_view::npos)
            next = SCHEMA.size();

        const auto CURR = SCHEMA.substr(pos, next - pos);
        pos             = next + 1;

        if (CURR == "epoch")
            m_logSchema.emplace_back(DECISION_EPOCH);
        else if (CURR == "ip")
            m_logSchema.emplace_back(DECISION_IP);
        else if (CURR == "method")
            m_logSchema.emplace_back(DECISION_METHOD);
        else if (CURR == "resource")
            m_logSchema.emplace_back(DECISION_RESOURCE);
        else if (CURR == "wallet")
            m_logSchema.emplace_back(DECISION_WALLET);
        else if (CURR == "action")
            m_logSchema.emplace_back(DECISION_ACTION);
        else if (CURR == "reason")
            m_logSchema.emplace_back(DECISION_REASON);
        else if (!CURR.empty())
            Debug::log(WARN, "DecisionLogger: unknown column \"{}\" in the schema, skipping", CURR);
    }

    m_file.open(NFsUtils::resolve(g_pConfig->m_config.logging.decision_log_file), std::ios::app);

    if (!m_file.good())
        Debug::die("DecisionLogger: bad file {}", g_pConfig->m_config.logging.decision_log_file);
}

CDecisionLogger::~CDecisionLogger() {
    if (m_file.is_open())
        m_file.close();
}

static std::string sanitize(const std::string& s) {
    if (s.empty())
        return s;

    std::string cpy = s;
    size_t      pos = 0;
    while ((pos = cpy.find('"', pos)) != std::string::npos) {
        cpy.replace(pos, 1, "\\\"");
        pos += 2;
    }

    return cpy;
}

void CDecisionLogger::logDecision(const Pistache::Http::Request& req, const char* action, const std::string& wallet, const char* reason) {
    if (!g_pConfig->m_config.logging.log_decisions)
        return;

    std::stringstream ss;

    for (const auto& t : m_logSchema) {
        switch (t) {
            case DECISION_EPOCH: {
                ss << fmt::format("{},", std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());
                break;
            }

            case DECISION_IP: {
                ss << fmt::format("{},", NRequestUtils::ipForRequest(req));
                break;
            }

            case DECISION_METHOD: {
                ss << fmt::format("{},", Pistache::Http::methodString(req.method()));
                break;
            }

            case DECISION_RESOURCE: {
                ss << fmt::format("\"{}\",", sanitize(req.resource()));
                break;
            }

            case DECISION_WALLET: {
                ss << fmt::format("{},", wallet.empty() ? "-" : wallet);
                break;
            }

            case DECISION_ACTION: {
                ss << fmt::format("{},", action);
                break;
            }

            case DECISION_REASON: {
                ss << fmt::format("{},", (reason && *reason) ? reason : "-");
                break;
            }
        }
    }

    std::string decisionLine = ss.str();
    if (decisionLine.empty())
        return;

    // replace , with \n
    decisionLine.back() = '\n';

    std::lock_guard<std::mutex> lg(m_fileMutex);
    m_file << decisionLine;
    m_file.flush();
}
