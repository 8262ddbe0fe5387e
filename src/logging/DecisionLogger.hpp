#pragma once

#include <string>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>
#include <fstream>

#include <pistache/http.h>

// CSV log of every gate decision, columns picked by logging.decision_log_schema
class CDecisionLogger {
  public:
    CDecisionLogger();
    ~CDecisionLogger();

    void logDecision(const Pistache::Http::Request& req, const char* action, const std::string& wallet = "", const char* reason = "");

  private:
    enum eDecisionLoggerProps : uint8_t {
        DECISION_EPOCH = 0,
        DECISION_IP,
        DECISION_METHOD,
        DECISION_RESOURCE,
        DECISION_WALLET,
        DECISION_ACTION,
        DECISION_REASON,
    };

    std::vector<eDecisionLoggerProps> m_logSchema;
    std::ofstream                     m_file;
    std::mutex                        m_fileMutex;
};

inline std::unique_ptr<CDecisionLogger> g_pDecisionLogger;
