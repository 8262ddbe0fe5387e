#pragma once

#include <string>
#include <memory>
#include <vector>

#include <re2/re2.h>

#include "ConfigRule.hpp"

class CConfig {
  public:
    CConfig();
    explicit CConfig(const std::string& jsonc);

    // first matching rule wins, unmatched requests have to authenticate
    eConfigAction actionFor(const std::string& method, const std::string& resource) const;

    struct SConfigRule {
        std::string action   = "";
        std::string resource = "";
        std::string method   = "";
    };

    struct SProxyRule {
        std::string host        = "";
        std::string destination = "";
    };

    struct SConfig {
        int                      port              = 3001;
        std::string              forward_address   = "127.0.0.1:3000";
        std::string              data_dir          = "";
        unsigned long int        max_request_size  = 10000000; // 10MB
        unsigned long int        proxy_timeout_sec = 120;      // 2 minutes
        bool                     trace_logging     = false;

        std::string              realm              = "walletgate";
        std::string              issuer             = "walletgate";
        std::string              audience           = "";
        int                      ttl_seconds        = 60;
        bool                     bind_method_path   = true;
        bool                     origin_binding     = false;
        int                      clock_skew_seconds = 120;

        std::string              replay_store          = "memory";
        unsigned long int        replay_store_capacity = 100000;

        std::vector<std::string> allowed_wallets = {};

        std::vector<SConfigRule> rules = {};
        std::vector<SProxyRule>  proxy_rules;

        struct {
            bool        log_decisions = false;
            std::string decision_log_schema;
            std::string decision_log_file;
        } logging;
    } m_config;

    struct {
        std::vector<CConfigRule> rules;
    } m_parsedConfigDatas;
};

inline std::unique_ptr<CConfig> g_pConfig;
