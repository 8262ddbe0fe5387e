#include <iostream>
#include <filesystem>
#include <pistache/common.h>
#include <pistache/endpoint.h>
#include <pistache/http.h>
#include <pistache/http_headers.h>
#include <pistache/net.h>

#include "headers/clientIpHeaders.hpp"
#include "headers/originHeader.hpp"

#include "debug/log.hpp"

#include "core/Handler.hpp"
#include "core/Engine.hpp"
#include "core/MemoryReplayStore.hpp"
#include "core/SqliteReplayStore.hpp"
#include "core/AllowlistGate.hpp"

#include "config/Config.hpp"

#include "helpers/FsUtils.hpp"
#include "logging/DecisionLogger.hpp"

#include "GlobalState.hpp"

#include <signal.h>
#include <stdexcept>

constexpr const char* REPLAY_DB_FILE = "replay.db";

static SAuthConfig authConfigFromConfig() {
    const auto& C = g_pConfig->m_config;

    return SAuthConfig{
        .realm            = C.realm,
        .issuer           = C.issuer,
        .audience         = C.audience,
        .ttlSeconds       = (uint32_t)C.ttl_seconds,
        .bindMethodPath   = C.bind_method_path,
        .originBinding    = C.origin_binding,
        .clockSkewSeconds = (uint32_t)C.clock_skew_seconds,
    };
}

static std::shared_ptr<IReplayStore> makeReplayStore() {
    if (g_pConfig->m_config.replay_store == "sqlite") {
        const auto PATH = NFsUtils::dataFile(REPLAY_DB_FILE);
        if (!PATH.has_value())
            throw std::runtime_error(PATH.error());

        return std::make_shared<CSqliteReplayStore>(*PATH);
    }

    return std::make_shared<CMemoryReplayStore>(g_pConfig->m_config.replay_store_capacity);
}

int main(int argc, char** argv, char** envp) {

    std::vector<std::string> ARGS{};
    ARGS.resize(argc);
    for (int i = 0; i < argc; ++i) {
        ARGS[i] = std::string{argv[i]};
    }

    g_pGlobalState->cwd = std::filesystem::current_path();

    for (int i = 1; i < argc; ++i) {
        if (ARGS[i] == "--help" || ARGS[i] == "-h") {
            std::cout << "walletgate " << WALLETGATE_VERSION << "\n -c, --config [path]   config file, walletgate.jsonc by default\n";
            return 0;
        } else if ((ARGS[i] == "--config" || ARGS[i] == "-c") && i + 1 < argc) {
            g_pGlobalState->configPath = ARGS[i + 1];
            i++;
        } else {
            std::cerr << "Unrecognized / invalid use of option " << ARGS[i] << "\nContinuing...\n";
            continue;
        }
    }

    g_pConfig = std::make_unique<CConfig>();

    try {
        std::shared_ptr<ITokenGate> gate;
        if (!g_pConfig->m_config.allowed_wallets.empty())
            gate = std::make_shared<CAllowlistGate>(g_pConfig->m_config.allowed_wallets);

        g_pAuthEngine = std::make_unique<CAuthEngine>(authConfigFromConfig(), makeReplayStore(), gate);
    } catch (std::exception& e) { Debug::die("Couldn't set up the auth engine: {}", e.what()); }

    Debug::log(LOG, "Issuing challenges as {} for {}, ttl {}s, skew {}s, method/path binding {}, origin binding {}", g_pConfig->m_config.issuer, g_pConfig->m_config.audience,
               g_pConfig->m_config.ttl_seconds, g_pConfig->m_config.clock_skew_seconds, g_pConfig->m_config.bind_method_path, g_pConfig->m_config.origin_binding);

    g_pDecisionLogger = std::make_unique<CDecisionLogger>();

    sigset_t signals;
    if (sigemptyset(&signals) != 0 || sigaddset(&signals, SIGTERM) != 0 || sigaddset(&signals, SIGINT) != 0 || sigaddset(&signals, SIGQUIT) != 0 ||
        sigaddset(&signals, SIGPIPE) != 0 || sigaddset(&signals, SIGALRM) != 0 || sigprocmask(SIG_BLOCK, &signals, nullptr) != 0)
        return 1;

    int               threads = 4;
    Pistache::Address address = {Pistache::Ipv4::any(), (uint16_t)g_pConfig->m_config.port};
    Debug::log(LOG, "Starting the server on {}:{}\n", address.host(), address.port().toString());

    Pistache::Http::Header::Registry::instance().registerHeader<CFConnectingIPHeader>();
    Pistache::Http::Header::Registry::instance().registerHeader<XRealIPHeader>();
    Pistache::Http::Header::Registry::instance().registerHeader<OriginHeader>();

    auto endpoint = std::make_unique<Pistache::Http::Endpoint>(address);
    auto opts     = Pistache::Http::Endpoint::options().threads(threads).flags(Pistache::Tcp::Options::ReuseAddr | Pistache::Tcp::Options::ReusePort);
    opts.maxRequestSize(g_pConfig->m_config.max_request_size);
    endpoint->init(opts);
    auto handler = Pistache::Http::make_handler<CServerHandler>();
    endpoint->setHandler(handler);

    endpoint->serveThreaded();

    bool terminate = false;
    while (!terminate) {
        int number = 0;
        int status = sigwait(&signals, &number);
        if (status != 0) {
            Debug::log(CRIT, "sigwait threw {} :(", status);
            break;
        }

        Debug::log(LOG, "Caught signal {}", number);

        switch (number) {
            case SIGINT: terminate = true; break;
            case SIGTERM: terminate = true; break;
            case SIGQUIT: terminate = true; break;
            case SIGPIPE: break;
            case SIGALRM: break;
        }
    }

    sigprocmask(SIG_UNBLOCK, &signals, nullptr);

    Debug::log(LOG, "Shutting down, bye!");

    endpoint->shutdown();
    endpoint = nullptr;

    g_pAuthEngine.reset();

    return 0;
}
