#pragma once

#include "ReplayStore.hpp"

#include <sqlite3.h>
#include <mutex>
#include <functional>

// Replay store kept in a sqlite database, so gateways on one host can share it
class CSqliteReplayStore : public IReplayStore {
  public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    // throws if the database can't be opened or created
    explicit CSqliteReplayStore(const std::string& path, Clock clock = std::chrono::system_clock::now);
    ~CSqliteReplayStore();

    CSqliteReplayStore(const CSqliteReplayStore&)            = delete;
    CSqliteReplayStore& operator=(const CSqliteReplayStore&) = delete;

    virtual std::expected<eReplayStatus, std::string> checkAndReserve(const std::string& key, std::chrono::seconds ttl) override;

    // number of live and not yet purged rows
    std::expected<size_t, std::string>                entries();

  private:
    sqlite3*                              m_db = nullptr;
    Clock                                 m_clock;
    std::mutex                            m_mutex;
    std::chrono::steady_clock::time_point m_lastDbCleanup = std::chrono::steady_clock::now();

    void                                  cleanupDb();
    bool                                  shouldCleanupDb();
};
