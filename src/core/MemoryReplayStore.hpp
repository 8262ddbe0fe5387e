#pragma once

#include "ReplayStore.hpp"

#include <list>
#include <mutex>
#include <functional>
#include <unordered_map>

// LRU bounded, process local replay store
class CMemoryReplayStore : public IReplayStore {
  public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit CMemoryReplayStore(size_t capacity = 100000, Clock clock = std::chrono::steady_clock::now);

    virtual std::expected<eReplayStatus, std::string> checkAndReserve(const std::string& key, std::chrono::seconds ttl) override;

    size_t                                            size() const;

    // expired entries looked at from the LRU tail before evicting a live one
    static constexpr size_t                           PURGE_SCAN_LIMIT = 64;

  private:
    struct SEntry {
        std::string                           key;
        std::chrono::steady_clock::time_point expires;
    };

    size_t                                                     purgeExpired(std::chrono::steady_clock::time_point now);

    size_t                                                     m_capacity = 100000;
    Clock                                                      m_clock;

    // front = most recently used
    std::list<SEntry>                                          m_lru;
    std::unordered_map<std::string, std::list<SEntry>::iterator> m_index;
    mutable std::mutex                                         m_mutex;
};
