#include "MemoryReplayStore.hpp"

#include "../debug/log.hpp"

CMemoryReplayStore::CMemoryReplayStore(size_t capacity, Clock clock) : m_capacity(capacity == 0 ? 1 : capacity), m_clock(std::move(clock)) {
    ;
}

std::expected<eReplayStatus, std::string> CMemoryReplayStore::checkAndReserve(const std::string& key, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lg(m_mutex);

    const auto                  NOW = m_clock();

    if (auto it = m_index.find(key); it != m_index.end()) {
        if (it->second->expires > NOW) {
            m_lru.splice(m_lru.begin(), m_lru, it->second);
            return REPLAY_ALREADY_USED;
        }

        // stale, the slot can be reused
        m_lru.erase(it->second);
        m_index.erase(it);
    }

    if (m_index.size() >= m_capacity && purgeExpired(NOW) == 0) {
        Debug::log(WARN, "MemoryReplayStore: at capacity ({}), evicting the least recently used nonce", m_capacity);
        m_index.erase(m_lru.back().key);
        m_lru.pop_back();
    }

    m_lru.push_front(SEntry{.key = key, .expires = NOW + ttl});
    m_index.emplace(key, m_lru.begin());

    return REPLAY_FRESH;
}

size_t CMemoryReplayStore::size() const {
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_index.size();
}

size_t CMemoryReplayStore::purgeExpired(std::chrono::steady_clock::time_point now) {
    // bounded walk from the tail, entries further in reach it as they age
    size_t purged = 0, visited = 0;
    for (auto it = m_lru.end(); it != m_lru.begin() && visited < PURGE_SCAN_LIMIT; ++visited) {
        --it;
        if (it->expires <= now) {
            m_index.erase(it->key);
            it = m_lru.erase(it);
            purged++;
        }
    }

    Debug::log(TRACE, "MemoryReplayStore: purged {} expired nonces out of {} looked at", purged, visited);

    return purged;
}
