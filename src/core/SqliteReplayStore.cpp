#include "SqliteReplayStore.hpp"

#include "../debug/log.hpp"

#include <string_view>
#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

constexpr const uint64_t DB_TIME_BEFORE_CLEANUP_MS = 1000 * 60; // 1 min
constexpr const int      DB_BUSY_TIMEOUT_MS        = 5000;

//
static bool isHashValid(const std::string_view sv) {
    return !sv.empty() && std::all_of(sv.begin(), sv.end(), [](const char& c) { return (c >= 'a' && c <= 'f') || (c >= '0' && c <= '9'); });
}

static int64_t epochOf(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

CSqliteReplayStore::CSqliteReplayStore(const std::string& path, Clock clock) : m_clock(std::move(clock)) {
    if (sqlite3_open(path.c_str(), &m_db) != SQLITE_OK) {
        const std::string ERRMSG = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        if (m_db)
            sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error(fmt::format("failed to open sqlite3 db at {}: {}", path, ERRMSG));
    }

    sqlite3_busy_timeout(m_db, DB_BUSY_TIMEOUT_MS);

    char*       errmsg = nullptr;

    const char* NONCES_TABLE = R"#(
CREATE TABLE IF NOT EXISTS nonces (
	key TEXT NOT NULL,
	expires INTEGER NOT NULL,
	CONSTRAINT PK PRIMARY KEY (key)
);)#";

    sqlite3_exec(m_db, NONCES_TABLE, nullptr, nullptr, &errmsg);

    if (errmsg) {
        const std::string ERRMSG = errmsg;
        sqlite3_free(errmsg);
        sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error(fmt::format("failed to create the nonces table: {}", ERRMSG));
    }

    Debug::log(LOG, "Replay database at {} ready", path);

    cleanupDb();
}

CSqliteReplayStore::~CSqliteReplayStore() {
    if (m_db)
        sqlite3_close(m_db);
}

std::expected<eReplayStatus, std::string> CSqliteReplayStore::checkAndReserve(const std::string& key, std::chrono::seconds ttl) {
    if (!isHashValid(key))
        return std::unexpected("invalid replay key");

    std::lock_guard<std::mutex> lg(m_mutex);

    if (shouldCleanupDb())
        cleanupDb();

    const auto NOW = epochOf(m_clock());

    // one statement, so it is atomic across processes too. A live row makes
    // the upsert a no-op, which sqlite3_changes reports as 0.
    const std::string CMD = fmt::format(R"#(
INSERT INTO nonces VALUES ('{}', {})
ON CONFLICT(key) DO UPDATE SET expires = excluded.expires WHERE nonces.expires <= {};
)#",
                                        key, NOW + ttl.count(), NOW);

    char*             errmsg = nullptr;
    sqlite3_exec(m_db, CMD.c_str(), nullptr, nullptr, &errmsg);

    if (errmsg) {
        const std::string ERRMSG = errmsg;
        sqlite3_free(errmsg);
        Debug::log(ERR, "sqlite3 error: tried to persist:\n{}\nGot: {}", CMD, ERRMSG);
        return std::unexpected(ERRMSG);
    }

    return sqlite3_changes(m_db) == 1 ? REPLAY_FRESH : REPLAY_ALREADY_USED;
}

std::expected<size_t, std::string> CSqliteReplayStore::entries() {
    std::lock_guard<std::mutex> lg(m_mutex);

    size_t                      count  = 0;
    char*                       errmsg = nullptr;

    sqlite3_exec(
        m_db, "SELECT COUNT(*) FROM nonces;",
        [](void* data, int len, char** a, char** b) -> int {
            if (len > 0 && a[0])
                *reinterpret_cast<size_t*>(data) = std::stoull(a[0]);
            return 0;
        },
        &count, &errmsg);

    if (errmsg) {
        const std::string ERRMSG = errmsg;
        sqlite3_free(errmsg);
        return std::unexpected(ERRMSG);
    }

    return count;
}

bool CSqliteReplayStore::shouldCleanupDb() {
    const auto TIME = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch()).count();
    const auto LAST = std::chrono::duration_cast<std::chrono::milliseconds>(m_lastDbCleanup.time_since_epoch()).count();

    if (TIME - LAST > DB_TIME_BEFORE_CLEANUP_MS)
        return true;

    return false;
}

void CSqliteReplayStore::cleanupDb() {
    m_lastDbCleanup = std::chrono::steady_clock::now();

    const std::string CMD = fmt::format(R"#(
DELETE FROM nonces WHERE expires <= {};
)#",
                                        epochOf(m_clock()));

    char*             errmsg = nullptr;
    sqlite3_exec(m_db, CMD.c_str(), nullptr, nullptr, &errmsg);

    if (errmsg) {
        Debug::log(ERR, "sqlite3 error: tried to persist:\n{}\nGot: {}", CMD, errmsg);
        sqlite3_free(errmsg);
        return;
    }

    Debug::log(TRACE, "Replay database: purged {} expired nonces", sqlite3_changes(m_db));
}
