#pragma once

#include <string>
#include <chrono>
#include <expected>
#include <cstdint>

enum eReplayStatus : uint8_t {
    REPLAY_FRESH = 0,
    REPLAY_ALREADY_USED,
};

/*
    Tracks consumed nonces. checkAndReserve has to be atomic per key: out of
    any number of concurrent callers with the same key exactly one sees
    REPLAY_FRESH while the reservation lives. Entries may be dropped once
    their ttl passed.

    The error side is for the backend itself failing, callers treat it as a
    rejection.
*/
class IReplayStore {
  public:
    virtual ~IReplayStore() = default;

    virtual std::expected<eReplayStatus, std::string> checkAndReserve(const std::string& key, std::chrono::seconds ttl) = 0;
};
