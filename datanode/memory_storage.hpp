#pragma once

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunk.hpp"

struct StoreInfo {
    int64_t chunk_count = 0;
    int64_t total_size = 0;
    std::string storage_type = "memory";
};

// A single node's chunk repository. Everything lives in memory: nothing
// survives a process exit. Safe for concurrent callers; readers share the
// lock, writers hold it exclusively.
class MemoryChunkStore {
private:
    mutable std::shared_mutex chunks_mutex;
    std::unordered_map<std::string, Chunk> chunks;   // chunk id -> private copy
    int64_t used_bytes = 0;

public:
    MemoryChunkStore() = default;

    // Stores a private copy keyed by chunk.id, silently replacing any
    // existing entry with the same id.
    void store(const Chunk& chunk);

    // Returns a private copy. Throws DfsError(NotFound).
    Chunk get(const std::string& chunk_id) const;

    // Throws DfsError(NotFound).
    void remove(const std::string& chunk_id);

    bool has(const std::string& chunk_id) const;

    // Unordered
    std::vector<std::string> list() const;

    // Payload bytes currently held
    int64_t usage() const;

    StoreInfo info() const;

    void clear();

    // Eviction hook. Currently removes nothing and reports the number of
    // chunks held.
    // TODO: plug an eviction policy (e.g. LRU by last access) in here.
    int64_t compact();
};
