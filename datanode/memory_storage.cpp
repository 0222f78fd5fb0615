#include "memory_storage.hpp"
#include "errors.hpp"

#include <mutex>

namespace {

int64_t payloadSize(const Chunk& chunk) {
    return chunk.hasData() ? static_cast<int64_t>(chunk.data->size()) : 0;
}

} // namespace

void MemoryChunkStore::store(const Chunk& chunk) {
    // Copy outside the lock
    Chunk copy = chunk;
    const int64_t size = payloadSize(copy);

    std::unique_lock<std::shared_mutex> lock(chunks_mutex);

    auto it = chunks.find(copy.id);
    if (it != chunks.end()) {
        used_bytes -= payloadSize(it->second);
        it->second = std::move(copy);
    } else {
        std::string id = copy.id;
        chunks.emplace(std::move(id), std::move(copy));
    }
    used_bytes += size;
}

Chunk MemoryChunkStore::get(const std::string& chunk_id) const {
    std::shared_lock<std::shared_mutex> lock(chunks_mutex);

    auto it = chunks.find(chunk_id);
    if (it == chunks.end()) {
        throw DfsError(ErrorKind::NotFound, "chunk not found: " + chunk_id);
    }
    return it->second;
}

void MemoryChunkStore::remove(const std::string& chunk_id) {
    std::unique_lock<std::shared_mutex> lock(chunks_mutex);

    auto it = chunks.find(chunk_id);
    if (it == chunks.end()) {
        throw DfsError(ErrorKind::NotFound, "chunk not found: " + chunk_id);
    }
    used_bytes -= payloadSize(it->second);
    chunks.erase(it);
}

bool MemoryChunkStore::has(const std::string& chunk_id) const {
    std::shared_lock<std::shared_mutex> lock(chunks_mutex);
    return chunks.find(chunk_id) != chunks.end();
}

std::vector<std::string> MemoryChunkStore::list() const {
    std::shared_lock<std::shared_mutex> lock(chunks_mutex);

    std::vector<std::string> chunk_ids;
    chunk_ids.reserve(chunks.size());
    for (const auto& [chunk_id, _] : chunks) {
        chunk_ids.push_back(chunk_id);
    }
    return chunk_ids;
}

int64_t MemoryChunkStore::usage() const {
    std::shared_lock<std::shared_mutex> lock(chunks_mutex);
    return used_bytes;
}

StoreInfo MemoryChunkStore::info() const {
    std::shared_lock<std::shared_mutex> lock(chunks_mutex);

    StoreInfo info;
    info.chunk_count = static_cast<int64_t>(chunks.size());
    info.total_size = used_bytes;
    return info;
}

void MemoryChunkStore::clear() {
    std::unique_lock<std::shared_mutex> lock(chunks_mutex);
    chunks.clear();
    used_bytes = 0;
}

int64_t MemoryChunkStore::compact() {
    std::unique_lock<std::shared_mutex> lock(chunks_mutex);
    return static_cast<int64_t>(chunks.size());
}
