#pragma once

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunk.hpp"
#include "node_client.hpp"

struct CoordinatorOptions {
    int chunk_count = 6;                                 // chunks per file
    int64_t max_file_size = 10LL * 1024 * 1024 * 1024;   // upload cap in bytes
};

struct HealthSummary {
    std::string status;        // "healthy" or "degraded"
    int healthy_node_count = 0;
    int total_node_count = 0;
    int64_t timestamp = 0;     // unix seconds
};

// Splits uploads into chunks, places chunk i on node placeChunk(i, n) and
// fans store/fetch/delete out concurrently, one task per chunk. Fan-outs are
// all-or-nothing towards the caller: the first observed error fails the whole
// operation, and chunks already written elsewhere are left in place.
//
// Owns the file metadata map (descriptors only, no payloads) and the node
// list, which is fixed at construction.
class Coordinator {
private:
    const std::vector<std::shared_ptr<NodeClient>> nodes;
    const CoordinatorOptions options;

    // Held only for map reads/writes, never across a node call
    mutable std::shared_mutex files_mutex;
    std::unordered_map<std::string, std::shared_ptr<const FileMetadata>> files;   // file id -> metadata

    std::shared_ptr<const FileMetadata> lookup(const std::string& file_id) const;

public:
    // Throws DfsError(InvalidArgument) for an empty node list or a
    // non-positive chunk count.
    Coordinator(std::vector<std::shared_ptr<NodeClient>> nodes, CoordinatorOptions options);

    // Splits with the configured chunk count, distributes, and registers the
    // metadata only if every chunk was stored.
    FileMetadata upload(const std::vector<char>& data, const std::string& filename,
                        const std::string& content_type);
    FileMetadata upload(const std::vector<char>& data, const std::string& filename,
                        const std::string& content_type, int chunk_count);

    // Stores every chunk on its node concurrently and waits for all of them.
    void distribute(const FileMetadata& metadata);

    // Fetches every chunk from its node concurrently; result is in index order.
    std::vector<Chunk> collect(const FileMetadata& metadata);

    // Collects, validates and reassembles a file, then checks the whole-file
    // checksum. Throws DfsError(NotFound) for an unknown id.
    std::vector<char> download(const std::string& file_id);

    // Removes the metadata first, then deletes chunks best-effort: node
    // failures are logged, not reported. Throws DfsError(NotFound).
    void remove(const std::string& file_id);

    // Registered metadata, descriptors only. Throws DfsError(NotFound).
    FileMetadata fileInfo(const std::string& file_id) const;

    std::vector<std::string> list() const;

    // "healthy" when at least chunk_count nodes answer their health check.
    HealthSummary healthSummary();

    int nodeCount() const { return static_cast<int>(nodes.size()); }
    int chunkCount() const { return options.chunk_count; }
    int64_t maxFileSize() const { return options.max_file_size; }
};
