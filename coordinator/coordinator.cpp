#include "coordinator.hpp"
#include "chunking.hpp"
#include "errors.hpp"
#include "placement.hpp"
#include "task_group.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>

namespace {

// Copy of the metadata with every chunk payload dropped.
FileMetadata descriptorsOf(const FileMetadata& metadata) {
    FileMetadata descriptors = metadata;
    for (auto& chunk : descriptors.chunks) {
        chunk.data.reset();
    }
    return descriptors;
}

} // namespace

Coordinator::Coordinator(std::vector<std::shared_ptr<NodeClient>> nodes, CoordinatorOptions options)
    : nodes(std::move(nodes)), options(options) {
    if (this->nodes.empty()) {
        throw DfsError(ErrorKind::InvalidArgument, "coordinator needs at least one storage node");
    }
    if (this->options.chunk_count <= 0) {
        throw DfsError(ErrorKind::InvalidArgument,
                       "chunk count must be positive, got " + std::to_string(this->options.chunk_count));
    }
    for (const auto& node : this->nodes) {
        if (!node) {
            throw DfsError(ErrorKind::InvalidArgument, "null storage node client");
        }
    }

    std::cout << "[INFO] Coordinator initialized with " << this->nodes.size()
              << " storage nodes, " << this->options.chunk_count << " chunks per file\n";
}

std::shared_ptr<const FileMetadata> Coordinator::lookup(const std::string& file_id) const {
    std::shared_lock<std::shared_mutex> lock(files_mutex);

    auto it = files.find(file_id);
    if (it == files.end()) {
        throw DfsError(ErrorKind::NotFound, "file not found: " + file_id);
    }
    return it->second;
}

FileMetadata Coordinator::upload(const std::vector<char>& data, const std::string& filename,
                                 const std::string& content_type) {
    return upload(data, filename, content_type, options.chunk_count);
}

FileMetadata Coordinator::upload(const std::vector<char>& data, const std::string& filename,
                                 const std::string& content_type, int chunk_count) {
    if (static_cast<int64_t>(data.size()) > options.max_file_size) {
        throw DfsError(ErrorKind::InvalidArgument,
                       "file size " + std::to_string(data.size()) + " exceeds the maximum of " +
                       std::to_string(options.max_file_size) + " bytes");
    }

    const std::string file_id = chunking::generateFileId();

    FileMetadata metadata = chunking::splitData(data, chunk_count, file_id);
    metadata.original_name = filename;
    metadata.content_type = content_type;

    std::cout << "[INFO] Uploading " << filename << " as " << file_id << " ("
              << metadata.size << " bytes, " << metadata.chunk_count << " chunks)\n";

    distribute(metadata);

    auto registered = std::make_shared<const FileMetadata>(descriptorsOf(metadata));
    {
        std::unique_lock<std::shared_mutex> lock(files_mutex);
        files[file_id] = registered;
    }

    std::cout << "[INFO] File " << file_id << " uploaded successfully\n";
    return *registered;
}

void Coordinator::distribute(const FileMetadata& metadata) {
    chunking::validateMetadata(metadata);

    const int node_count = static_cast<int>(nodes.size());
    TaskGroup group;

    for (const auto& chunk : metadata.chunks) {
        group.spawn([this, &chunk, node_count]() {
            const int node_index = placeChunk(chunk.index, node_count);
            NodeClient& node = *nodes[node_index];

            try {
                node.storeChunk(chunk);
            } catch (const DfsError& e) {
                std::cerr << "[ERROR] Failed to store chunk " << chunk.index << " on node "
                          << node_index << " (" << node.address() << "): " << e.what() << "\n";
                throw;
            }

            std::cout << "[INFO] Chunk " << chunk.index << " stored on node " << node_index
                      << " (" << node.address() << ")\n";
        });
    }

    group.wait();
}

std::vector<Chunk> Coordinator::collect(const FileMetadata& metadata) {
    const int node_count = static_cast<int>(nodes.size());
    std::vector<Chunk> chunks(metadata.chunks.size());
    TaskGroup group;

    for (size_t i = 0; i < metadata.chunks.size(); ++i) {
        group.spawn([this, &metadata, &chunks, i, node_count]() {
            const Chunk& descriptor = metadata.chunks[i];
            const int node_index = placeChunk(descriptor.index, node_count);
            NodeClient& node = *nodes[node_index];

            try {
                chunks[i] = node.getChunk(descriptor.id);
            } catch (const DfsError& e) {
                std::cerr << "[ERROR] Failed to fetch chunk " << descriptor.index << " from node "
                          << node_index << " (" << node.address() << "): " << e.what() << "\n";
                throw;
            }
        });
    }

    group.wait();
    return chunks;
}

std::vector<char> Coordinator::download(const std::string& file_id) {
    std::shared_ptr<const FileMetadata> metadata = lookup(file_id);

    std::vector<Chunk> chunks = collect(*metadata);
    for (const auto& chunk : chunks) {
        chunking::validateChunk(chunk);
    }

    std::vector<char> data = chunking::reconstruct(std::move(chunks));

    if (static_cast<int64_t>(data.size()) != metadata->size ||
        chunking::sha256Hex(data) != metadata->checksum) {
        throw DfsError(ErrorKind::ChunkCorrupt, "file " + file_id + ": checksum mismatch after reassembly");
    }

    std::cout << "[INFO] File " << file_id << " reassembled (" << data.size() << " bytes)\n";
    return data;
}

void Coordinator::remove(const std::string& file_id) {
    std::shared_ptr<const FileMetadata> metadata;
    {
        std::unique_lock<std::shared_mutex> lock(files_mutex);
        auto it = files.find(file_id);
        if (it == files.end()) {
            throw DfsError(ErrorKind::NotFound, "file not found: " + file_id);
        }
        metadata = it->second;
        files.erase(it);
    }

    const int node_count = static_cast<int>(nodes.size());
    TaskGroup group;

    for (const auto& chunk : metadata->chunks) {
        group.spawn([this, &chunk, node_count]() {
            const int node_index = placeChunk(chunk.index, node_count);
            NodeClient& node = *nodes[node_index];
            try {
                node.deleteChunk(chunk.id);
            } catch (const DfsError& e) {
                // Best effort: the chunk stays orphaned on the node
                std::cerr << "[WARNING] Failed to delete chunk " << chunk.index << " from node "
                          << node_index << " (" << node.address() << "): " << e.what() << "\n";
            }
        });
    }

    group.wait();
    std::cout << "[INFO] File " << file_id << " deleted\n";
}

FileMetadata Coordinator::fileInfo(const std::string& file_id) const {
    return *lookup(file_id);
}

std::vector<std::string> Coordinator::list() const {
    std::shared_lock<std::shared_mutex> lock(files_mutex);

    std::vector<std::string> file_ids;
    file_ids.reserve(files.size());
    for (const auto& [file_id, _] : files) {
        file_ids.push_back(file_id);
    }
    return file_ids;
}

HealthSummary Coordinator::healthSummary() {
    std::atomic<int> healthy{0};
    TaskGroup group;

    for (size_t i = 0; i < nodes.size(); ++i) {
        group.spawn([this, i, &healthy]() {
            try {
                nodes[i]->healthCheck();
                healthy++;
            } catch (const DfsError& e) {
                std::cerr << "[WARNING] Storage node " << i << " (" << nodes[i]->address()
                          << ") is unavailable: " << e.what() << "\n";
            }
        });
    }

    group.wait();

    HealthSummary summary;
    summary.healthy_node_count = healthy.load();
    summary.total_node_count = static_cast<int>(nodes.size());
    summary.status = summary.healthy_node_count >= options.chunk_count ? "healthy" : "degraded";
    summary.timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return summary;
}
