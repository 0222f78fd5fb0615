#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <grpcpp/grpcpp.h>

#include "chunk.hpp"
#include "chunkdfs.grpc.pb.h"

struct NodeInfo {
    int64_t chunk_count = 0;
    int64_t total_size = 0;
    std::string storage_type;
    std::string server_id;
};

// Remote proxy for one storage node. Failures are thrown as DfsError:
// NotFound for a missing chunk, Unreachable for transport failures and
// timeouts, RemoteError{status, body} for any other failure status.
// No retries at this layer.
class NodeClient {
public:
    virtual ~NodeClient() = default;

    virtual const std::string& address() const = 0;

    virtual void storeChunk(const Chunk& chunk) = 0;
    virtual Chunk getChunk(const std::string& chunk_id) = 0;
    virtual void deleteChunk(const std::string& chunk_id) = 0;
    virtual void healthCheck() = 0;
    virtual NodeInfo info() = 0;

    // Diagnostics
    virtual std::vector<std::string> listChunks() = 0;
    virtual int64_t memoryUsage() = 0;
    virtual int64_t compact() = 0;
};

class GrpcNodeClient final : public NodeClient {
private:
    std::string node_address;
    std::unique_ptr<DataNodeService::Stub> stub;
    std::chrono::milliseconds timeout;

    // Each call gets its own context and deadline
    void prepare(grpc::ClientContext& context) const;

public:
    GrpcNodeClient(const std::string& address, std::chrono::milliseconds timeout);

    const std::string& address() const override { return node_address; }

    void storeChunk(const Chunk& chunk) override;
    Chunk getChunk(const std::string& chunk_id) override;
    void deleteChunk(const std::string& chunk_id) override;
    void healthCheck() override;
    NodeInfo info() override;

    std::vector<std::string> listChunks() override;
    int64_t memoryUsage() override;
    int64_t compact() override;
};
