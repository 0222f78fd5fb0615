#pragma once

#include <string>
#include <grpcpp/grpcpp.h>

#include "chunkdfs.grpc.pb.h"
#include "memory_storage.hpp"

// Node-facing RPC surface over one MemoryChunkStore.
class DataNodeServiceImpl final : public DataNodeService::Service {
private:
    MemoryChunkStore* store;
    std::string server_id;

public:
    DataNodeServiceImpl(MemoryChunkStore* store, std::string server_id);

    grpc::Status StoreChunk(grpc::ServerContext* context, const ::ChunkData* request, ::Ack* response) override;
    grpc::Status GetChunk(grpc::ServerContext* context, const ::ChunkRequest* request, ::ChunkData* response) override;
    grpc::Status DeleteChunk(grpc::ServerContext* context, const ::ChunkRequest* request, ::Ack* response) override;
    grpc::Status ListChunks(grpc::ServerContext* context, const ::NodeRequest* request, ::ChunkList* response) override;
    grpc::Status GetInfo(grpc::ServerContext* context, const ::NodeRequest* request, ::StorageInfo* response) override;
    grpc::Status GetMemoryUsage(grpc::ServerContext* context, const ::NodeRequest* request, ::MemoryUsage* response) override;
    grpc::Status Compact(grpc::ServerContext* context, const ::NodeRequest* request, ::CompactResponse* response) override;
    grpc::Status Health(grpc::ServerContext* context, const ::NodeRequest* request, ::NodeHealth* response) override;
};
