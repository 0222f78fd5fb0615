#include "service.hpp"
#include "chunking.hpp"
#include "wire.hpp"

#include <chrono>
#include <iostream>

using grpc::ServerContext;
using grpc::Status;

DataNodeServiceImpl::DataNodeServiceImpl(MemoryChunkStore* store, std::string server_id)
    : store(store), server_id(std::move(server_id)) {}

Status DataNodeServiceImpl::StoreChunk(ServerContext* context, const ::ChunkData* request, ::Ack* response) {
    Chunk chunk = fromProto(*request);

    try {
        chunking::validateChunk(chunk);
    } catch (const DfsError& e) {
        std::cerr << "[WARNING] Rejected corrupt chunk " << chunk.id << ": " << e.what() << "\n";
        return toGrpcStatus(e);
    }

    store->store(chunk);

    std::cout << "[INFO] Stored chunk " << chunk.id << " (" << chunk.size
              << " bytes) on server " << server_id << "\n";

    response->set_ok(true);
    response->set_message("Chunk stored successfully");
    return Status::OK;
}

Status DataNodeServiceImpl::GetChunk(ServerContext* context, const ::ChunkRequest* request, ::ChunkData* response) {
    try {
        Chunk chunk = store->get(request->chunk_id());
        toProto(chunk, response);
    } catch (const DfsError& e) {
        return toGrpcStatus(e);
    }
    return Status::OK;
}

Status DataNodeServiceImpl::DeleteChunk(ServerContext* context, const ::ChunkRequest* request, ::Ack* response) {
    try {
        store->remove(request->chunk_id());
    } catch (const DfsError& e) {
        return toGrpcStatus(e);
    }

    std::cout << "[INFO] Deleted chunk " << request->chunk_id() << " on server " << server_id << "\n";

    response->set_ok(true);
    response->set_message("Chunk deleted successfully");
    return Status::OK;
}

Status DataNodeServiceImpl::ListChunks(ServerContext* context, const ::NodeRequest* request, ::ChunkList* response) {
    auto chunk_ids = store->list();
    for (const auto& chunk_id : chunk_ids) {
        response->add_chunk_ids(chunk_id);
    }
    response->set_count(static_cast<int32_t>(chunk_ids.size()));
    response->set_server_id(server_id);
    return Status::OK;
}

Status DataNodeServiceImpl::GetInfo(ServerContext* context, const ::NodeRequest* request, ::StorageInfo* response) {
    StoreInfo info = store->info();
    response->set_chunk_count(info.chunk_count);
    response->set_total_size(info.total_size);
    response->set_storage_type(info.storage_type);
    response->set_server_id(server_id);
    return Status::OK;
}

Status DataNodeServiceImpl::GetMemoryUsage(ServerContext* context, const ::NodeRequest* request, ::MemoryUsage* response) {
    int64_t usage = store->usage();
    response->set_memory_usage_bytes(usage);
    response->set_memory_usage_mb(static_cast<double>(usage) / (1024 * 1024));
    response->set_server_id(server_id);
    return Status::OK;
}

Status DataNodeServiceImpl::Compact(ServerContext* context, const ::NodeRequest* request, ::CompactResponse* response) {
    int64_t compacted = store->compact();
    std::cout << "[INFO] Compaction on server " << server_id << " reported " << compacted << " chunks\n";

    response->set_chunks_removed(compacted);
    response->set_server_id(server_id);
    return Status::OK;
}

Status DataNodeServiceImpl::Health(ServerContext* context, const ::NodeRequest* request, ::NodeHealth* response) {

    response->set_status("healthy");
    response->set_server_id(server_id);
    response->set_chunk_count(store->info().chunk_count);
    response->set_timestamp(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
    return Status::OK;
}
