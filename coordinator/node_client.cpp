#include "node_client.hpp"
#include "errors.hpp"
#include "wire.hpp"

GrpcNodeClient::GrpcNodeClient(const std::string& address, std::chrono::milliseconds timeout)
    : node_address(address), timeout(timeout) {
    auto channel = grpc::CreateCustomChannel(address, grpc::InsecureChannelCredentials(),
                                             unlimitedChannelArguments());
    stub = DataNodeService::NewStub(channel);
}

void GrpcNodeClient::prepare(grpc::ClientContext& context) const {
    context.set_deadline(std::chrono::system_clock::now() + timeout);
}

void GrpcNodeClient::storeChunk(const Chunk& chunk) {
    ChunkData request;
    toProto(chunk, &request);

    Ack ack;
    grpc::ClientContext context;
    prepare(context);
    grpc::Status status = stub->StoreChunk(&context, request, &ack);

    if (!status.ok()) {
        throw fromGrpcStatus(status, "store chunk " + chunk.id + " on " + node_address);
    }
    if (!ack.ok()) {
        throw DfsError::remote(static_cast<int>(grpc::StatusCode::UNKNOWN), ack.message(),
                               "store chunk " + chunk.id + " on " + node_address);
    }
}

Chunk GrpcNodeClient::getChunk(const std::string& chunk_id) {
    ChunkRequest request;
    request.set_chunk_id(chunk_id);

    ChunkData response;
    grpc::ClientContext context;
    prepare(context);
    grpc::Status status = stub->GetChunk(&context, request, &response);

    if (!status.ok()) {
        throw fromGrpcStatus(status, "get chunk " + chunk_id + " from " + node_address);
    }
    return fromProto(response);
}

void GrpcNodeClient::deleteChunk(const std::string& chunk_id) {
    ChunkRequest request;
    request.set_chunk_id(chunk_id);

    Ack ack;
    grpc::ClientContext context;
    prepare(context);
    grpc::Status status = stub->DeleteChunk(&context, request, &ack);

    if (!status.ok()) {
        throw fromGrpcStatus(status, "delete chunk " + chunk_id + " on " + node_address);
    }
    if (!ack.ok()) {
        throw DfsError::remote(static_cast<int>(grpc::StatusCode::UNKNOWN), ack.message(),
                               "delete chunk " + chunk_id + " on " + node_address);
    }
}

void GrpcNodeClient::healthCheck() {
    NodeHealth response;
    grpc::ClientContext context;
    prepare(context);
    grpc::Status status = stub->Health(&context, NodeRequest(), &response);

    if (!status.ok()) {
        throw fromGrpcStatus(status, "health check on " + node_address);
    }
    if (response.status() != "healthy") {
        throw DfsError::remote(static_cast<int>(grpc::StatusCode::UNKNOWN),
                               "node reports status " + response.status(),
                               "health check on " + node_address);
    }
}

NodeInfo GrpcNodeClient::info() {
    StorageInfo response;
    grpc::ClientContext context;
    prepare(context);
    grpc::Status status = stub->GetInfo(&context, NodeRequest(), &response);

    if (!status.ok()) {
        throw fromGrpcStatus(status, "info from " + node_address);
    }

    NodeInfo info;
    info.chunk_count = response.chunk_count();
    info.total_size = response.total_size();
    info.storage_type = response.storage_type();
    info.server_id = response.server_id();
    return info;
}

std::vector<std::string> GrpcNodeClient::listChunks() {
    ChunkList response;
    grpc::ClientContext context;
    prepare(context);
    grpc::Status status = stub->ListChunks(&context, NodeRequest(), &response);

    if (!status.ok()) {
        throw fromGrpcStatus(status, "list chunks on " + node_address);
    }
    return std::vector<std::string>(response.chunk_ids().begin(), response.chunk_ids().end());
}

int64_t GrpcNodeClient::memoryUsage() {
    MemoryUsage response;
    grpc::ClientContext context;
    prepare(context);
    grpc::Status status = stub->GetMemoryUsage(&context, NodeRequest(), &response);

    if (!status.ok()) {
        throw fromGrpcStatus(status, "memory usage on " + node_address);
    }
    return response.memory_usage_bytes();
}

int64_t GrpcNodeClient::compact() {
    CompactResponse response;
    grpc::ClientContext context;
    prepare(context);
    grpc::Status status = stub->Compact(&context, NodeRequest(), &response);

    if (!status.ok()) {
        throw fromGrpcStatus(status, "compact on " + node_address);
    }
    return response.chunks_removed();
}
