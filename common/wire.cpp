#include "wire.hpp"

#include <limits>

void toProto(const Chunk& chunk, ChunkData* out) {
    out->set_id(chunk.id);
    out->set_file_id(chunk.file_id);
    out->set_index(chunk.index);
    out->set_size(chunk.size);
    out->set_checksum(chunk.checksum);
    if (chunk.hasData()) {
        out->set_data(chunk.data->data(), chunk.data->size());
    } else {
        out->clear_data();
    }
}

Chunk fromProto(const ChunkData& message) {
    Chunk chunk;
    chunk.id = message.id();
    chunk.file_id = message.file_id();
    chunk.index = message.index();
    chunk.size = message.size();
    chunk.checksum = message.checksum();
    if (message.has_data()) {
        chunk.data = std::vector<char>(message.data().begin(), message.data().end());
    }
    return chunk;
}

void toProto(const FileMetadata& metadata, FileInfo* out) {
    out->set_id(metadata.id);
    out->set_original_name(metadata.original_name);
    out->set_size(metadata.size);
    out->set_checksum(metadata.checksum);
    out->set_content_type(metadata.content_type);
    out->set_chunk_count(metadata.chunk_count);
    out->clear_chunks();
    for (const auto& chunk : metadata.chunks) {
        ChunkData* descriptor = out->add_chunks();
        descriptor->set_id(chunk.id);
        descriptor->set_file_id(chunk.file_id);
        descriptor->set_index(chunk.index);
        descriptor->set_size(chunk.size);
        descriptor->set_checksum(chunk.checksum);
    }
}

FileMetadata fromProto(const FileInfo& message) {
    FileMetadata metadata;
    metadata.id = message.id();
    metadata.original_name = message.original_name();
    metadata.size = message.size();
    metadata.checksum = message.checksum();
    metadata.content_type = message.content_type();
    metadata.chunk_count = message.chunk_count();
    metadata.chunks.reserve(message.chunks_size());
    for (const auto& descriptor : message.chunks()) {
        metadata.chunks.push_back(fromProto(descriptor));
    }
    return metadata;
}

grpc::ChannelArguments unlimitedChannelArguments() {
    grpc::ChannelArguments args;
    args.SetMaxReceiveMessageSize(-1);
    args.SetMaxSendMessageSize(-1);
    return args;
}

void liftMessageLimits(grpc::ServerBuilder& builder) {
    builder.SetMaxReceiveMessageSize(std::numeric_limits<int>::max());
    builder.SetMaxSendMessageSize(std::numeric_limits<int>::max());
}

grpc::Status toGrpcStatus(const DfsError& error) {
    switch (error.kind()) {
        case ErrorKind::InvalidArgument:
        case ErrorKind::ChunkCorrupt:
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, error.what());
        case ErrorKind::NotFound:
            return grpc::Status(grpc::StatusCode::NOT_FOUND, error.what());
        case ErrorKind::Unreachable:
            return grpc::Status(grpc::StatusCode::UNAVAILABLE, error.what());
        case ErrorKind::MetadataInconsistent:
        case ErrorKind::MissingChunk:
        case ErrorKind::RemoteError:
            return grpc::Status(grpc::StatusCode::INTERNAL, error.what());
    }
    return grpc::Status(grpc::StatusCode::INTERNAL, error.what());
}

DfsError fromGrpcStatus(const grpc::Status& status, const std::string& context) {
    switch (status.error_code()) {
        case grpc::StatusCode::NOT_FOUND:
            return DfsError(ErrorKind::NotFound, context + ": " + status.error_message());
        case grpc::StatusCode::UNAVAILABLE:
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            return DfsError(ErrorKind::Unreachable, context + ": " + status.error_message());
        default:
            return DfsError::remote(static_cast<int>(status.error_code()), status.error_message(), context);
    }
}
