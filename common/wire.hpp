#pragma once

#include <string>
#include <grpcpp/grpcpp.h>

#include "chunk.hpp"
#include "errors.hpp"
#include "chunkdfs.pb.h"

// Conversions between the domain types and their protobuf messages.
void toProto(const Chunk& chunk, ChunkData* out);
Chunk fromProto(const ChunkData& message);

// Chunks are written as descriptors (no payload).
void toProto(const FileMetadata& metadata, FileInfo* out);
FileMetadata fromProto(const FileInfo& message);

// Channel and server limits: one chunk may be far above gRPC's 4 MiB default.
grpc::ChannelArguments unlimitedChannelArguments();
void liftMessageLimits(grpc::ServerBuilder& builder);

// DfsError -> gRPC status for the service layers.
grpc::Status toGrpcStatus(const DfsError& error);

// Non-OK gRPC status -> typed error for the client side.
//   NOT_FOUND                       -> NotFound
//   UNAVAILABLE / DEADLINE_EXCEEDED -> Unreachable
//   anything else                   -> RemoteError{code, message}
DfsError fromGrpcStatus(const grpc::Status& status, const std::string& context);
