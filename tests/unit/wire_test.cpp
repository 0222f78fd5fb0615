#include <gtest/gtest.h>
#include "wire.hpp"
#include "chunking.hpp"
#include "unit_test_utils.hpp"

using unit_test_utils::bytesOf;

TEST(WireTest, ChunkKeepsPayloadPresence) {
    FileMetadata metadata = chunking::splitData(bytesOf("payload"), 1, "file-1");
    Chunk chunk = metadata.chunks[0];

    ChunkData message;
    toProto(chunk, &message);
    EXPECT_TRUE(message.has_data());
    Chunk decoded = fromProto(message);
    ASSERT_TRUE(decoded.hasData());
    EXPECT_EQ(*decoded.data, *chunk.data);
    EXPECT_EQ(decoded.checksum, chunk.checksum);

    // An empty payload is still a payload
    Chunk empty = chunking::splitData({}, 1, "file-2").chunks[0];
    toProto(empty, &message);
    EXPECT_TRUE(message.has_data());
    EXPECT_TRUE(fromProto(message).hasData());

    chunk.data.reset();
    toProto(chunk, &message);
    EXPECT_FALSE(message.has_data());
    EXPECT_FALSE(fromProto(message).hasData());
}

TEST(WireTest, FileInfoCarriesDescriptorsOnly) {
    FileMetadata metadata = chunking::splitData(bytesOf("0123456789"), 3, "file-3");
    metadata.original_name = "digits.txt";
    metadata.content_type = "text/plain";

    FileInfo message;
    toProto(metadata, &message);
    ASSERT_EQ(message.chunks_size(), 3);
    for (const auto& descriptor : message.chunks()) {
        EXPECT_FALSE(descriptor.has_data());
    }

    FileMetadata decoded = fromProto(message);
    EXPECT_EQ(decoded.id, "file-3");
    EXPECT_EQ(decoded.original_name, "digits.txt");
    EXPECT_EQ(decoded.content_type, "text/plain");
    EXPECT_EQ(decoded.size, 10);
    EXPECT_EQ(decoded.checksum, metadata.checksum);
    EXPECT_EQ(decoded.chunk_count, 3);
    EXPECT_EQ(decoded.chunks[2].size, 4);
    EXPECT_NO_THROW(chunking::validateMetadata(decoded));
}

TEST(WireTest, ErrorKindsMapToStatusCodes) {
    EXPECT_EQ(toGrpcStatus(DfsError(ErrorKind::InvalidArgument, "x")).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(toGrpcStatus(DfsError(ErrorKind::ChunkCorrupt, "x")).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(toGrpcStatus(DfsError(ErrorKind::NotFound, "x")).error_code(),
              grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(toGrpcStatus(DfsError(ErrorKind::Unreachable, "x")).error_code(),
              grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(toGrpcStatus(DfsError(ErrorKind::MetadataInconsistent, "x")).error_code(),
              grpc::StatusCode::INTERNAL);
    EXPECT_EQ(toGrpcStatus(DfsError::missingChunk(3)).error_code(), grpc::StatusCode::INTERNAL);
    EXPECT_EQ(toGrpcStatus(DfsError::remote(13, "boom", "node")).error_code(),
              grpc::StatusCode::INTERNAL);

    EXPECT_EQ(toGrpcStatus(DfsError(ErrorKind::NotFound, "file not found: abc")).error_message(),
              "file not found: abc");
}

TEST(WireTest, StatusCodesMapToErrorKinds) {
    DfsError not_found = fromGrpcStatus(grpc::Status(grpc::StatusCode::NOT_FOUND, "gone"), "node");
    EXPECT_EQ(not_found.kind(), ErrorKind::NotFound);

    DfsError unavailable = fromGrpcStatus(grpc::Status(grpc::StatusCode::UNAVAILABLE, "down"), "node");
    EXPECT_EQ(unavailable.kind(), ErrorKind::Unreachable);

    DfsError deadline = fromGrpcStatus(grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED, "slow"), "node");
    EXPECT_EQ(deadline.kind(), ErrorKind::Unreachable);

    DfsError remote = fromGrpcStatus(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "corrupt"), "node");
    EXPECT_EQ(remote.kind(), ErrorKind::RemoteError);
    EXPECT_EQ(remote.remoteStatus(), static_cast<int>(grpc::StatusCode::INVALID_ARGUMENT));
    EXPECT_EQ(remote.remoteBody(), "corrupt");
}

TEST(WireTest, ErrorKindNames) {
    EXPECT_STREQ(errorKindName(ErrorKind::MissingChunk), "MissingChunk");
    EXPECT_STREQ(errorKindName(ErrorKind::Unreachable), "Unreachable");
    EXPECT_EQ(DfsError::missingChunk(5).missingIndex(), 5);
    EXPECT_STREQ(DfsError::missingChunk(5).what(), "missing chunk with index 5");
}
