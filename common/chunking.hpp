#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "chunk.hpp"

namespace chunking {

// Lowercase hex SHA-256 of the given bytes.
std::string sha256Hex(const char* data, size_t size);
std::string sha256Hex(const std::vector<char>& data);

// Deterministic chunk id so any party can recompute it.
std::string makeChunkId(const std::string& file_id, int32_t index);

// Random UUID (version 4) used as file id.
std::string generateFileId();

// Last path component of `name`, or empty when there is none usable
// ("", "." or ".."). Keeps stored and written names inside one directory.
std::string safeFileName(const std::string& name);

// Splits `data` into exactly `chunk_count` chunks. Every chunk but the last
// gets floor(size / chunk_count) bytes, the last one also takes the
// remainder. Chunks may be empty when chunk_count exceeds the data size.
// Throws DfsError(InvalidArgument) if chunk_count <= 0.
FileMetadata splitData(const std::vector<char>& data, int chunk_count, const std::string& file_id);

// Same as splitData, reading the bytes from a file on disk.
FileMetadata splitFile(const std::string& path, int chunk_count, const std::string& file_id);

// Throws DfsError(ChunkCorrupt) if the payload is absent, its length differs
// from `size`, or its digest differs from `checksum`.
void validateChunk(const Chunk& chunk);

// Checks chunk count, index order, file ids and the size sum. Does not
// re-hash the file; callers verify the file checksum after reconstruction.
// Throws DfsError(MetadataInconsistent).
void validateMetadata(const FileMetadata& metadata);

// Sorts the chunks by index, requires indices 0..n-1 without gaps and
// writes the payloads in order to `out`.
// Throws DfsError(MissingChunk) naming the first absent index.
void reconstruct(std::vector<Chunk> chunks, std::ostream& out);
std::vector<char> reconstruct(std::vector<Chunk> chunks);

// Reconstructs into a file. A partially written file is removed on failure.
void reconstructFile(std::vector<Chunk> chunks, const std::string& output_path);

} // namespace chunking
