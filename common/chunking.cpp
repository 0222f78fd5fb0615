#include "chunking.hpp"
#include "errors.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace fs = std::filesystem;

namespace chunking {

namespace {

// Orders chunks by index and checks that every position 0..n-1 is present.
void sortAndCheckIndices(std::vector<Chunk>& chunks) {
    if (chunks.empty()) {
        throw DfsError::missingChunk(0);
    }

    std::stable_sort(chunks.begin(), chunks.end(),
                     [](const Chunk& a, const Chunk& b) { return a.index < b.index; });

    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].index != static_cast<int32_t>(i)) {
            throw DfsError::missingChunk(static_cast<int>(i));
        }
        if (!chunks[i].hasData()) {
            throw DfsError(ErrorKind::ChunkCorrupt,
                           "chunk " + std::to_string(i) + " has no payload");
        }
    }
}

} // namespace

std::string sha256Hex(const char* data, size_t size) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data), size, hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string sha256Hex(const std::vector<char>& data) {
    return sha256Hex(data.data(), data.size());
}

std::string makeChunkId(const std::string& file_id, int32_t index) {
    return file_id + "_chunk_" + std::to_string(index);
}

std::string generateFileId() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("Failed to generate random file id");
    }

    // RFC 4122 version 4, variant 1
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    std::stringstream ss;
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << '-';
        }
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

std::string safeFileName(const std::string& name) {
    std::string base = fs::path(name).filename().string();
    if (base == "." || base == "..") {
        return "";
    }
    return base;
}

FileMetadata splitData(const std::vector<char>& data, int chunk_count, const std::string& file_id) {
    if (chunk_count <= 0) {
        throw DfsError(ErrorKind::InvalidArgument,
                       "chunk count must be positive, got " + std::to_string(chunk_count));
    }

    const size_t total = data.size();
    const size_t base_size = total / static_cast<size_t>(chunk_count);
    const size_t remainder = total % static_cast<size_t>(chunk_count);

    FileMetadata metadata;
    metadata.id = file_id;
    metadata.size = static_cast<int64_t>(total);
    metadata.checksum = sha256Hex(data);
    metadata.chunk_count = chunk_count;
    metadata.chunks.reserve(chunk_count);

    size_t offset = 0;
    for (int i = 0; i < chunk_count; ++i) {
        size_t current_size = base_size;
        // Last chunk takes the remainder
        if (i == chunk_count - 1) {
            current_size += remainder;
        }

        Chunk chunk;
        chunk.id = makeChunkId(file_id, i);
        chunk.file_id = file_id;
        chunk.index = i;
        chunk.size = static_cast<int64_t>(current_size);
        chunk.data = std::vector<char>(data.begin() + offset, data.begin() + offset + current_size);
        chunk.checksum = sha256Hex(*chunk.data);

        metadata.chunks.push_back(std::move(chunk));
        offset += current_size;
    }

    return metadata;
}

FileMetadata splitFile(const std::string& path, int chunk_count, const std::string& file_id) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw DfsError(ErrorKind::InvalidArgument, "Cannot open file: " + path);
    }

    std::vector<char> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + path);
    }

    FileMetadata metadata = splitData(data, chunk_count, file_id);
    metadata.original_name = fs::path(path).filename().string();
    return metadata;
}

void validateChunk(const Chunk& chunk) {
    if (!chunk.hasData()) {
        throw DfsError(ErrorKind::ChunkCorrupt, "chunk " + chunk.id + ": payload is missing");
    }

    if (static_cast<int64_t>(chunk.data->size()) != chunk.size) {
        throw DfsError(ErrorKind::ChunkCorrupt,
                       "chunk " + chunk.id + ": payload is " + std::to_string(chunk.data->size()) +
                       " bytes, declared size is " + std::to_string(chunk.size));
    }

    if (sha256Hex(*chunk.data) != chunk.checksum) {
        throw DfsError(ErrorKind::ChunkCorrupt, "chunk " + chunk.id + ": checksum mismatch");
    }
}

void validateMetadata(const FileMetadata& metadata) {
    if (static_cast<int32_t>(metadata.chunks.size()) != metadata.chunk_count) {
        throw DfsError(ErrorKind::MetadataInconsistent,
                       "file " + metadata.id + ": has " + std::to_string(metadata.chunks.size()) +
                       " chunks, declared " + std::to_string(metadata.chunk_count));
    }

    int64_t total_size = 0;
    for (size_t i = 0; i < metadata.chunks.size(); ++i) {
        const Chunk& chunk = metadata.chunks[i];
        if (chunk.index != static_cast<int32_t>(i)) {
            throw DfsError(ErrorKind::MetadataInconsistent,
                           "file " + metadata.id + ": expected chunk index " + std::to_string(i) +
                           ", got " + std::to_string(chunk.index));
        }
        if (chunk.file_id != metadata.id) {
            throw DfsError(ErrorKind::MetadataInconsistent,
                           "file " + metadata.id + ": chunk " + std::to_string(i) +
                           " belongs to file " + chunk.file_id);
        }
        total_size += chunk.size;
    }

    if (total_size != metadata.size) {
        throw DfsError(ErrorKind::MetadataInconsistent,
                       "file " + metadata.id + ": chunk sizes add up to " + std::to_string(total_size) +
                       ", file size is " + std::to_string(metadata.size));
    }
}

void reconstruct(std::vector<Chunk> chunks, std::ostream& out) {
    sortAndCheckIndices(chunks);

    for (const auto& chunk : chunks) {
        out.write(chunk.data->data(), static_cast<std::streamsize>(chunk.data->size()));
        if (!out.good()) {
            throw std::runtime_error("Failed to write chunk " + std::to_string(chunk.index));
        }
    }
}

std::vector<char> reconstruct(std::vector<Chunk> chunks) {
    sortAndCheckIndices(chunks);

    size_t total_size = 0;
    for (const auto& chunk : chunks) {
        total_size += chunk.data->size();
    }

    std::vector<char> output;
    output.reserve(total_size);
    for (const auto& chunk : chunks) {
        output.insert(output.end(), chunk.data->begin(), chunk.data->end());
    }
    return output;
}

void reconstructFile(std::vector<Chunk> chunks, const std::string& output_path) {
    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot create output file: " + output_path);
    }

    try {
        reconstruct(std::move(chunks), out);
        out.close();
    } catch (...) {
        out.close();
        std::error_code ec;
        fs::remove(output_path, ec);
        throw;
    }
}

} // namespace chunking
