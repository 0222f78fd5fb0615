#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// One contiguous slice of a file. A chunk without `data` is a descriptor:
// it still names the slice (id, index, size, checksum) but carries no bytes.
struct Chunk {
    std::string id;
    std::string file_id;
    int32_t index = 0;
    int64_t size = 0;
    std::string checksum;                   // hex SHA-256 of data
    std::optional<std::vector<char>> data;

    bool hasData() const { return data.has_value(); }
};

struct FileMetadata {
    std::string id;
    std::string original_name;
    int64_t size = 0;
    std::string checksum;                   // hex SHA-256 of the whole file
    std::string content_type;
    int32_t chunk_count = 0;
    std::vector<Chunk> chunks;              // ordered by index
};
