#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct Config {
    // Coordinator API
    std::string api_host = "0.0.0.0";
    std::string api_port = "8080";

    // Storage nodes. Order is the basis of chunk placement and must not
    // change while files are registered.
    std::vector<std::string> storage_servers = {
        "localhost:8081", "localhost:8082", "localhost:8083",
        "localhost:8084", "localhost:8085", "localhost:8086"
    };
    std::string storage_port = "8081";
    std::string server_id = "1";

    // Files
    int64_t max_file_size = 10LL * 1024 * 1024 * 1024;  // 10 GiB
    int chunk_count = 6;
    int64_t node_timeout_ms = 30000;

    // Reserved for a persistent backend, unused by the in-memory path
    std::string upload_dir = "./uploads";
    std::string storage_dir = "./storage";

    // Reads API_HOST, API_PORT, STORAGE_SERVERS, STORAGE_PORT, SERVER_ID,
    // MAX_FILE_SIZE, CHUNK_COUNT, NODE_TIMEOUT_MS, UPLOAD_DIR and STORAGE_DIR.
    // Unset or unparseable values keep their defaults.
    static Config fromEnvironment();

    // Throws DfsError(InvalidArgument) on an unusable configuration.
    void validate() const;

    std::string apiAddress() const;
    std::string localApiAddress() const;   // what a client on this host dials
    std::string storageListenAddress() const;
    std::string storageAddress(int index) const;   // empty if out of range
    int storageCount() const;
    std::chrono::milliseconds nodeTimeout() const;
};

// Splits a comma separated list, trimming blanks and dropping empty entries.
std::vector<std::string> splitAddressList(const std::string& value);
