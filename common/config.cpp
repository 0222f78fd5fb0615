#include "config.hpp"
#include "errors.hpp"

#include <cstdlib>
#include <limits>
#include <sstream>

namespace {

std::string getEnv(const char* key, const std::string& default_value) {
    const char* value = std::getenv(key);
    if (value != nullptr && *value != '\0') {
        return value;
    }
    return default_value;
}

int64_t getEnvInt64(const char* key, int64_t default_value) {
    const char* value = std::getenv(key);
    if (value == nullptr || *value == '\0') {
        return default_value;
    }
    try {
        size_t consumed = 0;
        int64_t parsed = std::stoll(value, &consumed);
        if (consumed != std::string(value).size()) {
            return default_value;
        }
        return parsed;
    } catch (const std::exception&) {
        return default_value;
    }
}

std::string trim(const std::string& str) {
    const std::string whitespace = " \t\n\r";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

} // namespace

std::vector<std::string> splitAddressList(const std::string& value) {
    std::vector<std::string> result;
    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

Config Config::fromEnvironment() {
    Config config;
    config.api_host = getEnv("API_HOST", config.api_host);
    config.api_port = getEnv("API_PORT", config.api_port);
    config.storage_port = getEnv("STORAGE_PORT", config.storage_port);
    config.server_id = getEnv("SERVER_ID", config.server_id);
    config.max_file_size = getEnvInt64("MAX_FILE_SIZE", config.max_file_size);
    const int64_t chunk_count = getEnvInt64("CHUNK_COUNT", config.chunk_count);
    if (chunk_count >= std::numeric_limits<int>::min() && chunk_count <= std::numeric_limits<int>::max()) {
        config.chunk_count = static_cast<int>(chunk_count);
    }
    config.node_timeout_ms = getEnvInt64("NODE_TIMEOUT_MS", config.node_timeout_ms);
    config.upload_dir = getEnv("UPLOAD_DIR", config.upload_dir);
    config.storage_dir = getEnv("STORAGE_DIR", config.storage_dir);

    std::string servers = getEnv("STORAGE_SERVERS", "");
    if (!servers.empty()) {
        config.storage_servers = splitAddressList(servers);
    }

    return config;
}

void Config::validate() const {
    if (chunk_count <= 0) {
        throw DfsError(ErrorKind::InvalidArgument,
                       "CHUNK_COUNT must be positive, got " + std::to_string(chunk_count));
    }
    if (storage_servers.empty()) {
        throw DfsError(ErrorKind::InvalidArgument, "STORAGE_SERVERS must list at least one node");
    }
    if (max_file_size <= 0) {
        throw DfsError(ErrorKind::InvalidArgument, "MAX_FILE_SIZE must be positive");
    }
    if (node_timeout_ms <= 0) {
        throw DfsError(ErrorKind::InvalidArgument, "NODE_TIMEOUT_MS must be positive");
    }
}

std::string Config::apiAddress() const {
    return api_host + ":" + api_port;
}

std::string Config::localApiAddress() const {
    return "localhost:" + api_port;
}

std::string Config::storageListenAddress() const {
    return "0.0.0.0:" + storage_port;
}

std::string Config::storageAddress(int index) const {
    if (index < 0 || index >= storageCount()) {
        return "";
    }
    return storage_servers[index];
}

int Config::storageCount() const {
    return static_cast<int>(storage_servers.size());
}

std::chrono::milliseconds Config::nodeTimeout() const {
    return std::chrono::milliseconds(node_timeout_ms);
}
