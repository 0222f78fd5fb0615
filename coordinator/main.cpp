#include <string>
#include <iostream>
#include <memory>
#include <vector>
#include <grpcpp/server_builder.h>
#include <grpcpp/server.h>
#include "config.hpp"
#include "coordinator.hpp"
#include "errors.hpp"
#include "file_service.hpp"
#include "node_client.hpp"
#include "wire.hpp"

using ::grpc::Server;
using ::grpc::ServerBuilder;

bool RunServer(const Config& config) {
    std::vector<std::shared_ptr<NodeClient>> nodes;
    for (const auto& address : config.storage_servers) {
        nodes.push_back(std::make_shared<GrpcNodeClient>(address, config.nodeTimeout()));
        std::cout << "[INFO] Storage node " << nodes.size() - 1 << ": " << address << "\n";
    }

    CoordinatorOptions options;
    options.chunk_count = config.chunk_count;
    options.max_file_size = config.max_file_size;

    Coordinator coordinator(std::move(nodes), options);
    FileServiceImpl service(&coordinator);

    ServerBuilder server_builder;
    server_builder.AddListeningPort(config.apiAddress(), grpc::InsecureServerCredentials());
    server_builder.RegisterService(&service);
    liftMessageLimits(server_builder);

    std::unique_ptr<Server> server{server_builder.BuildAndStart()};
    if (!server) {
        std::cerr << "[ERROR] Failed to start coordinator on " << config.apiAddress() << "\n";
        return false;
    }

    std::cout << "[INFO] Coordinator listening on " << config.apiAddress() << "\n";
    server->Wait();
    return true;
}

int main(int argc, char* argv[]) {
    Config config = Config::fromEnvironment();

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--host" && i + 1 < argc) {
                config.api_host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                config.api_port = argv[++i];
            } else if (arg == "--storage-servers" && i + 1 < argc) {
                config.storage_servers = splitAddressList(argv[++i]);
            } else if (arg == "--chunk-count" && i + 1 < argc) {
                config.chunk_count = std::stoi(argv[++i]);
            } else if (arg == "--max-file-size" && i + 1 < argc) {
                config.max_file_size = std::stoll(argv[++i]);
            } else if (arg == "--node-timeout-ms" && i + 1 < argc) {
                config.node_timeout_ms = std::stoll(argv[++i]);
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [options]\n"
                          << "Options:\n"
                          << "  --host <host>              Listen host (default: $API_HOST or 0.0.0.0)\n"
                          << "  --port <port>              Listen port (default: $API_PORT or 8080)\n"
                          << "  --storage-servers <list>   Comma separated node addresses, in placement order\n"
                          << "  --chunk-count <n>          Chunks per file (default: $CHUNK_COUNT or 6)\n"
                          << "  --max-file-size <bytes>    Upload limit (default: $MAX_FILE_SIZE or 10 GiB)\n"
                          << "  --node-timeout-ms <ms>     Per-call node deadline (default: 30000)\n"
                          << "  --help                     Show this help message\n";
                return 0;
            } else {
                std::cerr << "[ERROR] Unknown argument: " << arg << "\n";
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Invalid argument value: " << e.what() << "\n";
        return 1;
    }

    try {
        config.validate();
    } catch (const DfsError& e) {
        std::cerr << "[ERROR] Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    std::cout << "====================================\n";
    std::cout << "    ChunkDFS Coordinator Starting   \n";
    std::cout << "====================================\n";

    return RunServer(config) ? 0 : 1;
}
