#include <iostream>
#include <thread>
#include <chrono>
#include <atomic>
#include <csignal>
#include <grpcpp/grpcpp.h>
#include <grpcpp/server.h>
#include <grpcpp/server_builder.h>
#include "config.hpp"
#include "memory_storage.hpp"
#include "service.hpp"
#include "wire.hpp"

using grpc::Server;
using grpc::ServerBuilder;

// Global flag for graceful shutdown
std::atomic<bool> running{true};

bool runDataNode(const std::string& listen_addr, const std::string& server_id) {
    MemoryChunkStore store;
    DataNodeServiceImpl service(&store, server_id);

    ServerBuilder builder;
    builder.AddListeningPort(listen_addr, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    liftMessageLimits(builder);

    std::unique_ptr<Server> server(builder.BuildAndStart());

    if (!server) {
        std::cerr << "[ERROR] Failed to start DataNode server on " << listen_addr << "\n";
        return false;
    }

    std::cout << "[INFO] DataNode " << server_id << " listening on " << listen_addr << "\n";
    std::cout << "[INFO] Storage type: memory (contents are lost on exit)\n";

    // Handle shutdown signal
    signal(SIGINT, [](int) { running = false; });
    signal(SIGTERM, [](int) { running = false; });

    std::thread shutdown_watcher([&server]() {
        while (running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        std::cout << "\n[INFO] Shutdown signal received\n";
        server->Shutdown();
    });

    server->Wait();

    running = false;
    if (shutdown_watcher.joinable()) {
        shutdown_watcher.join();
    }

    StoreInfo info = store.info();
    std::cout << "[INFO] DataNode shutdown complete, dropped " << info.chunk_count
              << " chunks (" << info.total_size << " bytes)\n";
    return true;
}

int main(int argc, char* argv[]) {
    Config config = Config::fromEnvironment();
    std::string listen_addr = config.storageListenAddress();

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--listen-addr" && i + 1 < argc) {
            listen_addr = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            config.storage_port = argv[++i];
            listen_addr = config.storageListenAddress();
        } else if (arg == "--server-id" && i + 1 < argc) {
            config.server_id = argv[++i];
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  --listen-addr <addr>   Listen address (default: 0.0.0.0:$STORAGE_PORT)\n"
                      << "  --port <port>          Listen port (default: $STORAGE_PORT or 8081)\n"
                      << "  --server-id <id>       Server identity (default: $SERVER_ID or 1)\n"
                      << "  --help                 Show this help message\n";
            return 0;
        } else {
            std::cerr << "[ERROR] Unknown argument: " << arg << "\n";
            return 1;
        }
    }

    std::cout << "====================================\n";
    std::cout << "      ChunkDFS DataNode Starting    \n";
    std::cout << "====================================\n";

    return runDataNode(listen_addr, config.server_id) ? 0 : 1;
}
