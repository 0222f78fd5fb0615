#include <string>
#include <sstream>
#include <iostream>
#include <vector>
#include "chunkdfs_client.hpp"
#include "config.hpp"
#include "wire.hpp"
#include <grpcpp/grpcpp.h>

std::vector<std::string> ParseCommand(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string s;
    while (iss >> s) {
        tokens.push_back(s);
    }
    return tokens;
}

void PrintFileInfo(const FileInfo& info) {
    std::cout << "File ID:      " << info.id() << "\n";
    std::cout << "Name:         " << info.original_name() << "\n";
    std::cout << "Size:         " << info.size() << " bytes\n";
    std::cout << "Content type: " << info.content_type() << "\n";
    std::cout << "Checksum:     " << info.checksum() << "\n";
    std::cout << "Chunks:       " << info.chunk_count() << "\n";
    for (const auto& chunk : info.chunks()) {
        std::cout << "  [" << chunk.index() << "] " << chunk.id()
                  << " (" << chunk.size() << " bytes)\n";
    }
}

void RunClient(const std::string& address) {
    std::shared_ptr<grpc::ChannelInterface> channel{
        grpc::CreateCustomChannel(address, grpc::InsecureChannelCredentials(), unlimitedChannelArguments())
    };

    ChunkDfsClient client{channel};

    std::cout << "ChunkDFS Client connected to " << address << "\n";
    std::cout << "Commands:\n";
    std::cout << "  upload <path> [content_type]\n";
    std::cout << "  download <file_id> [output_path]\n";
    std::cout << "  info <file_id>\n";
    std::cout << "  list\n";
    std::cout << "  delete <file_id>\n";
    std::cout << "  health\n";
    std::cout << "  exit\n";

    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) break;
        auto tokens = ParseCommand(line);
        if (tokens.empty()) continue;

        const std::string& cmd = tokens[0];

        if (cmd == "exit") {
            break;
        } else if (cmd == "upload" && (tokens.size() == 2 || tokens.size() == 3)) {
            client.UploadFile(tokens[1], tokens.size() == 3 ? tokens[2] : "");
        } else if (cmd == "download" && (tokens.size() == 2 || tokens.size() == 3)) {
            client.DownloadFile(tokens[1], tokens.size() == 3 ? tokens[2] : "");
        } else if (cmd == "info" && tokens.size() == 2) {
            auto info = client.GetFileInfo(tokens[1]);
            if (info) {
                PrintFileInfo(*info);
            }
        } else if (cmd == "list" && tokens.size() == 1) {
            auto files = client.ListFiles();
            if (files) {
                std::cout << files->size() << " file(s)\n";
                for (const auto& id : *files) {
                    std::cout << "  " << id << "\n";
                }
            }
        } else if (cmd == "delete" && tokens.size() == 2) {
            client.DeleteFile(tokens[1]);
        } else if (cmd == "health" && tokens.size() == 1) {
            auto health = client.Health();
            if (health) {
                std::cout << "Status: " << health->status() << " ("
                          << health->healthy_servers() << "/" << health->total_servers()
                          << " storage servers healthy)\n";
            }
        } else {
            std::cout << "[ERROR] Invalid command.\n";
        }
    }
}

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --server <host:port>   Coordinator address (default: localhost:<API_PORT>)\n"
              << "  --help                 Show this help message\n";
}

int main(int argc, char** argv) {
    Config config = Config::fromEnvironment();
    std::string address = config.localApiAddress();

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--server" && i + 1 < argc) {
            address = argv[++i];
        } else {
            std::cerr << "[ERROR] Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    RunClient(address);
    return 0;
}
