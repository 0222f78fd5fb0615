#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <grpcpp/grpcpp.h>
#include "chunkdfs.grpc.pb.h"

class ChunkDfsClient {
private:
    FileService::Stub theStub;
public:
    ChunkDfsClient(std::shared_ptr<grpc::ChannelInterface> aChannel);

    // Streams a local file to the coordinator. Returns the registered file
    // info, or nullopt after logging the failure.
    std::optional<FileInfo> UploadFile(const std::string& filePath, const std::string& contentType = "");

    // Writes the file to outputPath (the original name if empty). A partial
    // output file is removed on failure.
    bool DownloadFile(const std::string& fileId, const std::string& outputPath = "");

    std::optional<FileInfo> GetFileInfo(const std::string& fileId);

    std::optional<std::vector<std::string>> ListFiles();

    bool DeleteFile(const std::string& fileId);

    std::optional<HealthResponse> Health();
};
