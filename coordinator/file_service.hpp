#pragma once

#include <cstddef>
#include <string>
#include <grpcpp/grpcpp.h>

#include "chunkdfs.grpc.pb.h"
#include "coordinator.hpp"

// Size of the data pieces streamed to and from clients
constexpr size_t STREAM_PIECE_SIZE = 1024 * 1024;  // 1 MB

// Guesses a MIME type from the file extension
std::string guessContentType(const std::string& filename);

// Client-facing RPC surface over the Coordinator.
class FileServiceImpl final : public FileService::Service {
private:
    Coordinator* coordinator;

public:
    explicit FileServiceImpl(Coordinator* coordinator);

    grpc::Status UploadFile(grpc::ServerContext* context, grpc::ServerReader<::UploadRequest>* reader,
                            ::FileInfo* response) override;
    grpc::Status DownloadFile(grpc::ServerContext* context, const ::FileRequest* request,
                              grpc::ServerWriter<::DownloadResponse>* writer) override;
    grpc::Status GetFileInfo(grpc::ServerContext* context, const ::FileRequest* request,
                             ::FileInfo* response) override;
    grpc::Status DeleteFile(grpc::ServerContext* context, const ::FileRequest* request,
                            ::Ack* response) override;
    grpc::Status ListFiles(grpc::ServerContext* context, const ::ListFilesRequest* request,
                           ::FileList* response) override;
    grpc::Status Health(grpc::ServerContext* context, const ::HealthRequest* request,
                        ::HealthResponse* response) override;
};
