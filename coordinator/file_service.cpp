#include "file_service.hpp"
#include "chunking.hpp"
#include "errors.hpp"
#include "wire.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iostream>

using grpc::ServerContext;
using grpc::Status;

namespace fs = std::filesystem;

std::string guessContentType(const std::string& filename) {
    std::string ext = fs::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });

    if (ext == ".txt") return "text/plain";
    if (ext == ".json") return "application/json";
    if (ext == ".html" || ext == ".htm") return "text/html";
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".pdf") return "application/pdf";
    if (ext == ".zip") return "application/zip";
    return "application/octet-stream";
}

FileServiceImpl::FileServiceImpl(Coordinator* coordinator) : coordinator(coordinator) {}

Status FileServiceImpl::UploadFile(ServerContext* context, grpc::ServerReader<::UploadRequest>* reader,
                                   ::FileInfo* response) {
    UploadRequest message;
    if (!reader->Read(&message) || !message.has_header()) {
        return Status(grpc::StatusCode::INVALID_ARGUMENT, "Upload must start with a header message");
    }

    std::string filename = chunking::safeFileName(message.header().filename());
    std::string content_type = message.header().content_type();

    if (filename.empty()) {
        filename = "uploaded_file_" + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    }
    if (content_type.empty()) {
        content_type = guessContentType(filename);
    }

    std::vector<char> data;
    while (reader->Read(&message)) {
        if (message.has_header()) {
            return Status(grpc::StatusCode::INVALID_ARGUMENT, "Upload carries more than one header");
        }
        const std::string& piece = message.data();
        if (static_cast<int64_t>(data.size() + piece.size()) > coordinator->maxFileSize()) {
            return Status(grpc::StatusCode::INVALID_ARGUMENT,
                          "File exceeds the maximum size of " +
                          std::to_string(coordinator->maxFileSize()) + " bytes");
        }
        data.insert(data.end(), piece.begin(), piece.end());
    }

    try {
        FileMetadata metadata = coordinator->upload(data, filename, content_type);
        toProto(metadata, response);
    } catch (const DfsError& e) {
        std::cerr << "[ERROR] Upload of " << filename << " failed: " << e.what() << "\n";
        return toGrpcStatus(e);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Upload of " << filename << " failed: " << e.what() << "\n";
        return Status(grpc::StatusCode::INTERNAL, e.what());
    }

    return Status::OK;
}

Status FileServiceImpl::DownloadFile(ServerContext* context, const ::FileRequest* request,
                                     grpc::ServerWriter<::DownloadResponse>* writer) {
    FileMetadata metadata;
    std::vector<char> data;

    try {
        metadata = coordinator->fileInfo(request->file_id());
        data = coordinator->download(request->file_id());
    } catch (const DfsError& e) {
        std::cerr << "[ERROR] Download of " << request->file_id() << " failed: " << e.what() << "\n";
        return toGrpcStatus(e);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Download of " << request->file_id() << " failed: " << e.what() << "\n";
        return Status(grpc::StatusCode::INTERNAL, e.what());
    }

    // Header first: name, type and length of what follows
    DownloadResponse header;
    toProto(metadata, header.mutable_info());
    if (!writer->Write(header)) {
        return Status(grpc::StatusCode::CANCELLED, "Client closed the download stream");
    }

    for (size_t offset = 0; offset < data.size(); offset += STREAM_PIECE_SIZE) {
        size_t length = std::min(STREAM_PIECE_SIZE, data.size() - offset);
        DownloadResponse piece;
        piece.set_data(data.data() + offset, length);
        if (!writer->Write(piece)) {
            return Status(grpc::StatusCode::CANCELLED, "Client closed the download stream");
        }
    }

    return Status::OK;
}

Status FileServiceImpl::GetFileInfo(ServerContext* context, const ::FileRequest* request,
                                    ::FileInfo* response) {
    try {
        toProto(coordinator->fileInfo(request->file_id()), response);
    } catch (const DfsError& e) {
        return toGrpcStatus(e);
    }
    return Status::OK;
}

Status FileServiceImpl::DeleteFile(ServerContext* context, const ::FileRequest* request,
                                   ::Ack* response) {
    try {
        coordinator->remove(request->file_id());
    } catch (const DfsError& e) {
        return toGrpcStatus(e);
    }

    response->set_ok(true);
    response->set_message("File deleted");
    return Status::OK;
}

Status FileServiceImpl::ListFiles(ServerContext* context, const ::ListFilesRequest* request,
                                  ::FileList* response) {
    for (const auto& file_id : coordinator->list()) {
        response->add_file_ids(file_id);
    }
    return Status::OK;
}

Status FileServiceImpl::Health(ServerContext* context, const ::HealthRequest* request,
                               ::HealthResponse* response) {
    HealthSummary summary = coordinator->healthSummary();
    response->set_status(summary.status);
    response->set_healthy_servers(summary.healthy_node_count);
    response->set_total_servers(summary.total_node_count);
    response->set_timestamp(summary.timestamp);
    return Status::OK;
}
