#include "chunkdfs_client.hpp"
#include "chunking.hpp"
#include <fstream>
#include <iostream>
#include <filesystem>
#include <cstdio>

constexpr size_t PIECE_SIZE = 1024 * 1024; // 1 MB upload pieces

ChunkDfsClient::ChunkDfsClient(std::shared_ptr<grpc::ChannelInterface> aChannel) : theStub{aChannel} {}

std::optional<FileInfo> ChunkDfsClient::UploadFile(const std::string& filePath, const std::string& contentType) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[ERROR] Cannot open file: " << filePath << "\n";
        return std::nullopt;
    }

    FileInfo info;
    grpc::ClientContext context;
    std::unique_ptr<grpc::ClientWriter<UploadRequest>> writer(theStub.UploadFile(&context, &info));

    // Header: just the file name, not the full path
    UploadRequest header;
    header.mutable_header()->set_filename(std::filesystem::path(filePath).filename().string());
    header.mutable_header()->set_content_type(contentType);
    bool streamOpen = writer->Write(header);

    std::vector<char> buffer(PIECE_SIZE);
    while (streamOpen && file) {
        file.read(buffer.data(), PIECE_SIZE);
        std::streamsize bytesRead = file.gcount();
        if (bytesRead <= 0) {
            break;
        }
        UploadRequest piece;
        piece.set_data(buffer.data(), static_cast<size_t>(bytesRead));
        streamOpen = writer->Write(piece);
    }
    file.close();

    writer->WritesDone();
    grpc::Status status = writer->Finish();

    if (!status.ok()) {
        std::cerr << "[ERROR] Upload failed: " << status.error_message() << "\n";
        return std::nullopt;
    }

    std::cout << "[SUCCESS] Uploaded " << info.original_name << " as " << info.id
              << " (" << info.size << " bytes, " << info.chunk_count << " chunks)\n";
    return info;
}

bool ChunkDfsClient::DownloadFile(const std::string& fileId, const std::string& outputPath) {
    FileRequest request;
    request.set_file_id(fileId);

    grpc::ClientContext context;
    std::unique_ptr<grpc::ClientReader<DownloadResponse>> reader(theStub.DownloadFile(&context, request));

    DownloadResponse message;
    if (!reader->Read(&message) || !message.has_info()) {
        grpc::Status status = reader->Finish();
        std::cerr << "[ERROR] Download of " << fileId << " failed: "
                  << (status.ok() ? "missing file header" : status.error_message()) << "\n";
        return false;
    }

    const FileInfo info = message.info();
    std::string target = outputPath.empty() ? chunking::safeFileName(info.original_name()) : outputPath;
    if (target.empty()) {
        target = fileId;
    }

    std::ofstream outFile(target, std::ios::binary | std::ios::trunc);
    if (!outFile.is_open()) {
        std::cerr << "[ERROR] Cannot create output file: " << target << "\n";
        context.TryCancel();
        grpc::Status ignored = reader->Finish();
        (void)ignored;
        return false;
    }

    int64_t received = 0;
    while (reader->Read(&message)) {
        outFile.write(message.data().data(), message.data().size());
        received += static_cast<int64_t>(message.data().size());
    }
    outFile.close();

    grpc::Status status = reader->Finish();
    if (!status.ok() || received != info.size() || !outFile) {
        std::cerr << "[ERROR] Download of " << fileId << " failed: "
                  << (status.ok() ? "received " + std::to_string(received) + " of " +
                                    std::to_string(info.size()) + " bytes"
                                  : status.error_message())
                  << "\n";
        std::remove(target.c_str());  // Remove incomplete file
        return false;
    }

    std::cout << "[SUCCESS] Downloaded " << fileId << " to " << target
              << " (" << received << " bytes, " << info.content_type() << ")\n";
    return true;
}

std::optional<FileInfo> ChunkDfsClient::GetFileInfo(const std::string& fileId) {
    FileRequest request;
    request.set_file_id(fileId);

    FileInfo info;
    grpc::ClientContext context;
    grpc::Status status = theStub.GetFileInfo(&context, request, &info);

    if (!status.ok()) {
        std::cerr << "[ERROR] Info for " << fileId << " failed: " << status.error_message() << "\n";
        return std::nullopt;
    }
    return info;
}

std::optional<std::vector<std::string>> ChunkDfsClient::ListFiles() {
    FileList response;
    grpc::ClientContext context;
    grpc::Status status = theStub.ListFiles(&context, ListFilesRequest(), &response);

    if (!status.ok()) {
        std::cerr << "[ERROR] List failed: " << status.error_message() << "\n";
        return std::nullopt;
    }
    return std::vector<std::string>(response.file_ids().begin(), response.file_ids().end());
}

bool ChunkDfsClient::DeleteFile(const std::string& fileId) {
    FileRequest request;
    request.set_file_id(fileId);

    Ack ack;
    grpc::ClientContext context;
    grpc::Status status = theStub.DeleteFile(&context, request, &ack);

    if (!status.ok()) {
        std::cerr << "[ERROR] Delete of " << fileId << " failed: " << status.error_message() << "\n";
        return false;
    }

    std::cout << "[SUCCESS] " << ack.message() << ": " << fileId << "\n";
    return true;
}

std::optional<HealthResponse> ChunkDfsClient::Health() {
    HealthResponse response;
    grpc::ClientContext context;
    grpc::Status status = theStub.Health(&context, HealthRequest(), &response);

    if (!status.ok()) {
        std::cerr << "[ERROR] Health check failed: " << status.error_message() << "\n";
        return std::nullopt;
    }
    return response;
}
