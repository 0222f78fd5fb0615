#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    InvalidArgument,        // bad chunk count, oversize upload, bad config
    ChunkCorrupt,           // checksum/size mismatch or missing payload
    MetadataInconsistent,   // index/file id/size mismatch in file metadata
    MissingChunk,           // gap found during reconstruction
    NotFound,               // unknown chunk or file id
    RemoteError,            // node answered with a failure status
    Unreachable             // transport failure or timeout talking to a node
};

const char* errorKindName(ErrorKind kind);

class DfsError : public std::runtime_error {
private:
    ErrorKind kind_;
    int remote_status_ = 0;
    std::string remote_body_;
    int missing_index_ = -1;

public:
    DfsError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

    // Only meaningful for RemoteError
    int remoteStatus() const { return remote_status_; }
    const std::string& remoteBody() const { return remote_body_; }

    // Only meaningful for MissingChunk
    int missingIndex() const { return missing_index_; }

    static DfsError remote(int status, const std::string& body, const std::string& context);
    static DfsError missingChunk(int index);
};
