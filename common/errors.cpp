#include "errors.hpp"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::ChunkCorrupt: return "ChunkCorrupt";
        case ErrorKind::MetadataInconsistent: return "MetadataInconsistent";
        case ErrorKind::MissingChunk: return "MissingChunk";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::RemoteError: return "RemoteError";
        case ErrorKind::Unreachable: return "Unreachable";
    }
    return "Unknown";
}

DfsError::DfsError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

DfsError DfsError::remote(int status, const std::string& body, const std::string& context) {
    DfsError error(ErrorKind::RemoteError,
                   context + ": node returned status " + std::to_string(status) + ": " + body);
    error.remote_status_ = status;
    error.remote_body_ = body;
    return error;
}

DfsError DfsError::missingChunk(int index) {
    DfsError error(ErrorKind::MissingChunk, "missing chunk with index " + std::to_string(index));
    error.missing_index_ = index;
    return error;
}
