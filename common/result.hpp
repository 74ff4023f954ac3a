// Result.hpp
#pragma once
#include <string>
#include <utility>

// classified failure, every non-success Result carries one
enum class ErrorKind {
    None,
    SourceNotFound,
    SourceOpenFailed,
    SourceReadError,
    SinkWriteError,
    InvalidSignature,
    SignatureGenerationFailed,
    SignatureLoadFailed,
    DeltaGenerationFailed,
    PatchApplicationFailed,
    HashTableBuildFailed,
    InsufficientBuffer,
    JobCreationFailed,
    InvalidState,
    ConnectionFailed,
    ConnectionClosed
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::SourceNotFound: return "source not found";
        case ErrorKind::SourceOpenFailed: return "source open failed";
        case ErrorKind::SourceReadError: return "source read error";
        case ErrorKind::SinkWriteError: return "sink write error";
        case ErrorKind::InvalidSignature: return "invalid signature";
        case ErrorKind::SignatureGenerationFailed: return "signature generation failed";
        case ErrorKind::SignatureLoadFailed: return "signature load failed";
        case ErrorKind::DeltaGenerationFailed: return "delta generation failed";
        case ErrorKind::PatchApplicationFailed: return "patch application failed";
        case ErrorKind::HashTableBuildFailed: return "hash table build failed";
        case ErrorKind::InsufficientBuffer: return "insufficient buffer";
        case ErrorKind::JobCreationFailed: return "job creation failed";
        case ErrorKind::InvalidState: return "invalid state";
        case ErrorKind::ConnectionFailed: return "connection failed";
        case ErrorKind::ConnectionClosed: return "connection closed";
    }
    return "unknown";
}

template<typename T>
struct Result {
    bool success;
    std::string message;
    T data;
    ErrorKind kind = ErrorKind::None;
    int engineCode = 0;  // engine result code for transform failures

    static Result<T> Ok(T data) {
        return {true, "", std::move(data)};
    }

    static Result<T> Error(ErrorKind kind, const std::string& msg, int code = 0) {
        return {false, msg, T{}, kind, code};
    }

    // forward the failure of another result
    template<typename U>
    static Result<T> Error(const Result<U>& other) {
        return {false, other.message, T{}, other.kind, other.engineCode};
    }
};

// Specialization for void
template<>
struct Result<void> {
    bool success;
    std::string message;
    ErrorKind kind = ErrorKind::None;
    int engineCode = 0;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Error(ErrorKind kind, const std::string& msg, int code = 0) {
        return {false, msg, kind, code};
    }

    template<typename U>
    static Result<void> Error(const Result<U>& other) {
        return {false, other.message, other.kind, other.engineCode};
    }
};
