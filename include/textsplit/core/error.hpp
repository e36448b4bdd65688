#pragma once

#include <string>
#include <utility>

namespace textsplit {

/**
 * @brief Failure categories shared by every textsplit operation
 */
enum class ErrorCode {
    NotFound,        ///< Source, archive or chunk family missing
    InvalidArgument, ///< Bad chunk size, chunk count ceiling exceeded, bad config value
    CorruptChunk,    ///< Chunk file content is not valid base64
    CorruptArchive,  ///< Malformed ZIP structure, CRC mismatch, unsafe entry name
    IOFailure        ///< Read/write/rename/delete failure
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::CorruptChunk: return "CorruptChunk";
        case ErrorCode::CorruptArchive: return "CorruptArchive";
        case ErrorCode::IOFailure: return "IOFailure";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code = ErrorCode::IOFailure;
    std::string message; ///< Names the operation and the offending path

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    std::string to_string() const {
        return std::string(error_code_name(code)) + ": " + message;
    }
};

inline Error make_error(ErrorCode code, std::string message) {
    return Error(code, std::move(message));
}

} // namespace textsplit
