#include "codec_error.hpp"
#include <sstream>
#include <utility>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "none";
        case ErrorKind::Validation:    return "validation";
        case ErrorKind::Image:         return "image";
        case ErrorKind::Scan:          return "scan";
        case ErrorKind::MissingChunks: return "missing_chunks";
        case ErrorKind::Decryption:    return "decryption";
        case ErrorKind::Integrity:     return "integrity";
    }
    return "unknown";
}

CodecError::CodecError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

static std::string missing_message(const std::vector<size_t>& missing) {
    std::ostringstream oss;
    oss << "Missing QR chunks: [";
    for (size_t i = 0; i < missing.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << missing[i];
    }
    oss << "]";
    return oss.str();
}

MissingChunksError::MissingChunksError(std::vector<size_t> missing)
    : CodecError(ErrorKind::MissingChunks, missing_message(missing)),
      missing_(std::move(missing)) {}

IntegrityError::IntegrityError(std::string stored_hash)
    : CodecError(ErrorKind::Integrity, "Integrity check failed (SHA-256 mismatch)"),
      stored_hash_(std::move(stored_hash)) {}
