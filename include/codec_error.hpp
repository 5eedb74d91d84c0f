#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <cstddef>

enum class ErrorKind {
    None,
    Validation,     // bad caller input
    Image,          // bytes are not a decodable raster
    Scan,           // no symbols, or none parse as a frame
    MissingChunks,
    Decryption,
    Integrity
};

const char* error_kind_name(ErrorKind kind);

class CodecError : public std::runtime_error {
public:
    CodecError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class MissingChunksError : public CodecError {
public:
    explicit MissingChunksError(std::vector<size_t> missing);

    // Ascending.
    const std::vector<size_t>& missing() const { return missing_; }

private:
    std::vector<size_t> missing_;
};

class IntegrityError : public CodecError {
public:
    explicit IntegrityError(std::string stored_hash);

    // Untrusted: whatever the envelope claimed.
    const std::string& stored_hash() const { return stored_hash_; }

private:
    std::string stored_hash_;
};
