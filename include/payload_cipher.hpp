#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Fernet token layout (before url-safe base64):
// [0]        version    0x80
// [1-8]      timestamp  (u64 big endian, seconds)
// [9-24]     IV         (16 byte)
// [25..n-32] AES-128-CBC ciphertext, PKCS7
// [n-32..n]  HMAC-SHA256 over everything before it
class PayloadCipher {
public:
    // key = SHA256(passphrase); first half signs, second half encrypts
    explicit PayloadCipher(const std::string& passphrase);

    std::string encrypt(const std::string& plaintext) const;
    std::string encrypt_at(const std::string& plaintext, uint64_t timestamp) const;

    // Throws CodecError(Decryption) on any format or tag failure.
    std::string decrypt(const std::string& token) const;

private:
    std::vector<uint8_t> signing_key_;
    std::vector<uint8_t> encryption_key_;

    std::vector<uint8_t> sign(const uint8_t* data, size_t len) const;
};

// No or empty passphrase: text passes through unchanged.
std::string maybe_encrypt(const std::string& text, const std::optional<std::string>& passphrase);
std::string maybe_decrypt(const std::string& token, const std::optional<std::string>& passphrase);
