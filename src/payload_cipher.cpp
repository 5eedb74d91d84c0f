#include "payload_cipher.hpp"
#include "base64.hpp"
#include "codec_error.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <ctime>
#include <memory>
#include <stdexcept>

constexpr uint8_t FERNET_VERSION = 0x80;
constexpr size_t TIMESTAMP_LEN = 8;
constexpr size_t IV_LEN = 16;
constexpr size_t HMAC_LEN = 32;
constexpr size_t BLOCK_LEN = 16;
constexpr size_t HEADER_LEN = 1 + TIMESTAMP_LEN + IV_LEN;

static const char* DECRYPT_FAILED = "Decryption failed. Wrong passphrase or corrupted data.";

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

static CipherCtx new_cipher_ctx() {
    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    return ctx;
}

PayloadCipher::PayloadCipher(const std::string& passphrase) {
    unsigned char key[EVP_MAX_MD_SIZE];
    unsigned int key_len = 0;
    if (EVP_Digest(passphrase.data(), passphrase.size(), key, &key_len, EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("EVP_Digest(sha256) failed");

    signing_key_.assign(key, key + 16);
    encryption_key_.assign(key + 16, key + 32);
    OPENSSL_cleanse(key, sizeof(key));
}

std::vector<uint8_t> PayloadCipher::sign(const uint8_t* data, size_t len) const {
    std::vector<uint8_t> mac(EVP_MAX_MD_SIZE);
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha256(), signing_key_.data(), static_cast<int>(signing_key_.size()),
              data, len, mac.data(), &mac_len))
        throw std::runtime_error("HMAC(sha256) failed");
    mac.resize(mac_len);
    return mac;
}

std::string PayloadCipher::encrypt(const std::string& plaintext) const {
    return encrypt_at(plaintext, static_cast<uint64_t>(std::time(nullptr)));
}

std::string PayloadCipher::encrypt_at(const std::string& plaintext, uint64_t timestamp) const {
    std::vector<uint8_t> token;
    token.reserve(HEADER_LEN + plaintext.size() + BLOCK_LEN + HMAC_LEN);

    token.push_back(FERNET_VERSION);
    for (int i = 7; i >= 0; --i) {
        token.push_back(static_cast<uint8_t>((timestamp >> (i * 8)) & 0xFF));
    }

    uint8_t iv[IV_LEN];
    if (RAND_bytes(iv, static_cast<int>(IV_LEN)) != 1)
        throw std::runtime_error("RAND_bytes failed");
    token.insert(token.end(), iv, iv + IV_LEN);

    CipherCtx ctx = new_cipher_ctx();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, encryption_key_.data(), iv) != 1)
        throw std::runtime_error("EVP_EncryptInit_ex failed");

    std::vector<uint8_t> cipher(plaintext.size() + BLOCK_LEN);
    int len = 0, outl = 0;
    if (EVP_EncryptUpdate(ctx.get(), cipher.data(), &len,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1)
        throw std::runtime_error("EVP_EncryptUpdate failed");
    outl = len;
    if (EVP_EncryptFinal_ex(ctx.get(), cipher.data() + outl, &len) != 1)
        throw std::runtime_error("EVP_EncryptFinal_ex failed");
    outl += len;
    token.insert(token.end(), cipher.begin(), cipher.begin() + outl);

    std::vector<uint8_t> mac = sign(token.data(), token.size());
    token.insert(token.end(), mac.begin(), mac.end());

    return base64_encode(token, true);
}

std::string PayloadCipher::decrypt(const std::string& token) const {
    auto raw = base64_decode(token, true);
    if (!raw) throw CodecError(ErrorKind::Decryption, DECRYPT_FAILED);

    const std::vector<uint8_t>& data = *raw;
    if (data.size() < HEADER_LEN + BLOCK_LEN + HMAC_LEN || data[0] != FERNET_VERSION)
        throw CodecError(ErrorKind::Decryption, DECRYPT_FAILED);

    size_t signed_len = data.size() - HMAC_LEN;
    size_t cipher_len = signed_len - HEADER_LEN;
    if (cipher_len % BLOCK_LEN != 0)
        throw CodecError(ErrorKind::Decryption, DECRYPT_FAILED);

    std::vector<uint8_t> expected = sign(data.data(), signed_len);
    if (expected.size() != HMAC_LEN ||
        CRYPTO_memcmp(expected.data(), data.data() + signed_len, HMAC_LEN) != 0)
        throw CodecError(ErrorKind::Decryption, DECRYPT_FAILED);

    const uint8_t* iv = data.data() + 1 + TIMESTAMP_LEN;
    CipherCtx ctx = new_cipher_ctx();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, encryption_key_.data(), iv) != 1)
        throw std::runtime_error("EVP_DecryptInit_ex failed");

    std::string plain(cipher_len + BLOCK_LEN, '\0');
    int len = 0, outl = 0;
    if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(&plain[0]), &len,
                          data.data() + HEADER_LEN, static_cast<int>(cipher_len)) != 1)
        throw CodecError(ErrorKind::Decryption, DECRYPT_FAILED);
    outl = len;
    if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(&plain[0]) + outl, &len) != 1)
        throw CodecError(ErrorKind::Decryption, DECRYPT_FAILED);
    outl += len;

    plain.resize(static_cast<size_t>(outl));
    return plain;
}

std::string maybe_encrypt(const std::string& text, const std::optional<std::string>& passphrase) {
    if (!passphrase || passphrase->empty()) return text;
    return PayloadCipher(*passphrase).encrypt(text);
}

std::string maybe_decrypt(const std::string& token, const std::optional<std::string>& passphrase) {
    if (!passphrase || passphrase->empty()) return token;
    return PayloadCipher(*passphrase).decrypt(token);
}
