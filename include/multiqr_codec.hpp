#pragma once

#include "codec_config.hpp"
#include "codec_error.hpp"
#include "qr_symbol.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct DecodeResult {
    std::optional<std::string> text;
    // Stored envelope hash. Set on success with an envelope, and on
    // integrity failure (untrusted); empty otherwise.
    std::optional<std::string> sha256;
    ErrorKind error = ErrorKind::None;
    std::string message;
    std::vector<size_t> missing;

    bool ok() const { return error == ErrorKind::None; }
};

class MultiQrCodec {
public:
    explicit MultiQrCodec(const CodecConfig& config = CodecConfig());
    MultiQrCodec(const CodecConfig& config,
                 std::shared_ptr<const SymbolRenderer> renderer,
                 std::shared_ptr<const SymbolScanner> scanner);

    // text -> checksum -> (encrypt) -> chunks -> frames -> tiled PNG.
    // Throws CodecError; nothing is produced on failure.
    std::vector<uint8_t> encode(const std::string& text, int chunk_size,
                                const std::optional<std::string>& passphrase = std::nullopt) const;

    // Same PNG, standard base64 (for data: URIs).
    std::string encode_base64(const std::string& text, int chunk_size,
                              const std::optional<std::string>& passphrase = std::nullopt) const;

    // Never throws; failures come back in the result.
    DecodeResult decode(const std::vector<uint8_t>& image_bytes,
                        const std::optional<std::string>& passphrase = std::nullopt) const;

    DecodeResult decode_file(const std::string& path,
                             const std::optional<std::string>& passphrase = std::nullopt) const;

    const CodecConfig& config() const { return config_; }

private:
    CodecConfig config_;
    std::shared_ptr<const SymbolRenderer> renderer_;
    std::shared_ptr<const SymbolScanner> scanner_;

    std::string decode_payload(const std::vector<uint8_t>& image_bytes,
                               const std::optional<std::string>& passphrase) const;
};
