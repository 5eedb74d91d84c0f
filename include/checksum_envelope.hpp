#pragma once

#include <optional>
#include <string>
#include <variant>

// On-wire shape: {"hash": "<sha256 hex>", "text": "<original text>"}
struct Envelope {
    std::string hash;
    std::string text;
};

// Payload that is not an envelope; passed through as plain text.
struct LegacyText {
    std::string text;
};

struct UnwrappedPayload {
    std::string text;
    std::optional<std::string> hash;    // empty for legacy text
};

// Lowercase hex SHA-256 of the raw bytes.
std::string sha256_hex(const std::string& data);

// Throws CodecError(Validation) if text is not valid UTF-8.
std::string wrap_with_checksum(const std::string& text);

// Envelope only for a JSON object whose "hash" and "text" are both strings.
std::variant<Envelope, LegacyText> parse_envelope(const std::string& payload);

// Throws IntegrityError when the stored hash does not match the text.
UnwrappedPayload unwrap_and_verify(const std::string& payload);
