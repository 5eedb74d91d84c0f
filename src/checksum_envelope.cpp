#include "checksum_envelope.hpp"
#include "codec_error.hpp"
#include <nlohmann/json.hpp>
#include <openssl/evp.h>

using json = nlohmann::json;

std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("EVP_Digest(sha256) failed");

    static const char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out.push_back(HEX[digest[i] >> 4]);
        out.push_back(HEX[digest[i] & 0x0F]);
    }
    return out;
}

std::string wrap_with_checksum(const std::string& text) {
    json obj;
    obj["hash"] = sha256_hex(text);
    obj["text"] = text;

    // ensure_ascii keeps the payload pure ASCII; \uXXXX escapes survive any QR mode
    try {
        return obj.dump(-1, ' ', true, json::error_handler_t::strict);
    } catch (const json::type_error&) {
        throw CodecError(ErrorKind::Validation, "Text must be valid UTF-8.");
    }
}

std::variant<Envelope, LegacyText> parse_envelope(const std::string& payload) {
    json obj = json::parse(payload, nullptr, false);
    if (obj.is_discarded() || !obj.is_object())
        return LegacyText{payload};

    auto hash = obj.find("hash");
    auto text = obj.find("text");
    if (hash == obj.end() || text == obj.end() || !hash->is_string() || !text->is_string())
        return LegacyText{payload};

    return Envelope{hash->get<std::string>(), text->get<std::string>()};
}

UnwrappedPayload unwrap_and_verify(const std::string& payload) {
    auto parsed = parse_envelope(payload);

    if (auto* legacy = std::get_if<LegacyText>(&parsed))
        return UnwrappedPayload{std::move(legacy->text), std::nullopt};

    Envelope& env = std::get<Envelope>(parsed);
    if (sha256_hex(env.text) != env.hash)
        throw IntegrityError(env.hash);

    return UnwrappedPayload{std::move(env.text), std::move(env.hash)};
}
