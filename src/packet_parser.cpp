#include "packet_parser.hpp"
#include "codec_config.hpp"
#include <openssl/rand.h>
#include <charconv>
#include <stdexcept>
#include <cstdint>
// Frame format (one QR symbol):
// [id]     message id, no separator inside
// [index]  0-based fragment index, decimal
// [total]  fragment count, decimal, 1..MAX_FRAMES
// [text]   fragment text, may contain separators

std::string encode_frame(const std::string& message_id, size_t index, size_t total,
                         const std::string& text) {
    std::string frame;
    frame.reserve(message_id.size() + text.size() + 24);

    frame += message_id;
    frame += FRAME_SEPARATOR;
    frame += std::to_string(index);
    frame += FRAME_SEPARATOR;
    frame += std::to_string(total);
    frame += FRAME_SEPARATOR;
    frame += text;

    return frame;
}

std::string serialize_frame(const Fragment& fragment) {
    return encode_frame(fragment.message_id, fragment.index, fragment.total, fragment.text);
}

static bool parse_count(const std::string& field, size_t& out) {
    if (field.empty()) return false;
    for (char c : field) {
        if (c < '0' || c > '9') return false;
    }
    const char* last = field.data() + field.size();
    auto res = std::from_chars(field.data(), last, out);
    return res.ec == std::errc() && res.ptr == last;
}

std::optional<Fragment> parse_frame(const std::string& frame) {
    size_t cuts[3];
    size_t pos = 0;
    for (int i = 0; i < 3; ++i) {
        size_t found = frame.find(FRAME_SEPARATOR, pos);
        if (found == std::string::npos) return std::nullopt;
        cuts[i] = found;
        pos = found + 1;
    }

    Fragment f;
    f.message_id = frame.substr(0, cuts[0]);
    if (f.message_id.empty()) return std::nullopt;

    if (!parse_count(frame.substr(cuts[0] + 1, cuts[1] - cuts[0] - 1), f.index)) return std::nullopt;
    if (!parse_count(frame.substr(cuts[1] + 1, cuts[2] - cuts[1] - 1), f.total)) return std::nullopt;
    if (f.total == 0 || f.total > MAX_FRAMES || f.index >= f.total) return std::nullopt;

    f.text = frame.substr(cuts[2] + 1);
    return f;
}

std::string generate_message_id() {
    uint8_t raw[MESSAGE_ID_BYTES];
    if (RAND_bytes(raw, static_cast<int>(MESSAGE_ID_BYTES)) != 1)
        throw std::runtime_error("RAND_bytes failed");

    static const char HEX[] = "0123456789abcdef";
    std::string id;
    for (uint8_t b : raw) {
        id.push_back(HEX[b >> 4]);
        id.push_back(HEX[b & 0x0F]);
    }
    return id;
}
