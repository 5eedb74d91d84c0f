#include "slicer.hpp"
#include "codec_error.hpp"
#include <algorithm>

// Length of the UTF-8 sequence starting with lead byte c; stray
// continuation or invalid bytes count as one character.
static size_t utf8_sequence_length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

std::vector<std::string> split_payload(const std::string& payload, int chunk_size) {
    if (chunk_size <= 0)
        throw CodecError(ErrorKind::Validation, "chunk_size must be positive");

    std::vector<std::string> chunks;
    size_t offset = 0;

    while (offset < payload.size()) {
        size_t end = offset;
        for (int n = 0; n < chunk_size && end < payload.size(); ++n) {
            size_t len = utf8_sequence_length(static_cast<unsigned char>(payload[end]));
            end = std::min(end + len, payload.size());
        }
        chunks.push_back(payload.substr(offset, end - offset));
        offset = end;
    }

    return chunks;
}

std::vector<Fragment> slice_message(const std::string& payload,
                                    const std::string& message_id,
                                    int chunk_size) {
    std::vector<std::string> texts = split_payload(payload, chunk_size);
    std::vector<Fragment> fragments;
    fragments.reserve(texts.size());

    for (size_t i = 0; i < texts.size(); ++i) {
        Fragment f;
        f.message_id = message_id;
        f.index = i;
        f.total = texts.size();
        f.text = std::move(texts[i]);

        fragments.push_back(std::move(f));
    }

    return fragments;
}
