#pragma once
#include "slicer.hpp"
#include <cstddef>
#include <optional>
#include <string>

// Fragment -> "id|index|total|text"
std::string encode_frame(const std::string& message_id, size_t index, size_t total,
                         const std::string& text);
std::string serialize_frame(const Fragment& fragment);

// "id|index|total|text" -> Fragment. Splits at most three times, so the
// text keeps any separators it contains. Empty result on malformed input.
std::optional<Fragment> parse_frame(const std::string& frame);

// 8 hex chars from the OpenSSL RNG.
std::string generate_message_id();
