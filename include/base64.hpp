#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Padded base64. url_safe swaps '+/' for '-_'.
std::string base64_encode(const std::vector<uint8_t>& data, bool url_safe = false);

// Returns nullopt on bad characters, bad length or bad padding.
std::optional<std::vector<uint8_t>> base64_decode(const std::string& text, bool url_safe = false);
