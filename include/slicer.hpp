#pragma once
#include <string>
#include <vector>
#include <cstddef>

struct Fragment {
    std::string message_id;
    size_t index = 0;
    size_t total = 0;
    std::string text;
};

// Split payload into slices of at most chunk_size characters (UTF-8 code
// points). Throws CodecError(Validation) if chunk_size <= 0.
std::vector<std::string> split_payload(const std::string& payload, int chunk_size);

// Same split, stamped with message id, index and total.
std::vector<Fragment> slice_message(const std::string& payload,
                                    const std::string& message_id,
                                    int chunk_size);
