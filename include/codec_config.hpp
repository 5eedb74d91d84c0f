#pragma once

#include <cstddef>

// Frame wire format: id|index|total|text
constexpr char FRAME_SEPARATOR = '|';
constexpr size_t MESSAGE_ID_BYTES = 4;      // rendered as 8 hex chars

constexpr int DEFAULT_CHUNK_SIZE = 500;
constexpr int DEFAULT_BOX_SIZE = 10;        // pixels per QR module
constexpr int DEFAULT_BORDER = 4;           // quiet zone, in modules
constexpr int DEFAULT_LABEL_MIN_HEIGHT = 24;

// Byte-mode capacity of a version 40 symbol at error correction level Q.
constexpr size_t MAX_QR_PAYLOAD_BYTES = 1663;

// Upper bound on symbols per image: a 64x64 grid of the smallest labelled
// symbol (29 modules at 10 px plus strip) is already ~20000 px a side.
constexpr size_t MAX_FRAMES = 4096;

struct CodecConfig {
    int chunk_size = DEFAULT_CHUNK_SIZE;
    int box_size = DEFAULT_BOX_SIZE;
    int border = DEFAULT_BORDER;
    int label_min_height = DEFAULT_LABEL_MIN_HEIGHT;
    bool add_labels = true;
};
