#pragma once

#include "slicer.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstddef>

// Collects the fragments of one message. The first fragment handed in
// fixes the message id and total; fragments of any other id are ignored.
class FrameCollector {
public:
    FrameCollector() = default;

    // Returns true if the fragment was stored.
    bool handle(const Fragment& frag);

    bool empty() const { return !message_id_.has_value(); }
    bool complete() const;
    const std::optional<std::string>& message_id() const { return message_id_; }
    size_t total() const { return total_; }
    size_t received() const { return received_chunks_; }
    size_t ignored() const { return ignored_frames_; }

    // Indices in [0, total) not yet received, ascending.
    std::vector<size_t> missing() const;

    // Fragment texts joined in index order. Throws MissingChunksError if
    // the message is incomplete.
    std::string assemble() const;

private:
    std::optional<std::string> message_id_;
    size_t total_ = 0;
    std::vector<std::string> chunks_;
    std::vector<bool> received_flags_;
    size_t received_chunks_ = 0;
    size_t ignored_frames_ = 0;
};

// Parses scanned strings into the collector, skipping anything that is not
// a frame. Returns the number skipped.
size_t collect_frames(FrameCollector& collector, const std::vector<std::string>& scanned);

// Parses scanned strings, picks the first message and assembles it.
// Throws ScanError / MissingChunksError (as CodecError).
std::string reassemble_frames(const std::vector<std::string>& scanned);
