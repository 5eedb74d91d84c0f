#include "frame_collector.hpp"
#include "codec_config.hpp"
#include "codec_error.hpp"
#include "packet_parser.hpp"
#include <iostream>

bool FrameCollector::handle(const Fragment& frag) {
    if (frag.total == 0 || frag.total > MAX_FRAMES || frag.index >= frag.total)
        return false;

    // First fragment fixes the message
    if (!message_id_) {
        message_id_ = frag.message_id;
        total_ = frag.total;
        chunks_.resize(total_);
        received_flags_.resize(total_, false);
    }

    if (frag.message_id != *message_id_ || frag.total != total_) {
        ignored_frames_++;
        return false;
    }

    // Duplicate check
    if (received_flags_[frag.index]) {
        if (chunks_[frag.index] != frag.text) {
            std::cerr << "[COLLECTOR] Conflicting duplicate for chunk " << frag.index
                      << " of " << *message_id_ << ", keeping first" << std::endl;
        }
        return false;
    }

    chunks_[frag.index] = frag.text;
    received_flags_[frag.index] = true;
    received_chunks_++;
    return true;
}

bool FrameCollector::complete() const {
    return message_id_.has_value() && received_chunks_ == total_;
}

std::vector<size_t> FrameCollector::missing() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < total_; ++i) {
        if (!received_flags_[i]) out.push_back(i);
    }
    return out;
}

std::string FrameCollector::assemble() const {
    if (!complete()) {
        if (empty()) throw CodecError(ErrorKind::Scan, "Invalid QR format.");
        throw MissingChunksError(missing());
    }

    std::string payload;
    for (const auto& chunk : chunks_) payload += chunk;
    return payload;
}

size_t collect_frames(FrameCollector& collector, const std::vector<std::string>& scanned) {
    size_t skipped = 0;
    for (const auto& s : scanned) {
        auto frag = parse_frame(s);
        if (!frag) {
            skipped++;
            continue;
        }
        collector.handle(*frag);
    }

    if (skipped > 0) {
        std::cerr << "[COLLECTOR] Skipped " << skipped << " unparsable symbol(s)" << std::endl;
    }
    return skipped;
}

std::string reassemble_frames(const std::vector<std::string>& scanned) {
    if (scanned.empty())
        throw CodecError(ErrorKind::Scan, "No QR codes found.");

    FrameCollector collector;
    collect_frames(collector, scanned);

    if (collector.empty())
        throw CodecError(ErrorKind::Scan, "Invalid QR format.");

    if (collector.ignored() > 0) {
        std::cerr << "[COLLECTOR] Ignored " << collector.ignored()
                  << " frame(s) not belonging to message " << *collector.message_id() << std::endl;
    }

    return collector.assemble();
}
