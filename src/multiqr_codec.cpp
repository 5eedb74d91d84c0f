#include "multiqr_codec.hpp"
#include "base64.hpp"
#include "checksum_envelope.hpp"
#include "frame_collector.hpp"
#include "packet_parser.hpp"
#include "payload_cipher.hpp"
#include "slicer.hpp"
#include "tile_layout.hpp"

#include <opencv2/imgcodecs.hpp>

#include <fstream>
#include <iostream>
#include <iterator>

MultiQrCodec::MultiQrCodec(const CodecConfig& config)
    : MultiQrCodec(config,
                   std::make_shared<OpenCvQrRenderer>(config.box_size, config.border),
                   std::make_shared<OpenCvQrScanner>()) {}

MultiQrCodec::MultiQrCodec(const CodecConfig& config,
                           std::shared_ptr<const SymbolRenderer> renderer,
                           std::shared_ptr<const SymbolScanner> scanner)
    : config_(config), renderer_(std::move(renderer)), scanner_(std::move(scanner)) {
    if (!renderer_ || !scanner_)
        throw std::invalid_argument("MultiQrCodec needs a renderer and a scanner");
}

std::vector<uint8_t> MultiQrCodec::encode(const std::string& text, int chunk_size,
                                          const std::optional<std::string>& passphrase) const {
    if (text.empty())
        throw CodecError(ErrorKind::Validation, "Provide some text to encode.");
    if (chunk_size <= 0)
        throw CodecError(ErrorKind::Validation, "chunk_size must be positive");

    std::string wrapped = wrap_with_checksum(text);
    std::string payload = maybe_encrypt(wrapped, passphrase);

    std::string message_id = generate_message_id();
    std::vector<Fragment> fragments = slice_message(payload, message_id, chunk_size);
    if (fragments.size() > MAX_FRAMES)
        throw CodecError(ErrorKind::Validation,
                         "Too many chunks for one image; raise chunk_size.");

    std::vector<std::string> frames;
    frames.reserve(fragments.size());
    for (const auto& frag : fragments) {
        frames.push_back(serialize_frame(frag));
        if (frames.back().size() > MAX_QR_PAYLOAD_BYTES)
            throw CodecError(ErrorKind::Validation,
                             "Chunk does not fit in a single QR symbol; lower chunk_size.");
    }

    const SymbolRenderer& renderer = *renderer_;
    RenderFn render_fn = [&renderer](const std::string& frame) { return renderer.render(frame); };

    LabelFn label_fn;
    if (config_.add_labels) {
        int min_height = config_.label_min_height;
        label_fn = [min_height](const cv::Mat& symbol, size_t index, size_t total) {
            return add_index_label(symbol, index, total, min_height);
        };
    }

    cv::Mat big;
    try {
        big = render_message(frames, render_fn, label_fn);
    } catch (const cv::Exception& e) {
        std::cerr << "[CODEC] render failed: " << e.what() << std::endl;
        throw CodecError(ErrorKind::Image, "Failed to render QR grid.");
    }

    std::vector<uchar> png;
    try {
        if (!cv::imencode(".png", big, png))
            throw CodecError(ErrorKind::Image, "Failed to encode PNG.");
    } catch (const cv::Exception& e) {
        std::cerr << "[CODEC] imencode failed: " << e.what() << std::endl;
        throw CodecError(ErrorKind::Image, "Failed to encode PNG.");
    }

    std::cerr << "[CODEC] Encoded message " << message_id << ": " << frames.size()
              << " chunk(s), " << big.cols << "x" << big.rows << " px" << std::endl;

    return std::vector<uint8_t>(png.begin(), png.end());
}

std::string MultiQrCodec::encode_base64(const std::string& text, int chunk_size,
                                        const std::optional<std::string>& passphrase) const {
    return base64_encode(encode(text, chunk_size, passphrase));
}

static cv::Mat load_image(const std::vector<uint8_t>& image_bytes) {
    if (image_bytes.empty())
        throw CodecError(ErrorKind::Image, "Invalid image: empty input");

    cv::Mat image;
    try {
        image = cv::imdecode(image_bytes, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        std::cerr << "[CODEC] imdecode failed: " << e.what() << std::endl;
        throw CodecError(ErrorKind::Image, "Invalid image: not a decodable raster");
    }
    if (image.empty())
        throw CodecError(ErrorKind::Image, "Invalid image: not a decodable raster");
    return image;
}

// Scans the grid cell of every missing index on its own. Cells follow the
// layout tile_images uses for the collector's total.
static void rescan_missing_cells(const SymbolScanner& scanner, const cv::Mat& image,
                                 FrameCollector& collector) {
    std::vector<cv::Rect> cells = grid_cells(image.size(), collector.total());
    if (cells.empty()) return;

    size_t before = collector.received();
    for (size_t index : collector.missing()) {
        std::vector<std::string> found;
        try {
            found = scanner.scan(image(cells[index]).clone());
        } catch (const cv::Exception& e) {
            std::cerr << "[CODEC] cell " << index << " rescan failed: " << e.what() << std::endl;
            continue;
        }
        collect_frames(collector, found);
    }

    std::cerr << "[CODEC] Cell rescan recovered " << (collector.received() - before)
              << " chunk(s), " << collector.missing().size() << " still missing" << std::endl;
}

std::string MultiQrCodec::decode_payload(const std::vector<uint8_t>& image_bytes,
                                         const std::optional<std::string>& passphrase) const {
    cv::Mat image = load_image(image_bytes);

    std::vector<std::string> scanned;
    try {
        scanned = scanner_->scan(image);
    } catch (const cv::Exception& e) {
        std::cerr << "[CODEC] scanner failed: " << e.what() << std::endl;
        throw CodecError(ErrorKind::Scan, "No QR codes found.");
    }

    if (scanned.empty())
        throw CodecError(ErrorKind::Scan, "No QR codes found.");

    FrameCollector collector;
    collect_frames(collector, scanned);
    if (collector.empty())
        throw CodecError(ErrorKind::Scan, "Invalid QR format.");

    if (!collector.complete())
        rescan_missing_cells(*scanner_, image, collector);

    if (collector.ignored() > 0) {
        std::cerr << "[CODEC] Ignored " << collector.ignored()
                  << " frame(s) not belonging to message " << *collector.message_id() << std::endl;
    }

    std::string payload = collector.assemble();

    try {
        return maybe_decrypt(payload, passphrase);
    } catch (const CodecError&) {
        throw;
    } catch (const std::runtime_error& e) {
        std::cerr << "[CODEC] cipher failure: " << e.what() << std::endl;
        throw CodecError(ErrorKind::Decryption,
                         "Decryption failed. Wrong passphrase or corrupted data.");
    }
}

static void set_failure(DecodeResult& result, const CodecError& e) {
    result.text.reset();
    result.error = e.kind();
    result.message = e.what();
}

DecodeResult MultiQrCodec::decode(const std::vector<uint8_t>& image_bytes,
                                  const std::optional<std::string>& passphrase) const {
    DecodeResult result;

    try {
        std::string wrapped = decode_payload(image_bytes, passphrase);
        UnwrappedPayload out = unwrap_and_verify(wrapped);

        std::cerr << "[CODEC] decoded_len = " << out.text.size();
        if (out.hash) std::cerr << ", sha256 = " << *out.hash;
        std::cerr << std::endl;

        result.text = std::move(out.text);
        result.sha256 = std::move(out.hash);
    } catch (const MissingChunksError& e) {
        set_failure(result, e);
        result.missing = e.missing();
    } catch (const IntegrityError& e) {
        set_failure(result, e);
        result.sha256 = e.stored_hash();
    } catch (const CodecError& e) {
        set_failure(result, e);
    } catch (const std::exception& e) {
        std::cerr << "[CODEC] unexpected failure: " << e.what() << std::endl;
        set_failure(result, CodecError(ErrorKind::Scan, "Invalid QR format."));
    }

    if (!result.ok()) {
        std::cerr << "[CODEC] decode failed (" << error_kind_name(result.error) << "): "
                  << result.message << std::endl;
    }
    return result;
}

DecodeResult MultiQrCodec::decode_file(const std::string& path,
                                       const std::optional<std::string>& passphrase) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        DecodeResult result;
        set_failure(result, CodecError(ErrorKind::Validation, "No such file: " + path));
        return result;
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return decode(bytes, passphrase);
}
