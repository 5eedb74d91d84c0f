#include <doctest/doctest.h>
#include "base64.hpp"
#include "checksum_envelope.hpp"
#include "multiqr_codec.hpp"
#include "packet_parser.hpp"
#include "payload_cipher.hpp"
#include "tile_layout.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <functional>
#include <memory>
#include <stdexcept>

// Frames handed to the renderer, replayed by the scanner.
struct FrameLog {
    std::vector<std::string> rendered;
    std::function<std::vector<std::string>(std::vector<std::string>)> on_scan;
};

class RecordingRenderer : public SymbolRenderer {
public:
    explicit RecordingRenderer(std::shared_ptr<FrameLog> log) : log_(std::move(log)) {}

    cv::Mat render(const std::string& frame) const override {
        log_->rendered.push_back(frame);
        return cv::Mat(60, 60, CV_8UC3, cv::Scalar(0, 0, 0));
    }

private:
    std::shared_ptr<FrameLog> log_;
};

class ReplayScanner : public SymbolScanner {
public:
    explicit ReplayScanner(std::shared_ptr<FrameLog> log) : log_(std::move(log)) {}

    std::vector<std::string> scan(const cv::Mat& image) const override {
        REQUIRE_FALSE(image.empty());
        if (log_->on_scan) return log_->on_scan(log_->rendered);
        return log_->rendered;
    }

private:
    std::shared_ptr<FrameLog> log_;
};

struct StubCodec {
    std::shared_ptr<FrameLog> log = std::make_shared<FrameLog>();
    MultiQrCodec codec{CodecConfig(),
                       std::make_shared<RecordingRenderer>(log),
                       std::make_shared<ReplayScanner>(log)};
};

static std::vector<uint8_t> blank_png() {
    cv::Mat white(32, 32, CV_8UC3, cv::Scalar(255, 255, 255));
    std::vector<uchar> buf;
    REQUIRE(cv::imencode(".png", white, buf));
    return std::vector<uint8_t>(buf.begin(), buf.end());
}

static ErrorKind encode_error(const MultiQrCodec& codec, const std::string& text, int chunk_size) {
    try {
        codec.encode(text, chunk_size);
    } catch (const CodecError& e) {
        return e.kind();
    }
    return ErrorKind::None;
}

TEST_CASE("hello world, chunk 5: total matches the wrapped payload length") {
    StubCodec s;
    std::vector<uint8_t> png = s.codec.encode("hello world", 5);

    REQUIRE(png.size() > 8);
    CHECK(png[0] == 0x89);
    CHECK(png[1] == 'P');

    size_t wrapped_len = wrap_with_checksum("hello world").size();
    size_t expected_total = (wrapped_len + 4) / 5;
    REQUIRE(s.log->rendered.size() == expected_total);

    std::string id;
    for (size_t i = 0; i < s.log->rendered.size(); ++i) {
        auto frag = parse_frame(s.log->rendered[i]);
        REQUIRE(frag.has_value());
        CHECK(frag->index == i);
        CHECK(frag->total == expected_total);
        if (i == 0) id = frag->message_id;
        CHECK(frag->message_id == id);
    }

    DecodeResult r = s.codec.decode(png);
    CHECK(r.ok());
    REQUIRE(r.text.has_value());
    CHECK(*r.text == "hello world");
    REQUIRE(r.sha256.has_value());
    CHECK(*r.sha256 == sha256_hex("hello world"));
}

TEST_CASE("round trip across chunk sizes and passphrases") {
    const std::string text = "Line one\nLine | two with separators |||\n\xC3\xBCnic\xC3\xB8" "de \xF0\x9F\x98\x80 end";
    for (int chunk : {1, 7, 64, 500, 10000}) {
        for (const char* pass : {"", "s3cret", "another passphrase"}) {
            StubCodec s;
            std::optional<std::string> p;
            if (*pass) p = pass;

            DecodeResult r = s.codec.decode(s.codec.encode(text, chunk, p), p);
            CHECK(r.ok());
            REQUIRE(r.text.has_value());
            CHECK(*r.text == text);
            REQUIRE(r.sha256.has_value());
            CHECK(*r.sha256 == sha256_hex(text));
        }
    }
}

TEST_CASE("chunk size at or above payload length yields a single frame 0/1") {
    StubCodec s;
    size_t wrapped_len = wrap_with_checksum("tiny").size();
    s.codec.encode("tiny", static_cast<int>(wrapped_len));

    REQUIRE(s.log->rendered.size() == 1);
    auto frag = parse_frame(s.log->rendered[0]);
    REQUIRE(frag.has_value());
    CHECK(frag->index == 0);
    CHECK(frag->total == 1);
}

TEST_CASE("encrypted frames do not carry the plaintext") {
    StubCodec s;
    s.codec.encode("top secret words", 1000, std::string("pw"));
    REQUIRE(s.log->rendered.size() == 1);
    CHECK(s.log->rendered[0].find("secret") == std::string::npos);
}

TEST_CASE("wrong passphrase gives DecryptionError and no text or hash") {
    StubCodec s;
    auto png = s.codec.encode("attack at dawn", 16, std::string("P1"));

    DecodeResult r = s.codec.decode(png, std::string("P2"));
    CHECK(r.error == ErrorKind::Decryption);
    CHECK_FALSE(r.text.has_value());
    CHECK_FALSE(r.sha256.has_value());

    // Without a passphrase the token is not an envelope: it comes back as
    // opaque legacy text, never as the plaintext.
    DecodeResult none = s.codec.decode(png);
    CHECK(none.ok());
    REQUIRE(none.text.has_value());
    CHECK(none.text->find("attack") == std::string::npos);
    CHECK_FALSE(none.sha256.has_value());
}

TEST_CASE("removing one frame reports exactly that index") {
    StubCodec s;
    auto png = s.codec.encode("a message long enough for several frames", 10);
    REQUIRE(s.log->rendered.size() > 3);

    s.log->on_scan = [](std::vector<std::string> frames) {
        frames.erase(frames.begin() + 2);
        return frames;
    };

    DecodeResult r = s.codec.decode(png);
    CHECK(r.error == ErrorKind::MissingChunks);
    CHECK(r.missing == std::vector<size_t>{2});
    CHECK(r.message == "Missing QR chunks: [2]");
    CHECK_FALSE(r.text.has_value());
}

TEST_CASE("shuffled, duplicated and foreign symbols still decode") {
    StubCodec s;
    auto png = s.codec.encode("order does not matter here", 4);

    s.log->on_scan = [](std::vector<std::string> frames) {
        std::reverse(frames.begin(), frames.end());
        frames.push_back(frames.front());
        frames.push_back(frames[1]);
        frames.insert(frames.begin() + 1, "https://example.org/not-a-frame");
        frames.push_back("zzzzzzzz|0|1|another message");
        return frames;
    };

    DecodeResult r = s.codec.decode(png);
    CHECK(r.ok());
    REQUIRE(r.text.has_value());
    CHECK(*r.text == "order does not matter here");
}

TEST_CASE("tampered envelope text gives IntegrityError with the stored hash") {
    StubCodec s;
    std::string wrapped = wrap_with_checksum("pay 10 EUR");
    std::string tampered = wrapped;
    size_t pos = tampered.find("pay 10");
    REQUIRE(pos != std::string::npos);
    tampered[pos + 4] = '9';

    s.log->on_scan = [tampered](std::vector<std::string>) {
        return std::vector<std::string>{encode_frame("abcd0123", 0, 1, tampered)};
    };

    DecodeResult r = s.codec.decode(blank_png());
    CHECK(r.error == ErrorKind::Integrity);
    CHECK_FALSE(r.text.has_value());
    REQUIRE(r.sha256.has_value());
    CHECK(*r.sha256 == sha256_hex("pay 10 EUR"));
}

TEST_CASE("tampering under encryption is caught by the cipher") {
    StubCodec s;
    std::string token = maybe_encrypt(wrap_with_checksum("hello"), std::string("pw"));
    token[token.size() / 2] = (token[token.size() / 2] == 'x') ? 'y' : 'x';

    s.log->on_scan = [token](std::vector<std::string>) {
        return std::vector<std::string>{encode_frame("abcd0123", 0, 1, token)};
    };

    DecodeResult r = s.codec.decode(blank_png(), std::string("pw"));
    CHECK(r.error == ErrorKind::Decryption);
}

TEST_CASE("legacy plain payload decodes unchanged with no hash") {
    StubCodec s;
    s.log->on_scan = [](std::vector<std::string>) {
        return std::vector<std::string>{"0000beef|1|2|text", "0000beef|0|2|plain "};
    };

    DecodeResult r = s.codec.decode(blank_png());
    CHECK(r.ok());
    REQUIRE(r.text.has_value());
    CHECK(*r.text == "plain text");
    CHECK_FALSE(r.sha256.has_value());
}

TEST_CASE("scan failures are distinguished") {
    StubCodec s;

    s.log->on_scan = [](std::vector<std::string>) { return std::vector<std::string>(); };
    DecodeResult none = s.codec.decode(blank_png());
    CHECK(none.error == ErrorKind::Scan);
    CHECK(none.message == "No QR codes found.");

    s.log->on_scan = [](std::vector<std::string>) {
        return std::vector<std::string>{"just a url", "1|2"};
    };
    DecodeResult bad = s.codec.decode(blank_png());
    CHECK(bad.error == ErrorKind::Scan);
    CHECK(bad.message == "Invalid QR format.");
}

TEST_CASE("non-image bytes give ImageError") {
    StubCodec s;
    std::string junk = "definitely not a png";
    DecodeResult r = s.codec.decode(std::vector<uint8_t>(junk.begin(), junk.end()));
    CHECK(r.error == ErrorKind::Image);
    CHECK_FALSE(r.text.has_value());

    CHECK(s.codec.decode(std::vector<uint8_t>()).error == ErrorKind::Image);
}

TEST_CASE("missing input file is a validation error") {
    StubCodec s;
    DecodeResult r = s.codec.decode_file("/nonexistent/dir/multiqr.png");
    CHECK(r.error == ErrorKind::Validation);
}

TEST_CASE("encode rejects bad input before rendering anything") {
    StubCodec s;
    CHECK(encode_error(s.codec, "", 10) == ErrorKind::Validation);
    CHECK(encode_error(s.codec, "text", 0) == ErrorKind::Validation);
    CHECK(encode_error(s.codec, "text", -7) == ErrorKind::Validation);
    CHECK(encode_error(s.codec, "bad \xFF utf8", 10) == ErrorKind::Validation);
    CHECK(encode_error(s.codec, std::string(4000, 'a'), 3000) == ErrorKind::Validation);
    CHECK(s.log->rendered.empty());
}

TEST_CASE("encode refuses more chunks than one image may carry") {
    StubCodec s;
    try {
        s.codec.encode(std::string(MAX_FRAMES + 1, 'a'), 1);
        FAIL("expected CodecError");
    } catch (const CodecError& e) {
        CHECK(e.kind() == ErrorKind::Validation);
    }
    CHECK(s.log->rendered.empty());
}

class TwoChannelRenderer : public SymbolRenderer {
public:
    cv::Mat render(const std::string&) const override {
        return cv::Mat(40, 40, CV_8UC2, cv::Scalar(0, 0));
    }
};

TEST_CASE("a renderer OpenCV cannot tile is reported as an image error") {
    auto log = std::make_shared<FrameLog>();
    for (bool labels : {true, false}) {
        CodecConfig config;
        config.add_labels = labels;
        MultiQrCodec codec(config, std::make_shared<TwoChannelRenderer>(),
                           std::make_shared<ReplayScanner>(log));
        CHECK(encode_error(codec, "hello world", 5) == ErrorKind::Image);
    }
}

TEST_CASE("an oversized foreign frame comes back as a scan error") {
    StubCodec s;
    s.log->on_scan = [](std::vector<std::string>) {
        return std::vector<std::string>{"ffffffff|0|18446744073709551615|junk",
                                        "ffffffff|0|4000000000|junk"};
    };
    DecodeResult r = s.codec.decode(blank_png());
    CHECK(r.error == ErrorKind::Scan);
    CHECK(r.message == "Invalid QR format.");
}

TEST_CASE("non-codec exceptions from the scanner stay inside decode") {
    StubCodec s;
    s.log->on_scan = [](std::vector<std::string>) -> std::vector<std::string> {
        throw std::length_error("vector::_M_default_append");
    };
    DecodeResult r = s.codec.decode(blank_png());
    CHECK(r.error == ErrorKind::Scan);
    CHECK_FALSE(r.text.has_value());
}

// Symbol i is painted gray level 10 * (i + 1), so a cell crop can be traced
// back to the frame drawn in it.
struct ShadedLog {
    std::vector<std::string> rendered;
    std::vector<size_t> hidden;      // not seen on the whole image
    std::vector<size_t> unreadable;  // not seen in their cell either
    size_t cell_scans = 0;
};

class ShadedRenderer : public SymbolRenderer {
public:
    explicit ShadedRenderer(std::shared_ptr<ShadedLog> log) : log_(std::move(log)) {}

    cv::Mat render(const std::string& frame) const override {
        log_->rendered.push_back(frame);
        return cv::Mat(60, 60, CV_8UC3, cv::Scalar::all(10.0 * log_->rendered.size()));
    }

private:
    std::shared_ptr<ShadedLog> log_;
};

class CellScanner : public SymbolScanner {
public:
    explicit CellScanner(std::shared_ptr<ShadedLog> log) : log_(std::move(log)) {}

    std::vector<std::string> scan(const cv::Mat& image) const override {
        auto listed = [](const std::vector<size_t>& v, size_t i) {
            return std::find(v.begin(), v.end(), i) != v.end();
        };

        std::vector<std::string> out;
        if (image.cols > 60) {
            for (size_t i = 0; i < log_->rendered.size(); ++i) {
                if (!listed(log_->hidden, i)) out.push_back(log_->rendered[i]);
            }
            return out;
        }

        log_->cell_scans++;
        size_t i = image.at<cv::Vec3b>(0, 0)[0] / 10 - 1;
        if (i < log_->rendered.size() && !listed(log_->unreadable, i))
            out.push_back(log_->rendered[i]);
        return out;
    }

private:
    std::shared_ptr<ShadedLog> log_;
};

TEST_CASE("symbols missed on the whole image are recovered from their cells") {
    auto log = std::make_shared<ShadedLog>();
    MultiQrCodec codec(CodecConfig(), std::make_shared<ShadedRenderer>(log),
                       std::make_shared<CellScanner>(log));

    auto png = codec.encode("hello world", 5);
    REQUIRE(log->rendered.size() > 8);
    REQUIRE(log->rendered.size() < 25);

    log->hidden = {3, 7};
    DecodeResult r = codec.decode(png);
    CHECK(r.ok());
    REQUIRE(r.text.has_value());
    CHECK(*r.text == "hello world");
    CHECK(log->cell_scans == 2);

    log->cell_scans = 0;
    log->unreadable = {7};
    DecodeResult partial = codec.decode(png);
    CHECK(partial.error == ErrorKind::MissingChunks);
    CHECK(partial.missing == std::vector<size_t>{7});
    CHECK(log->cell_scans == 2);
}

TEST_CASE("message ids differ between encode calls") {
    StubCodec a, b;
    a.codec.encode("same text", 1000);
    b.codec.encode("same text", 1000);
    auto fa = parse_frame(a.log->rendered.at(0));
    auto fb = parse_frame(b.log->rendered.at(0));
    REQUIRE(fa.has_value());
    REQUIRE(fb.has_value());
    CHECK(fa->message_id != fb->message_id);
}

TEST_CASE("encode_base64 wraps the PNG bytes") {
    StubCodec s;
    std::string b64 = s.codec.encode_base64("hello", 100);
    auto raw = base64_decode(b64);
    REQUIRE(raw.has_value());
    REQUIRE(raw->size() > 4);
    CHECK((*raw)[0] == 0x89);
    CHECK((*raw)[1] == 'P');
    CHECK((*raw)[2] == 'N');
    CHECK((*raw)[3] == 'G');
}

TEST_CASE("OpenCV renderer output scans back") {
    OpenCvQrRenderer renderer;
    OpenCvQrScanner scanner;

    std::string frame = encode_frame("abcd0123", 0, 1, "{\"hash\":\"x\",\"text\":\"y\"}");
    cv::Mat symbol = renderer.render(frame);
    CHECK(symbol.type() == CV_8UC3);

    auto decoded = scanner.scan(symbol);
    REQUIRE(decoded.size() == 1);
    CHECK(decoded[0] == frame);
}

TEST_CASE("OpenCV renderer refuses frames over symbol capacity") {
    OpenCvQrRenderer renderer;
    try {
        renderer.render(std::string(MAX_QR_PAYLOAD_BYTES + 1, 'a'));
        FAIL("expected CodecError");
    } catch (const CodecError& e) {
        CHECK(e.kind() == ErrorKind::Validation);
    }
}

TEST_CASE("end to end through OpenCV with a single symbol") {
    MultiQrCodec codec;
    auto png = codec.encode("hello world", DEFAULT_CHUNK_SIZE, std::string("pw"));

    DecodeResult r = codec.decode(png, std::string("pw"));
    CHECK(r.ok());
    REQUIRE(r.text.has_value());
    CHECK(*r.text == "hello world");
}

TEST_CASE("hello world, chunk 5 through OpenCV: every tile of the labelled grid scans") {
    MultiQrCodec codec;
    auto png = codec.encode("hello world", 5);

    size_t expected_total = (wrap_with_checksum("hello world").size() + 4) / 5;
    cv::Mat image = cv::imdecode(png, cv::IMREAD_COLOR);
    REQUIRE_FALSE(image.empty());
    CHECK(grid_cells(image.size(), expected_total).size() == expected_total);

    DecodeResult r = codec.decode(png);
    CHECK(r.ok());
    REQUIRE(r.text.has_value());
    CHECK(*r.text == "hello world");
    REQUIRE(r.sha256.has_value());
    CHECK(*r.sha256 == sha256_hex("hello world"));
}

TEST_CASE("encrypted multi-symbol round trip through OpenCV") {
    MultiQrCodec codec;
    std::string text = "meet at the north gate, 06:30";
    auto png = codec.encode(text, 40, std::string("correct horse"));

    DecodeResult r = codec.decode(png, std::string("correct horse"));
    CHECK(r.ok());
    REQUIRE(r.text.has_value());
    CHECK(*r.text == text);

    DecodeResult wrong = codec.decode(png, std::string("battery staple"));
    CHECK(wrong.error == ErrorKind::Decryption);
}
