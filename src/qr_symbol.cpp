#include "qr_symbol.hpp"
#include "codec_error.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>
#include <algorithm>
#include <iostream>

OpenCvQrRenderer::OpenCvQrRenderer(int box_size, int border)
    : box_size_(std::max(1, box_size)), border_(std::max(0, border)) {}

cv::Mat OpenCvQrRenderer::render(const std::string& frame) const {
    if (frame.size() > MAX_QR_PAYLOAD_BYTES)
        throw CodecError(ErrorKind::Validation,
                         "Chunk does not fit in a single QR symbol; lower chunk_size.");

    cv::QRCodeEncoder::Params params;
    params.correction_level = cv::QRCodeEncoder::CORRECT_LEVEL_Q;
    params.mode = cv::QRCodeEncoder::MODE_BYTE;

    cv::Mat modules;
    try {
        cv::Ptr<cv::QRCodeEncoder> encoder = cv::QRCodeEncoder::create(params);
        encoder->encode(frame, modules);
    } catch (const cv::Exception& e) {
        std::cerr << "[RENDERER] QR encode failed: " << e.what() << std::endl;
        throw CodecError(ErrorKind::Validation,
                         "Chunk does not fit in a single QR symbol; lower chunk_size.");
    }
    if (modules.empty())
        throw CodecError(ErrorKind::Validation, "QR encoder produced no symbol.");

    // One pixel per module -> box_size pixels per module, plus quiet zone
    cv::Mat scaled;
    cv::resize(modules, scaled, cv::Size(), box_size_, box_size_, cv::INTER_NEAREST);

    int pad = border_ * box_size_;
    cv::Mat padded;
    cv::copyMakeBorder(scaled, padded, pad, pad, pad, pad, cv::BORDER_CONSTANT, cv::Scalar::all(255));

    cv::Mat bgr;
    if (padded.channels() == 1) {
        cv::cvtColor(padded, bgr, cv::COLOR_GRAY2BGR);
    } else {
        bgr = padded;
    }
    return bgr;
}

// Bounding box of a located symbol, grown by half its size on each side
// so the crop keeps the quiet zone.
static cv::Rect padded_region(const cv::Point2f* corners, const cv::Size& bounds) {
    std::vector<cv::Point2f> quad(corners, corners + 4);
    cv::Rect box = cv::boundingRect(quad);
    int pad_x = box.width / 2;
    int pad_y = box.height / 2;
    cv::Rect grown(box.x - pad_x, box.y - pad_y, box.width + 2 * pad_x, box.height + 2 * pad_y);
    return grown & cv::Rect(0, 0, bounds.width, bounds.height);
}

std::vector<std::string> OpenCvQrScanner::scan(const cv::Mat& image) const {
    std::vector<std::string> decoded;
    if (image.empty()) return decoded;

    cv::QRCodeDetector detector;
    std::vector<std::string> infos;
    cv::Mat points;
    if (detector.detectAndDecodeMulti(image, infos, points)) {
        bool have_corners = points.type() == CV_32FC2 && points.cols == 4 &&
                            points.rows == static_cast<int>(infos.size());
        size_t retried = 0;
        for (size_t i = 0; i < infos.size(); ++i) {
            if (!infos[i].empty()) {
                decoded.push_back(std::move(infos[i]));
                continue;
            }
            if (!have_corners) continue;

            // Located but not decoded: try it alone
            cv::Rect region = padded_region(points.ptr<cv::Point2f>(static_cast<int>(i)), image.size());
            if (region.area() == 0) continue;
            retried++;
            std::string single = detector.detectAndDecode(image(region).clone());
            if (!single.empty()) decoded.push_back(std::move(single));
        }
        if (retried > 0)
            std::cerr << "[SCANNER] Retried " << retried << " undecoded symbol(s) alone" << std::endl;
    }

    // Multi detection can miss a lone symbol
    if (decoded.empty()) {
        std::string single = detector.detectAndDecode(image);
        if (!single.empty()) decoded.push_back(std::move(single));
    }

    std::cerr << "[SCANNER] Decoded " << decoded.size() << " symbol(s)" << std::endl;
    return decoded;
}
