#include "tile_layout.hpp"
#include "codec_error.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

static const cv::Scalar WHITE(255, 255, 255);
static const cv::Scalar BLACK(0, 0, 0);

static cv::Mat to_bgr(const cv::Mat& img) {
    if (img.channels() == 3) return img;
    cv::Mat bgr;
    cv::cvtColor(img, bgr, img.channels() == 4 ? cv::COLOR_BGRA2BGR : cv::COLOR_GRAY2BGR);
    return bgr;
}

cv::Mat add_index_label(const cv::Mat& symbol, size_t index, size_t total, int min_height) {
    cv::Mat src = to_bgr(symbol);
    int w = src.cols, h = src.rows;
    int label_height = std::max(min_height, h / 6);

    cv::Mat labeled(h + label_height, w, CV_8UC3, WHITE);
    src.copyTo(labeled(cv::Rect(0, 0, w, h)));

    std::string text = std::to_string(index + 1) + "/" + std::to_string(total);

    const int font = cv::FONT_HERSHEY_SIMPLEX;
    double scale = std::max(0.4, label_height / 48.0);
    int thickness = std::max(1, label_height / 24);
    int baseline = 0;
    cv::Size text_size = cv::getTextSize(text, font, scale, thickness, &baseline);

    // Shrink until it fits the width
    while (text_size.width > w && scale > 0.2) {
        scale *= 0.8;
        text_size = cv::getTextSize(text, font, scale, thickness, &baseline);
    }

    int x = std::max(0, (w - text_size.width) / 2);
    int y = h + (label_height + text_size.height) / 2;
    cv::putText(labeled, text, cv::Point(x, y), font, scale, BLACK, thickness, cv::LINE_AA);

    return labeled;
}

cv::Size grid_shape(size_t n) {
    if (n == 0) return cv::Size(0, 0);
    int cols = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(n))));
    int rows = static_cast<int>((n + cols - 1) / cols);
    return cv::Size(cols, rows);
}

std::vector<cv::Rect> grid_cells(const cv::Size& canvas, size_t n) {
    std::vector<cv::Rect> cells;
    cv::Size shape = grid_shape(n);
    if (shape.area() == 0) return cells;

    int cell_w = canvas.width / shape.width;
    int cell_h = canvas.height / shape.height;
    if (cell_w == 0 || cell_h == 0) return cells;

    cells.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        int r = static_cast<int>(i) / shape.width;
        int c = static_cast<int>(i) % shape.width;
        cells.emplace_back(c * cell_w, r * cell_h, cell_w, cell_h);
    }
    return cells;
}

cv::Mat tile_images(const std::vector<cv::Mat>& images) {
    if (images.empty())
        throw CodecError(ErrorKind::Validation, "No images to tile");

    int max_w = 0, max_h = 0;
    for (const auto& img : images) {
        max_w = std::max(max_w, img.cols);
        max_h = std::max(max_h, img.rows);
    }

    size_t n = images.size();
    cv::Size shape = grid_shape(n);
    int cols = shape.width;

    cv::Mat canvas(shape.height * max_h, cols * max_w, CV_8UC3, WHITE);

    for (size_t i = 0; i < n; ++i) {
        int r = static_cast<int>(i) / cols;
        int c = static_cast<int>(i) % cols;
        cv::Mat tile = to_bgr(images[i]);
        tile.copyTo(canvas(cv::Rect(c * max_w, r * max_h, tile.cols, tile.rows)));
    }

    return canvas;
}

cv::Mat render_message(const std::vector<std::string>& frames,
                       const RenderFn& render_fn,
                       const LabelFn& label_fn) {
    std::vector<cv::Mat> images;
    images.reserve(frames.size());

    for (size_t i = 0; i < frames.size(); ++i) {
        cv::Mat symbol = render_fn(frames[i]);
        if (label_fn) symbol = label_fn(symbol, i, frames.size());
        images.push_back(symbol);
    }

    return tile_images(images);
}
