#pragma once

#include "codec_config.hpp"
#include <opencv2/core.hpp>
#include <functional>
#include <string>
#include <vector>
#include <cstddef>

using RenderFn = std::function<cv::Mat(const std::string& frame)>;
using LabelFn = std::function<cv::Mat(const cv::Mat& symbol, size_t index, size_t total)>;

// Adds a white strip of height max(min_height, h/6) below the symbol with
// "index+1/total" centred in it. The symbol pixels are left untouched.
cv::Mat add_index_label(const cv::Mat& symbol, size_t index, size_t total,
                        int min_height = DEFAULT_LABEL_MIN_HEIGHT);

// Columns (width) and rows (height) of the grid n images are tiled on.
cv::Size grid_shape(size_t n);

// Cell rectangles, row-major, of a canvas tiled for n images. Empty if the
// canvas is too small to hold that grid.
std::vector<cv::Rect> grid_cells(const cv::Size& canvas, size_t n);

// Grid of ceil(sqrt(n)) columns, cells sized to the largest image,
// row-major, white background. Throws CodecError(Validation) if empty.
cv::Mat tile_images(const std::vector<cv::Mat>& images);

// Renders each frame, labels it (when label_fn is set) and tiles the result.
cv::Mat render_message(const std::vector<std::string>& frames,
                       const RenderFn& render_fn,
                       const LabelFn& label_fn = LabelFn());
