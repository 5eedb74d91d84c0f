#pragma once

#include "codec_config.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

// Turns one frame string into a scannable symbol image (BGR, 8-bit).
class SymbolRenderer {
public:
    virtual ~SymbolRenderer() = default;
    virtual cv::Mat render(const std::string& frame) const = 0;
};

// Returns every string decoded from the image. Order and multiplicity
// are unspecified.
class SymbolScanner {
public:
    virtual ~SymbolScanner() = default;
    virtual std::vector<std::string> scan(const cv::Mat& image) const = 0;
};

// Error correction level Q, byte mode.
class OpenCvQrRenderer : public SymbolRenderer {
public:
    explicit OpenCvQrRenderer(int box_size = DEFAULT_BOX_SIZE, int border = DEFAULT_BORDER);

    // Throws CodecError(Validation) if the frame does not fit in one symbol.
    cv::Mat render(const std::string& frame) const override;

private:
    int box_size_;
    int border_;
};

class OpenCvQrScanner : public SymbolScanner {
public:
    std::vector<std::string> scan(const cv::Mat& image) const override;
};
