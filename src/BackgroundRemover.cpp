#include "BackgroundRemover.h"
#include "Errors.h"
#include "ForegroundMask.h"

namespace SpriteExtractor {

cv::Mat FloodFillBackgroundRemover::removeBackground(const cv::Mat& image) {
    if (image.empty()) throw RemovalError("background removal got an empty image");
    if (image.depth() != CV_8U) throw RemovalError("background removal supports 8-bit images only");

    const int channels = image.channels();
    if (channels == 4) return image.clone();
    if (channels != 1 && channels != 3) {
        throw RemovalError("background removal does not support " + std::to_string(channels) + "-channel images");
    }

    const cv::Mat foreground = SpriteMask::makeForegroundMask(image, /*alphaThreshold=*/20, m_floodDiff);

    cv::Mat bgra;
    cv::cvtColor(image, bgra, channels == 3 ? cv::COLOR_BGR2BGRA : cv::COLOR_GRAY2BGRA);
    cv::insertChannel(foreground, bgra, 3);
    return bgra;
}

} // namespace SpriteExtractor
