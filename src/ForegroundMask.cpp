#include "ForegroundMask.h"
#include "Errors.h"

#include <string>
#include <vector>

namespace SpriteExtractor::SpriteMask {

cv::Mat buildAlphaMask(const cv::Mat& image, int alphaThreshold) {
    if (alphaThreshold < kMinAlphaThreshold || alphaThreshold > kMaxAlphaThreshold) {
        throw ConfigError("alpha_threshold must be in [1, 254], got " + std::to_string(alphaThreshold));
    }
    if (image.empty() || image.channels() != 4 || image.depth() != CV_8U) {
        throw ConfigError("alpha mask requires a non-empty 8-bit BGRA image");
    }

    cv::Mat alpha;
    cv::extractChannel(image, alpha, 3);
    cv::Mat mask;
    cv::threshold(alpha, mask, alphaThreshold, 255, cv::THRESH_BINARY);
    return mask;
}

cv::Mat makeForegroundMask(const cv::Mat& image, int alphaThreshold, int floodDiff) {
    cv::Mat mask;
    if (image.empty()) return mask;

    if (image.channels() == 4) {
        return buildAlphaMask(image, alphaThreshold);
    }

    // Flood-fill background from corners, then invert to get foreground.
    cv::Mat working = image.clone();
    cv::Mat floodMask = cv::Mat::zeros(image.rows + 2, image.cols + 2, CV_8UC1);

    const cv::Scalar diff = (image.channels() == 1) ? cv::Scalar(floodDiff) : cv::Scalar(floodDiff, floodDiff, floodDiff);
    const int flags = 4 + (255 << 8) + cv::FLOODFILL_MASK_ONLY;

    const std::vector<cv::Point> seeds = {
        {0, 0},
        {image.cols - 1, 0},
        {0, image.rows - 1},
        {image.cols - 1, image.rows - 1},
    };

    for (const auto& seed : seeds) {
        if (floodMask.at<uchar>(seed.y + 1, seed.x + 1) == 0) {
            cv::floodFill(working, floodMask, seed, cv::Scalar(), nullptr, diff, diff, flags);
        }
    }

    cv::Mat roi = floodMask(cv::Rect(1, 1, image.cols, image.rows));
    cv::bitwise_not(roi, mask);
    return mask;
}

} // namespace SpriteExtractor::SpriteMask
