#include "SpriteExporter.h"
#include "Errors.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace SpriteExtractor {

namespace {

static cv::Mat toBgra(const cv::Mat& img) {
    if (img.channels() == 4) return img;
    cv::Mat out;
    if (img.channels() == 3) cv::cvtColor(img, out, cv::COLOR_BGR2BGRA);
    else cv::cvtColor(img, out, cv::COLOR_GRAY2BGRA);
    return out;
}

// floor() that tolerates the representation error in e.g. 40 * (64 / 40.0).
static int scaledLength(int len, double s) {
    return std::max(1, static_cast<int>(std::floor(static_cast<double>(len) * s + 1e-9)));
}

} // namespace

cv::Mat SpriteExporter::fitToCanvas(const cv::Mat& crop, const OutputSize& size, bool allowUpscale) {
    if (crop.empty()) throw ConfigError("cannot export an empty sprite crop");
    if (size.width <= 0 || size.height <= 0) throw ConfigError("output size '" + size.name + "' has no area");
    CV_Assert(crop.depth() == CV_8U);

    const cv::Mat src = toBgra(crop);
    const int w = src.cols;
    const int h = src.rows;

    double s = std::min(static_cast<double>(size.width) / w, static_cast<double>(size.height) / h);
    if (size.maxSide > 0) s = std::min(s, static_cast<double>(size.maxSide) / std::max(w, h));
    if (!allowUpscale) s = std::min(s, 1.0);

    const int newW = std::min(size.width, scaledLength(w, s));
    const int newH = std::min(size.height, scaledLength(h, s));

    cv::Mat resized;
    if (newW == w && newH == h) {
        resized = src;
    } else {
        const int interp = (newW < w || newH < h) ? cv::INTER_AREA : cv::INTER_LINEAR;
        cv::resize(src, resized, cv::Size(newW, newH), 0, 0, interp);
    }

    cv::Mat canvas = cv::Mat::zeros(size.height, size.width, CV_8UC4);
    const int xOff = (size.width - newW) / 2;
    const int yOff = (size.height - newH) / 2;
    resized.copyTo(canvas(cv::Rect(xOff, yOff, newW, newH)));
    return canvas;
}

std::vector<SpriteAsset> SpriteExporter::exportSizes(const cv::Mat& crop, int spriteIndex, const std::vector<OutputSize>& sizes,
                                                     bool allowUpscale) {
    std::vector<SpriteAsset> assets;
    assets.reserve(sizes.size());
    for (const auto& size : sizes) {
        assets.push_back({spriteIndex, size.name, fitToCanvas(crop, size, allowUpscale)});
    }
    return assets;
}

std::vector<SpriteAsset> SpriteExporter::exportAll(const std::vector<cv::Mat>& crops, const std::vector<OutputSize>& sizes,
                                                   bool allowUpscale) {
    for (size_t i = 0; i < crops.size(); ++i) {
        if (crops[i].empty()) throw ConfigError("sprite " + std::to_string(i) + " has an empty crop");
    }
    for (const auto& size : sizes) {
        if (size.width <= 0 || size.height <= 0) throw ConfigError("output size '" + size.name + "' has no area");
    }

    const size_t perSprite = sizes.size();
    std::vector<SpriteAsset> assets(crops.size() * perSprite);
    cv::parallel_for_(cv::Range(0, static_cast<int>(crops.size())), [&](const cv::Range& range) {
        for (int i = range.start; i < range.end; ++i) {
            for (size_t k = 0; k < perSprite; ++k) {
                SpriteAsset& slot = assets[static_cast<size_t>(i) * perSprite + k];
                slot.spriteIndex = i;
                slot.sizeName = sizes[k].name;
                slot.image = fitToCanvas(crops[static_cast<size_t>(i)], sizes[k], allowUpscale);
            }
        }
    });
    return assets;
}

std::string SpriteExporter::spriteName(int index, int total) {
    int digits = 3;
    for (int limit = 1000; total > limit && digits < 9; limit *= 10) digits++;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "sprite_%0*d", digits, index);
    return buf;
}

} // namespace SpriteExtractor
