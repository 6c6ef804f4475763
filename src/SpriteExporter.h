#pragma once

#include "ProcessingConfig.h"

#include <opencv2/opencv.hpp>

#include <vector>

namespace SpriteExtractor {

struct SpriteAsset {
    int spriteIndex = 0;
    std::string sizeName;
    cv::Mat image; // CV_8UC4, exactly (size.width, size.height)
};

class SpriteExporter {
public:
    /// 把一张裁好的精灵缩放并置中到透明画布上。
    ///
    /// 缩放比例 s = min(W / w, H / h [, maxSide / max(w, h)])，allowUpscale 为 false 时 s <= 1；
    /// 结果尺寸 max(1, floor(w * s)) x max(1, floor(h * s))，放在 ((W - w') / 2, (H - h') / 2)。
    /// 输出尺寸永远严格等于 (size.width, size.height)；只加边，不裁内容。
    /// 同样的输入得到逐字节相同的输出。
    static cv::Mat fitToCanvas(const cv::Mat& crop, const OutputSize& size, bool allowUpscale = false);

    static std::vector<SpriteAsset> exportSizes(const cv::Mat& crop, int spriteIndex, const std::vector<OutputSize>& sizes,
                                                bool allowUpscale = false);

    // 每个精灵 x 每个尺寸。不同精灵之间互不相交，按精灵并行处理；输出按 (精灵, 尺寸) 排序。
    static std::vector<SpriteAsset> exportAll(const std::vector<cv::Mat>& crops, const std::vector<OutputSize>& sizes,
                                              bool allowUpscale = false);

    // "sprite_000"；超过 999 个时自动加位数。
    static std::string spriteName(int index, int total);
};

} // namespace SpriteExtractor
