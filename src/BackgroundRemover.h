#pragma once

#include <opencv2/opencv.hpp>

namespace SpriteExtractor {

/// 背景去除协作方：输入任意图像，输出带 alpha 的 BGRA（CV_8UC4）图像。
/// 不支持的输入抛出 `RemovalError`（被视为瞬时错误，任务会重试一次）。
/// 实现必须可被多个 worker 线程同时调用。
class BackgroundRemover {
public:
    virtual ~BackgroundRemover() = default;

    virtual cv::Mat removeBackground(const cv::Mat& image) = 0;
};

/// 内置实现：已有 alpha 的图像原样返回；否则从四个角点 flood-fill 背景，
/// 背景 alpha = 0，其余 alpha = 255。适用于背景均匀且与边界连通的图。
class FloodFillBackgroundRemover : public BackgroundRemover {
public:
    explicit FloodFillBackgroundRemover(int floodDiff = 5) : m_floodDiff(floodDiff) {}

    cv::Mat removeBackground(const cv::Mat& image) override;

private:
    int m_floodDiff;
};

} // namespace SpriteExtractor
