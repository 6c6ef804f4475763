#pragma once

#include <opencv2/opencv.hpp>

namespace SpriteExtractor::SpriteMask {

constexpr int kMinAlphaThreshold = 1;
constexpr int kMaxAlphaThreshold = 254;

/// 由 alpha 通道生成前景二值掩码（CV_8UC1，像素值为 0 或 255）。
///
/// 不变式：mask[x,y] = 255 当且仅当 alpha[x,y] > alphaThreshold。
///
/// 这是区域检测（`RegionDetector`）与网格间隙检测（`GridPartitioner`）共同的输入。
/// 背景去除协作方保证输出带 alpha，因此这里只接受 4 通道图像。
///
/// @param image          BGRA 图像（CV_8UC4）。
/// @param alphaThreshold 截止值，合法范围 1..254；越界抛出 `ConfigError`。
cv::Mat buildAlphaMask(const cv::Mat& image, int alphaThreshold);

/// 对没有 alpha 的图像估计前景（CV_8UC1，0/255）。
///
/// 从四个角点对背景做 flood-fill（假设背景与图像边界连通且相对均匀），再取反得到前景。
/// 若图像带 alpha（4 通道），直接退化为 `buildAlphaMask(image, alphaThreshold)`。
///
/// @param image          输入图像（CV_8U，1/3/4 通道均可）。
/// @param alphaThreshold 有 alpha 时使用的阈值。
/// @param floodDiff      flood-fill 的容差（每通道允许的强度差）。
cv::Mat makeForegroundMask(const cv::Mat& image, int alphaThreshold = 20, int floodDiff = 5);

} // namespace SpriteExtractor::SpriteMask
