#pragma once

#include "ProcessingConfig.h"

#include <opencv2/opencv.hpp>

#include <vector>

namespace SpriteExtractor {

struct GridCell {
    cv::Rect rect; // 已扣除 padding 的格子区域（图像坐标）
    int row = 0;
    int col = 0;
    int index = 0; // 行优先的阅读顺序编号
};

struct GridParams {
    bool autoDetect = false;
    int rows = 1;
    int cols = 1;
    int padding = 0;
    int lineThreshold = 100;
    double minLineLengthRatio = 0.5;
    int alphaThreshold = 50;

    static GridParams from(const ProcessingConfig& cfg);
};

class GridPartitioner {
public:
    /// 把图像切成行列网格（Region 检测的替代模式）。
    ///
    /// ----------------------------
    /// 原理
    /// ----------------------------
    /// 显式模式：rows x cols 在整张图上均分（边界 = round(i * W / cols)），
    /// 每个格子四边各裁掉 padding 像素。padding 把格子裁空时抛出 `ConfigError`。
    ///
    /// 自动模式分两层证据：
    /// 1) 分隔线（Line Evidence）：Canny 边缘 + 概率 Hough 变换，
    ///    只保留接近水平/竖直、长度 >= minLineLengthRatio * 图像边长的线段；
    ///    lineThreshold 是 Hough 累加器阈值。线段位置做 1D 聚类（粗线会产生两条边缘），
    ///    去掉贴着图像边框的，剩下的就是内部分隔线。
    /// 2) 间隙网格（Gutter Evidence）：没有画出来的分隔线时，退回到前景掩码上的规则网格搜索：
    ///    候选 (rows, cols) 的每条内部分割线都必须能在小范围内找到几乎没有前景的位置，
    ///    并且大多数格子有内容；在合格候选中取线误差最小、格子最多的。
    /// 两者都失败时抛出 `GridDetectionError`（调用方应改用显式 rows/cols）。
    static std::vector<GridCell> partition(const cv::Mat& image, const GridParams& params);

    static std::vector<GridCell> partitionFixed(cv::Size imageSize, int rows, int cols, int padding);

    /// 自动模式。image 为 BGRA（或 1/3 通道）。
    static std::vector<GridCell> detectAuto(const cv::Mat& image, const GridParams& params);

    /// 返回内部分隔线的位置（horizontal=true 时为 y 坐标，否则为 x 坐标），升序。
    static std::vector<int> findSeparatorLines(const cv::Mat& image, bool horizontal, int lineThreshold, double minLineLengthRatio);

    // 去掉 mask 中没有前景像素的格子并重新编号。
    static std::vector<GridCell> dropEmptyCells(const std::vector<GridCell>& cells, const cv::Mat& mask);

private:
    static std::vector<GridCell> cellsFromBoundaries(const std::vector<int>& xs, const std::vector<int>& ys, int padding);
    static bool findGutterLattice(const cv::Mat& mask, int& rows, int& cols);
};

} // namespace SpriteExtractor
