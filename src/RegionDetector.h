#pragma once

#include <opencv2/opencv.hpp>

#include <vector>

namespace SpriteExtractor {

/// 一个前景连通区域（合并前或合并后）。
struct Region {
    cv::Rect bbox;       // 包围盒（图像坐标）
    int pixelCount = 0;  // 前景像素数（合并后为各成员之和）
    cv::Mat pixelMask;   // CV_8UC1，尺寸 = bbox.size()，属于该区域的像素为 255
    int groupId = -1;    // 合并组编号；-1 表示未参与合并
    int fragments = 1;   // 合并进来的原始连通块数量
    int index = -1;      // 过滤后的阅读顺序编号（0..n-1），未排序前为 -1
};

class RegionDetector {
public:
    /// 在二值掩码上做连通域标记，每个极大连通前景块输出一个 Region。
    ///
    /// 输出顺序即 OpenCV 标记顺序（按扫描首次遇到的顺序），稳定、可复现。
    /// 全背景掩码返回空序列：这是正常情况（"no sprites found"），不是错误。
    ///
    /// @param mask         CV_8UC1，非零即前景。
    /// @param connectivity 8（默认）或 4。
    static std::vector<Region> detect(const cv::Mat& mask, int connectivity = 8);

    // 3x3 椭圆核闭运算一次，弥合抗锯齿造成的 1px 断裂。
    static cv::Mat closeGaps(const cv::Mat& mask);
};

} // namespace SpriteExtractor
