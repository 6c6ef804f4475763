#pragma once

#include "ProcessingConfig.h"
#include "RegionDetector.h"

#include <opencv2/opencv.hpp>

#include <vector>

namespace SpriteExtractor {

/// 并查集（路径压缩；合并时编号较小的根胜出，保证合并顺序确定）。
class DisjointSet {
public:
    explicit DisjointSet(size_t n);

    size_t find(size_t x);
    bool unite(size_t a, size_t b); // true if two different sets were joined

private:
    std::vector<size_t> m_parent;
};

struct MergeFilterParams {
    double distanceThreshold = 80.0;
    GapMetric gapMetric = GapMetric::EdgeToEdge;
    double sizeRatioThreshold = 0.4;
    double minAreaRatio = 0.0005;
    double maxAreaRatio = 0.25;
    double maxAspectRatio = 20.0; // <= 0 disables the aspect filter

    static MergeFilterParams from(const ProcessingConfig& cfg);
};

class RegionMerger {
public:
    /// 把检测出的碎片合并、过滤，得到最终的精灵区域。
    ///
    /// ----------------------------
    /// 原理
    /// ----------------------------
    /// 生成式模型/抠图输出的精灵常被切成几块：阴影、抗锯齿描边、与主体分离的文字。
    /// 因此流程是：
    /// ```
    /// merged   = merge(regions, distanceThreshold)          // 包围盒间距 <= 阈值即合并，直到不再有可合并的对
    /// kept     = filterByArea(merged, minAreaRatio, maxAreaRatio)   // 像素面积/整图面积，闭区间
    /// kept     = filterByAspect(kept, maxAspectRatio)      // 细长条（分隔线、噪声）
    /// kept     = filterBySizeRatio(kept, sizeRatioThreshold)// 远小于主体的残片
    /// assignReadingOrder(kept)                              // 从上到下、从左到右编号 0..n-1
    /// ```
    /// 没有区域保留下来是合法的零结果，不抛异常（由调用方决定如何上报）。
    static std::vector<Region> mergeAndFilter(const std::vector<Region>& regions, cv::Size imageSize, const MergeFilterParams& params);

    // 两个包围盒之间的距离：EdgeToEdge 为边到边的欧氏间隙（相交/相接为 0），Centroid 为中心距。
    static double boxGap(const cv::Rect& a, const cv::Rect& b, GapMetric metric);

    // 反复以并查集合并间距 <= distanceThreshold 的区域，直到没有可合并的对。幂等。
    static std::vector<Region> merge(const std::vector<Region>& regions, double distanceThreshold, GapMetric metric);

    static std::vector<Region> filterByArea(std::vector<Region> regions, cv::Size imageSize, double minAreaRatio, double maxAreaRatio);
    static std::vector<Region> filterByAspect(std::vector<Region> regions, double maxAspectRatio);
    static std::vector<Region> filterBySizeRatio(std::vector<Region> regions, double sizeRatioThreshold);

    // 排序并写入 Region::index。
    static void assignReadingOrder(std::vector<Region>& regions);

private:
    static Region combine(const std::vector<const Region*>& members);
};

} // namespace SpriteExtractor
