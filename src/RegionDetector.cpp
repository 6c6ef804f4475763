#include "RegionDetector.h"
#include "Errors.h"

#include <opencv2/core/utils/logger.hpp>

#include <string>

namespace SpriteExtractor {

std::vector<Region> RegionDetector::detect(const cv::Mat& mask, int connectivity) {
    std::vector<Region> regions;
    if (connectivity != 4 && connectivity != 8) {
        throw ConfigError("connectivity must be 4 or 8, got " + std::to_string(connectivity));
    }
    if (mask.empty()) return regions;
    CV_Assert(mask.type() == CV_8UC1);

    cv::Mat labels, stats, centroids;
    const int n = cv::connectedComponentsWithStats(mask, labels, stats, centroids, connectivity, CV_32S);
    if (n <= 1) return regions;

    // OpenCV does not promise that label ids follow raster order, so record the
    // order in which each label is first met while scanning rows top to bottom.
    std::vector<int> scanOrder;
    scanOrder.reserve(static_cast<size_t>(n - 1));
    std::vector<uint8_t> seen(static_cast<size_t>(n), 0);
    for (int y = 0; y < labels.rows && static_cast<int>(scanOrder.size()) < n - 1; ++y) {
        const int* row = labels.ptr<int>(y);
        for (int x = 0; x < labels.cols; ++x) {
            const int label = row[x];
            if (label == 0 || seen[static_cast<size_t>(label)]) continue;
            seen[static_cast<size_t>(label)] = 1;
            scanOrder.push_back(label);
        }
    }

    regions.reserve(scanOrder.size());
    for (const int label : scanOrder) {
        Region r;
        r.bbox = cv::Rect(stats.at<int>(label, cv::CC_STAT_LEFT),
                          stats.at<int>(label, cv::CC_STAT_TOP),
                          stats.at<int>(label, cv::CC_STAT_WIDTH),
                          stats.at<int>(label, cv::CC_STAT_HEIGHT));
        r.pixelCount = stats.at<int>(label, cv::CC_STAT_AREA);
        r.pixelMask = (labels(r.bbox) == label);
        regions.push_back(std::move(r));
    }

    CV_LOG_DEBUG(NULL, "RegionDetector: " << regions.size() << " components (" << connectivity << "-connected)");
    return regions;
}

cv::Mat RegionDetector::closeGaps(const cv::Mat& mask) {
    cv::Mat closed;
    if (mask.empty()) return closed;
    const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(3, 3));
    cv::morphologyEx(mask, closed, cv::MORPH_CLOSE, kernel, cv::Point(-1, -1), 1);
    return closed;
}

} // namespace SpriteExtractor
